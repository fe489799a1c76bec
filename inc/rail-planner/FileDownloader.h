#ifndef RAIL_PLANNER_FILE_DOWNLOADER_H
#define RAIL_PLANNER_FILE_DOWNLOADER_H

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace RailPlanner {

/*! \brief Download a network layout file from a remote HTTPS URL.
 *
 *  \param destination The full path and filename of the output file. The path
 *                     to the file must exist.
 *  \param caCertFile  The path to a cacert.pem file to perform certificate
 *                     verification in an HTTPS connection.
 *
 *  \returns false if the file could not be created or the transfer failed.
 */
bool DownloadFile(
    const std::string& fileUrl,
    const std::filesystem::path& destination,
    const std::filesystem::path& caCertFile = {}
);

/*! \brief Parse a local file into a JSON object.
 *
 *  \param source The path to the JSON file to load and parse.
 *
 *  \returns A null JSON object if the file does not exist or is not valid
 *           JSON.
 */
nlohmann::json ParseJsonFile(
    const std::filesystem::path& source
);

} // namespace RailPlanner

#endif // RAIL_PLANNER_FILE_DOWNLOADER_H
