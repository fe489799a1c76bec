#include <rail-planner/FileDownloader.h>

#include <nlohmann/json.hpp>

#include <curl/curl.h>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

bool RailPlanner::DownloadFile(
    const std::string& fileUrl,
    const std::filesystem::path& destination,
    const std::filesystem::path& caCertFile
)
{
    // Initalize curl.
    CURL* curl {curl_easy_init()};
    if (curl == nullptr) {
        spdlog::error("DownloadFile: Could not initialize curl");
        return false;
    }

    // Open the file.
    std::FILE* fp {std::fopen(destination.string().c_str(), "wb")};
    if (fp == nullptr) {
        // Remember to clean up in all program paths.
        curl_easy_cleanup(curl);
        spdlog::error("DownloadFile: Could not open {}", destination.string());
        return false;
    }

    // Configure curl.
    curl_easy_setopt(curl, CURLOPT_URL, fileUrl.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if (!caCertFile.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, caCertFile.string().c_str());
    }
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);

    // Perform the request.
    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    // Close the file.
    std::fclose(fp);

    if (res != CURLE_OK) {
        spdlog::error("DownloadFile: {}: {}", fileUrl,
                      curl_easy_strerror(res));
        return false;
    }
    spdlog::info("DownloadFile: {} -> {}", fileUrl, destination.string());
    return true;
}

nlohmann::json RailPlanner::ParseJsonFile(
    const std::filesystem::path& source
)
{
    nlohmann::json parsed {};
    if (!std::filesystem::exists(source)) {
        spdlog::warn("ParseJsonFile: {} does not exist", source.string());
        return parsed;
    }
    try {
        std::ifstream file {source};
        file >> parsed;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("ParseJsonFile: {}: {}", source.string(), e.what());
        parsed = nlohmann::json {};
    }
    return parsed;
}
