#define BOOST_TEST_MODULE rail-planner

#include <boost/test/unit_test.hpp>
