// Copyright (c) 2025 The Canary Core developers
// Distributed under the MIT software license

/**
 * Main test entry point for the Canary test suite.
 *
 * Initializes the Boost Unit Test Framework for all suites.
 */

#define BOOST_TEST_MODULE Canary Test Suite
#include <boost/test/included/unit_test.hpp>

#include <util/logging.h>

#include <iostream>

/**
 * Global test suite setup
 */
struct CanaryTestSetup {
    CanaryTestSetup() {
        std::cout << "Canary Test Suite Starting..." << std::endl;
        std::cout << "Using Boost.Test version "
                  << BOOST_VERSION / 100000 << "."
                  << BOOST_VERSION / 100 % 1000 << "."
                  << BOOST_VERSION % 100 << std::endl;

        // Failure paths log at ERROR; keep test output readable
        CLoggingConfig::GetInstance().SetConsoleLogging(false);
        CLoggingConfig::GetInstance().SetLogFile("");
    }

    ~CanaryTestSetup() {
        std::cout << "Canary Test Suite Complete" << std::endl;
    }
};

BOOST_GLOBAL_FIXTURE(CanaryTestSetup);
