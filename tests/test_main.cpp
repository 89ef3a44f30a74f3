/**
 * @file test_main.cpp
 * @brief Main entry point for Catch2 unit tests
 *
 * Log output below warnings is suppressed so the test report stays readable.
 * Run with: ./cdjmeta_tests or ctest
 */

#include <catch2/catch_session.hpp>

#include <cdjmeta/Log.hpp>

int main(int argc, char* argv[]) {
    cdjmeta::Log::setLevel(cdjmeta::LogLevel::Warning);
    return Catch::Session().run(argc, argv);
}
