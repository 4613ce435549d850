#include <gtest/gtest.h>
#include "common/logger.hpp"
#include <filesystem>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    Logger::initialize((std::filesystem::temp_directory_path() / "hostkeeper-tests.log").string(),
                       LogLevel::DEBUG);
    int result = RUN_ALL_TESTS();
    Logger::shutdown();
    return result;
}
