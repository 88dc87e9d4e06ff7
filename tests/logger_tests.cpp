#include "gtest/gtest.h"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

// Helper function to read file contents
static std::string readFileContents(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs)
        return "";
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

static std::vector<std::string> readLines(const std::string& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);)
        if (!line.empty())
            lines.push_back(line);
    return lines;
}

class LoggerTest : public ::testing::Test {
protected:
    std::vector<std::string> files_to_remove_;

    void TearDown() override {
        // Point the singleton back at the suite log so later tests keep logging.
        Logger::init(chunkkeeper::currentVarLayout().logsDir + "/chunkkeeper_tests.log", LogLevel::DEBUG);
        for (const auto& file : files_to_remove_)
            std::remove(file.c_str());
        files_to_remove_.clear();
    }

    std::string testFile(const std::string& name) {
        std::string path = chunkkeeper::currentVarLayout().logsDir + "/" + name;
        std::remove(path.c_str());
        files_to_remove_.push_back(path);
        return path;
    }
};

TEST_F(LoggerTest, LogLevelFiltering) {
    const std::string file = testFile("level_filter.log");
    ASSERT_NO_THROW(Logger::init(file, LogLevel::INFO));
    Logger& logger = Logger::getInstance();

    logger.log(LogLevel::TRACE, "[GC] trace detail");
    logger.log(LogLevel::DEBUG, "[GC] deleted chunk");
    logger.log(LogLevel::INFO, "[GC] run started");
    logger.log(LogLevel::WARN, "[Lease] superseding expired lease");
    logger.log(LogLevel::ERROR, "[GC] storage failure");

    std::string contents = readFileContents(file);
    EXPECT_EQ(contents.find("trace detail"), std::string::npos);
    EXPECT_EQ(contents.find("deleted chunk"), std::string::npos);
    EXPECT_NE(contents.find("run started"), std::string::npos);
    EXPECT_NE(contents.find("superseding expired lease"), std::string::npos);
    EXPECT_NE(contents.find("storage failure"), std::string::npos);
}

TEST_F(LoggerTest, EachRecordIsOneJsonObject) {
    const std::string file = testFile("json_format.log");
    ASSERT_NO_THROW(Logger::init(file, LogLevel::DEBUG));
    const std::string message = "chunk \"ab\" at C:\\objects\tpath";
    Logger::getInstance().log(LogLevel::WARN, message);
    Logger::getInstance().log(LogLevel::INFO, "second record");

    auto lines = readLines(file);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].front(), '{');
    EXPECT_EQ(lines[0].back(), '}');

    YAML::Node record = YAML::Load(lines[0]);
    ASSERT_TRUE(record.IsMap());
    EXPECT_EQ(record["level"].as<std::string>(), "WARN");
    EXPECT_EQ(record["message"].as<std::string>(), message);
    EXPECT_FALSE(record["timestamp"].as<std::string>().empty());
}

TEST_F(LoggerTest, RotationKeepsConfiguredBackups) {
    const std::string base = testFile("rotation.log");
    for (int i = 1; i <= 3; ++i)
        testFile("rotation.log." + std::to_string(i));

    ASSERT_NO_THROW(Logger::init(base, LogLevel::DEBUG, 1024, 2));
    std::string payload(800, 'x');
    for (int i = 0; i < 6; ++i)
        Logger::getInstance().log(LogLevel::INFO, payload + " #" + std::to_string(i));
    // Re-initialising flushes and closes the current file.
    Logger::init(testFile("rotation_flush.log"), LogLevel::DEBUG);

    EXPECT_TRUE(std::ifstream(base).good());
    EXPECT_TRUE(std::ifstream(base + ".1").good());
    EXPECT_TRUE(std::ifstream(base + ".2").good());
    EXPECT_FALSE(std::ifstream(base + ".3").good());
}

TEST_F(LoggerTest, RotationWithoutBackupsTruncates) {
    const std::string base = testFile("no_backup.log");
    testFile("no_backup.log.1");

    ASSERT_NO_THROW(Logger::init(base, LogLevel::DEBUG, 512, 0));
    std::string payload(300, 'y');
    for (int i = 0; i < 5; ++i)
        Logger::getInstance().log(LogLevel::INFO, payload);
    Logger::init(testFile("no_backup_flush.log"), LogLevel::DEBUG);

    EXPECT_TRUE(std::ifstream(base).good());
    EXPECT_FALSE(std::ifstream(base + ".1").good());
}

TEST_F(LoggerTest, ReinitializationSwitchesFiles) {
    const std::string first = testFile("reinit1.log");
    const std::string second = testFile("reinit2.log");

    Logger::init(first, LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "for the first file");
    Logger::init(second, LogLevel::WARN);
    Logger::getInstance().log(LogLevel::WARN, "for the second file");
    Logger::getInstance().log(LogLevel::INFO, "filtered out");

    std::string one = readFileContents(first);
    std::string two = readFileContents(second);
    EXPECT_NE(one.find("for the first file"), std::string::npos);
    EXPECT_EQ(one.find("for the second file"), std::string::npos);
    EXPECT_NE(two.find("for the second file"), std::string::npos);
    EXPECT_EQ(two.find("filtered out"), std::string::npos);
}

TEST(LoggerLevels, ParsesConfigNames) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("WARNING"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("fatal"), LogLevel::FATAL);
    // Unknown names fall back to the default level.
    EXPECT_EQ(Logger::levelFromString("chatty"), LogLevel::INFO);
}
