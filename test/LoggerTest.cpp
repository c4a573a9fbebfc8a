#include "BaseTestFixture.h"

#include <regex>

class LoggerTest : public BaseTestFixture {
protected:
    std::vector<std::string> readLines(const fs::path& path) {
        std::ifstream file(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }
};

TEST_F(LoggerTest, WritesFormattedLinesToFile) {
    const fs::path logPath = tempDir / "logs" / "app.log";
    Logger log(Logger::Level::Info, false);
    ASSERT_TRUE(log.openFile(logPath));
    EXPECT_EQ(log.filePath(), logPath);

    log.info("Successfully converted a.png to b.jpg");
    log.error("Error converting c.png (DecodeError): broken");
    log.closeFile();

    const auto lines = readLines(logPath);
    ASSERT_EQ(lines.size(), 2u);
    const std::regex pattern(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - (INFO|ERROR) - .+$)");
    for (const auto& line : lines) {
        EXPECT_TRUE(std::regex_match(line, pattern)) << line;
    }
    EXPECT_NE(lines[0].find(" - INFO - Successfully converted a.png to b.jpg"), std::string::npos);
    EXPECT_NE(lines[1].find(" - ERROR - Error converting c.png (DecodeError): broken"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossSessions) {
    const fs::path logPath = tempDir / "app.log";
    {
        Logger first(Logger::Level::Info, false);
        ASSERT_TRUE(first.openFile(logPath));
        first.info("one");
    }
    {
        Logger second(Logger::Level::Info, false);
        ASSERT_TRUE(second.openFile(logPath));
        second.info("two");
    }
    EXPECT_EQ(readLines(logPath).size(), 2u);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    const fs::path logPath = tempDir / "filtered.log";
    Logger log(Logger::Level::Warning, false);
    ASSERT_TRUE(log.openFile(logPath));
    log.debug("hidden");
    log.info("hidden");
    log.warning("shown");
    EXPECT_EQ(readLines(logPath).size(), 1u);

    log.setLevel(Logger::Level::Debug);
    EXPECT_EQ(log.level(), Logger::Level::Debug);
    log.debug("now shown");
    EXPECT_EQ(readLines(logPath).size(), 2u);
}

TEST_F(LoggerTest, ListenerReceivesEveryLine) {
    Logger log(Logger::Level::Info, false);
    std::vector<std::pair<Logger::Level, std::string>> seen;
    log.setListener([&seen](Logger::Level level, const std::string& line) {
        seen.emplace_back(level, line);
    });

    log.info("hello");
    log.warning("careful");
    log.debug("filtered");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, Logger::Level::Info);
    EXPECT_NE(seen[0].second.find(" - INFO - hello"), std::string::npos);
    EXPECT_EQ(seen[1].first, Logger::Level::Warning);

    log.setListener(nullptr);
    log.info("after");
    EXPECT_EQ(seen.size(), 2u);
}

TEST_F(LoggerTest, OpenFileFailsForUnwritablePath) {
    touch(tempDir / "blocker");
    Logger log(Logger::Level::Info, false);
    EXPECT_FALSE(log.openFile(tempDir / "blocker" / "app.log"));
    EXPECT_TRUE(log.filePath().empty());
    // Still usable
    log.info("console only");
}

TEST(LoggerLevelTest, LevelNames) {
    EXPECT_STREQ(Logger::levelName(Logger::Level::Debug), "DEBUG");
    EXPECT_STREQ(Logger::levelName(Logger::Level::Info), "INFO");
    EXPECT_STREQ(Logger::levelName(Logger::Level::Warning), "WARNING");
    EXPECT_STREQ(Logger::levelName(Logger::Level::Error), "ERROR");
}
