#include <bubblepie/logger.hpp>
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace bubblepie;

namespace
{

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        entries_ = std::make_shared<std::vector<Logger::LogEntry>>();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::memory_sink(entries_));
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }

    std::shared_ptr<std::vector<Logger::LogEntry>> entries_;
};

}   // namespace

TEST_F(LoggerTest, LevelFiltering)
{
    Logger::instance().set_level(LogLevel::Warning);

    BUBBLEPIE_LOG_DEBUG("test", "hidden");
    BUBBLEPIE_LOG_INFO("test", "hidden");
    BUBBLEPIE_LOG_WARN("test", "shown");
    BUBBLEPIE_LOG_ERROR("test", "shown");

    ASSERT_EQ(entries_->size(), 2u);
    EXPECT_EQ((*entries_)[0].level, LogLevel::Warning);
    EXPECT_EQ((*entries_)[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, CategoryAndMessage)
{
    Logger::instance().set_level(LogLevel::Trace);
    BUBBLEPIE_LOG_TRACE("limits", "solved");

    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ((*entries_)[0].category, "limits");
    EXPECT_EQ((*entries_)[0].message, "solved");
}

TEST_F(LoggerTest, PlaceholderFormatting)
{
    Logger::instance().set_level(LogLevel::Info);
    BUBBLEPIE_LOG_INFO("test", "{} pies, {} px, visible={}", 3, 12.5, true);

    ASSERT_EQ(entries_->size(), 1u);
    EXPECT_EQ((*entries_)[0].message, "3 pies, 12.5 px, visible=true");
}

TEST(LoggerFormat, ArgumentContainingPlaceholderNotReexpanded)
{
    EXPECT_EQ(Logger::format_message("{} and {}", std::string("{}"), 7), "{} and 7");
}

TEST(LoggerFormat, SurplusPlaceholdersKept)
{
    EXPECT_EQ(Logger::format_message("a={} b={}", 1), "a=1 b={}");
}

TEST(LoggerFormat, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST_F(LoggerTest, FileSinkAppends)
{
    std::string path = ::testing::TempDir() + "bubblepie_logger_test.log";
    std::remove(path.c_str());

    Logger::instance().set_level(LogLevel::Info);
    Logger::instance().add_sink(sinks::file_sink(path));
    BUBBLEPIE_LOG_INFO("svg", "wrote {}", std::string("out.svg"));
    Logger::instance().clear_sinks();

    std::ifstream in(path);
    std::string   line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("INFO [svg] wrote out.svg"), std::string::npos);
    std::remove(path.c_str());
}
