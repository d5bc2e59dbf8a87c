#include <gtest/gtest.h>
#include "compose_track.hpp"
#include "utils/test_utils.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

class DiagnosticLoggerTest : public ::testing::Test {
protected:
    void TearDown() override { ctrack::Log::shutdown(); }

    std::shared_ptr<ctrack::Logger> recordingLogger(ctrack::LogLevel level) {
        auto logger = std::make_shared<ctrack::Logger>(level, false);
        logger->addSink<ctrack::CallbackSink>(ctrack::CallbackSink::EntryCallback(
            [this](const ctrack::LogEntry& e) { entries_.push_back(e); }));
        return logger;
    }

    std::vector<ctrack::LogEntry> entries_;
};

TEST_F(DiagnosticLoggerTest, FormatMessagePositional) {
    EXPECT_EQ(ctrack::Logger::formatMessage("sent {command} to {socket}", "up", "/tmp/s.sock"),
              "sent up to /tmp/s.sock");
    EXPECT_EQ(ctrack::Logger::formatMessage("{count} service(s)", 3), "3 service(s)");
}

TEST_F(DiagnosticLoggerTest, FormatMessageEscapesAndMissingValues) {
    EXPECT_EQ(ctrack::Logger::formatMessage("{{literal}} {a}", "x"), "{literal} x");
    EXPECT_EQ(ctrack::Logger::formatMessage("{a} {b}", "x"), "x {b}");
    EXPECT_EQ(ctrack::Logger::formatMessage("no placeholders"), "no placeholders");
}

TEST_F(DiagnosticLoggerTest, MinimumLevelFilters) {
    auto logger = recordingLogger(ctrack::LogLevel::WARN);
    logger->debug("hidden");
    logger->info("hidden too");
    logger->warn("shown {n}", 1);
    logger->error("shown {n}", 2);

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, ctrack::LogLevel::WARN);
    EXPECT_EQ(entries_[0].message, "shown 1");
    EXPECT_EQ(entries_[1].level, ctrack::LogLevel::ERROR);

    logger->setMinLevel(ctrack::LogLevel::TRACE);
    EXPECT_EQ(logger->getMinLevel(), ctrack::LogLevel::TRACE);
    logger->trace("now visible");
    EXPECT_EQ(entries_.size(), 3u);
}

TEST_F(DiagnosticLoggerTest, EntryCarriesTemplateAndArguments) {
    auto logger = recordingLogger(ctrack::LogLevel::INFO);
    logger->info("tracked {command} in {context}", "compose up", "default");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].templateStr, "tracked {command} in {context}");
    ASSERT_EQ(entries_[0].arguments.size(), 2u);
    EXPECT_EQ(entries_[0].arguments[0].first, "command");
    EXPECT_EQ(entries_[0].arguments[0].second, "compose up");
    EXPECT_EQ(entries_[0].arguments[1].first, "context");
    EXPECT_EQ(entries_[0].arguments[1].second, "default");
}

TEST_F(DiagnosticLoggerTest, ArgumentNamesSkipEscapesAndAnonymousPlaceholders) {
    auto logger = recordingLogger(ctrack::LogLevel::INFO);
    logger->info("{{literal}} {} then {name}", "first", "second");

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "{literal} first then second");
    ASSERT_EQ(entries_[0].arguments.size(), 1u);
    EXPECT_EQ(entries_[0].arguments[0].first, "name");
    EXPECT_EQ(entries_[0].arguments[0].second, "second");
}

TEST_F(DiagnosticLoggerTest, HumanReadableFormatterOutput) {
    std::ostringstream out;
    ctrack::Logger logger(ctrack::LogLevel::INFO, false);
    auto sink = ctrack::detail::make_unique<ctrack::ConsoleSink>();
    sink->setTransport(ctrack::detail::make_unique<ctrack::OStreamTransport>(out));
    logger.addCustomSink(std::move(sink));
    logger.info("hello {who}", "world");

    EXPECT_NE(out.str().find("[INFO] hello world\n"), std::string::npos);
}

TEST_F(DiagnosticLoggerTest, ConsoleTransportStream) {
    EXPECT_EQ(ctrack::ConsoleTransport().stream(), ctrack::ConsoleStream::StdOut);
    EXPECT_EQ(ctrack::ConsoleTransport(ctrack::ConsoleStream::StdErr).stream(), ctrack::ConsoleStream::StdErr);
}

TEST_F(DiagnosticLoggerTest, FacadeIsSilentUntilInitialized) {
    EXPECT_FALSE(ctrack::Log::isInitialized());
    EXPECT_NO_THROW(ctrack::Log::info("dropped"));
    EXPECT_EQ(ctrack::Log::current(), nullptr);

    auto logger = recordingLogger(ctrack::LogLevel::DEBUG);
    ctrack::Log::init(logger);
    EXPECT_TRUE(ctrack::Log::isInitialized());
    EXPECT_EQ(ctrack::Log::current(), logger);
    ctrack::Log::debug("kept {n}", 7);
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept 7");

    ctrack::Log::shutdown();
    EXPECT_FALSE(ctrack::Log::isInitialized());
    ctrack::Log::error("dropped again");
    EXPECT_EQ(entries_.size(), 1u);
}

TEST_F(DiagnosticLoggerTest, TrackerLogsSkipForBackend) {
    ctrack::Log::init(recordingLogger(ctrack::LogLevel::TRACE));
    auto client = std::make_shared<RecordingClient>();
    ctrack::Tracker tracker(std::make_shared<ctrack::CommandClassifier>(ctrack::CommandSet::defaults()),
                            client, "docker-compose-backend");
    tracker.track("default", {"compose", "up"}, ctrack::status::Success);

    EXPECT_TRUE(client->sent().empty());
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, ctrack::LogLevel::TRACE);
}

TEST(LogLevelTest, LevelStrings) {
    EXPECT_STREQ(ctrack::getLevelString(ctrack::LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(ctrack::getLevelString(ctrack::LogLevel::WARN), "WARN");
    EXPECT_STREQ(ctrack::getLevelString(ctrack::LogLevel::FATAL), "FATAL");
    EXPECT_STREQ(ctrack::getLevelString(static_cast<ctrack::LogLevel>(42)), "UNKNOWN");
}
