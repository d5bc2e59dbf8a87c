#include <gtest/gtest.h>
#include "compose_track.hpp"
#include "utils/test_utils.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdlib>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class UsageClientTest : public ::testing::Test {
protected:
    void TearDown() override { ctrack::Log::shutdown(); }
};

// Transport that blocks in post() until released.
class GateTransport : public ctrack::IUsageTransport {
public:
    GateTransport() : m_open(false), m_calls(0) {}

    bool post(const std::string&) override {
        m_calls.fetch_add(1);
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_open; });
        return true;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }

    int calls() const { return m_calls.load(); }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open;
    std::atomic<int> m_calls;
};

class ThrowingTransport : public ctrack::IUsageTransport {
public:
    bool post(const std::string&) override {
        throw std::runtime_error("connection reset");
    }
};

TEST_F(UsageClientTest, SerializesRecordAsJson) {
    auto transport = std::make_shared<RecordingTransport>();
    ctrack::UsageClient client(transport);

    client.send(ctrack::Command("compose up", "default", ctrack::Source::CLI, ctrack::status::Success));
    ASSERT_TRUE(transport->waitForCount(1));

    auto j = nlohmann::json::parse(transport->bodies()[0]);
    EXPECT_EQ(j["command"], "compose up");
    EXPECT_EQ(j["context"], "default");
    EXPECT_EQ(j["source"], "cli");
    EXPECT_EQ(j["status"], "success");
}

TEST_F(UsageClientTest, SendDoesNotWaitForDelivery) {
    auto transport = std::make_shared<GateTransport>();
    ctrack::UsageClient client(transport);

    auto start = std::chrono::steady_clock::now();
    client.send(ctrack::Command("ps", "default", ctrack::Source::CLI, ctrack::status::Success));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 500);
    EXPECT_TRUE(TestUtils::waitUntil([&] { return transport->calls() == 1; }));
    transport->open();
}

TEST_F(UsageClientTest, TransportOutlivesClient) {
    auto transport = std::make_shared<RecordingTransport>();
    {
        ctrack::UsageClient client(transport);
        client.send(ctrack::Command("down", "default", ctrack::Source::CLI, ctrack::status::Success));
    }
    EXPECT_TRUE(transport->waitForCount(1));
}

TEST_F(UsageClientTest, TransportExceptionIsContainedAndLogged) {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::string> messages;

    auto logger = std::make_shared<ctrack::Logger>(ctrack::LogLevel::TRACE, false);
    logger->addSink<ctrack::CallbackSink>(ctrack::CallbackSink::EntryCallback(
        [&](const ctrack::LogEntry& e) {
            {
                std::lock_guard<std::mutex> lock(mtx);
                messages.push_back(e.message);
            }
            cv.notify_all();
        }));
    ctrack::Log::init(logger);

    ctrack::UsageClient client(std::make_shared<ThrowingTransport>());
    EXPECT_NO_THROW(client.send(ctrack::Command("up", "default", ctrack::Source::CLI, ctrack::status::Success)));

    std::unique_lock<std::mutex> lock(mtx);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&] { return !messages.empty(); }));
    EXPECT_NE(messages[0].find("connection reset"), std::string::npos);
    EXPECT_NE(messages[0].find("up"), std::string::npos);
}

TEST_F(UsageClientTest, RejectedRecordIsLoggedAtDebug) {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<ctrack::LogLevel> levels;

    auto logger = std::make_shared<ctrack::Logger>(ctrack::LogLevel::TRACE, false);
    logger->addSink<ctrack::CallbackSink>(ctrack::CallbackSink::EntryCallback(
        [&](const ctrack::LogEntry& e) {
            {
                std::lock_guard<std::mutex> lock(mtx);
                levels.push_back(e.level);
            }
            cv.notify_all();
        }));
    ctrack::Log::init(logger);

    auto transport = std::make_shared<RecordingTransport>(false);
    ctrack::UsageClient client(transport);
    client.send(ctrack::Command("ls", "default", ctrack::Source::CLI, ctrack::status::Success));

    std::unique_lock<std::mutex> lock(mtx);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&] { return !levels.empty(); }));
    EXPECT_EQ(levels[0], ctrack::LogLevel::DEBUG);
}

TEST_F(UsageClientTest, WorkerKeepsLoggerCapturedAtSend) {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::string> messages;

    auto logger = std::make_shared<ctrack::Logger>(ctrack::LogLevel::TRACE, false);
    logger->addSink<ctrack::CallbackSink>(ctrack::CallbackSink::EntryCallback(
        [&](const ctrack::LogEntry& e) {
            {
                std::lock_guard<std::mutex> lock(mtx);
                messages.push_back(e.message);
            }
            cv.notify_all();
        }));
    ctrack::Log::init(logger);
    std::weak_ptr<ctrack::Logger> weak = logger;
    logger.reset();

    auto transport = std::make_shared<GateTransport>();
    ctrack::UsageClient client(transport);
    client.send(ctrack::Command("up", "default", ctrack::Source::CLI, ctrack::status::Success));
    ASSERT_TRUE(TestUtils::waitUntil([&] { return transport->calls() == 1; }));

    // The facade drops its reference while the post is in flight.
    ctrack::Log::shutdown();
    EXPECT_FALSE(weak.expired());
    transport->open();

    std::unique_lock<std::mutex> lock(mtx);
    ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&] { return !messages.empty(); }));
    EXPECT_EQ(messages[0], "usage record for up delivered");
}

TEST_F(UsageClientTest, NoLoggerMeansSilentDelivery) {
    auto transport = std::make_shared<RecordingTransport>(false);
    ctrack::UsageClient client(transport);
    client.send(ctrack::Command("ps", "default", ctrack::Source::CLI, ctrack::status::Failure));
    EXPECT_TRUE(transport->waitForCount(1));
}

// Transport slower than the caller: main() returns while it is posting.
class SlowRejectingTransport : public ctrack::IUsageTransport {
public:
    bool post(const std::string&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return false;
    }
};

static void lingerAtExit() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
}

#ifndef _WIN32
TEST_F(UsageClientTest, WorkerOutlivingMainExitsCleanly) {
    GTEST_FLAG_SET(death_test_style, "threadsafe");
    EXPECT_EXIT({
        // Registered first so it runs after static destructors, while the
        // worker is still inside post().
        std::atexit(lingerAtExit);
        ctrack::Log::init(std::make_shared<ctrack::Logger>(ctrack::LogLevel::DEBUG));
        ctrack::UsageClient client(std::make_shared<SlowRejectingTransport>());
        client.send(ctrack::Command("up", "default", ctrack::Source::CLI, ctrack::status::Success));
        std::exit(0);
    }, ::testing::ExitedWithCode(0), "");
}
#endif

TEST_F(UsageClientTest, NullTransportRejected) {
    EXPECT_THROW(ctrack::UsageClient{std::shared_ptr<ctrack::IUsageTransport>()}, std::invalid_argument);
}

TEST_F(UsageClientTest, NullClientDiscards) {
    ctrack::NullClient client;
    EXPECT_NO_THROW(client.send(ctrack::Command()));
}

TEST(CommandRecordTest, SourceStrings) {
    EXPECT_STREQ(ctrack::getSourceString(ctrack::Source::CLI), "cli");
    EXPECT_STREQ(ctrack::getSourceString(ctrack::Source::API), "api");
}

TEST(CommandRecordTest, JsonFieldOrder) {
    ctrack::Command cmd("context create", "aci-prod", ctrack::Source::API, ctrack::status::Canceled);
    EXPECT_EQ(ctrack::toJson(cmd).dump(),
              "{\"command\":\"context create\",\"context\":\"aci-prod\",\"source\":\"api\",\"status\":\"canceled\"}");
}
