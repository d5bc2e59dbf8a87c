#include <gtest/gtest.h>
#include "compose_track.hpp"
#include "utils/test_utils.hpp"
#include <sstream>
#include <string>

class PrefixedLogConsumerTest : public ::testing::Test {
protected:
    void SetUp() override { TestUtils::unsetEnv("NO_COLOR"); }
    void TearDown() override { TestUtils::unsetEnv("NO_COLOR"); }

    std::unique_ptr<ctrack::ITransport> transport() {
        return ctrack::detail::make_unique<ctrack::OStreamTransport>(out_);
    }

    std::ostringstream out_;
};

TEST_F(PrefixedLogConsumerTest, PlainPrefix) {
    ctrack::PrefixedLogConsumer consumer(transport());
    consumer.log("web", "GET /");
    EXPECT_EQ(out_.str(), "web  | GET /\n");
}

TEST_F(PrefixedLogConsumerTest, PadsToWidth) {
    ctrack::PrefixedLogConsumer consumer(transport(), 6);
    consumer.log("db", "ready");
    consumer.log("worker", "started");
    EXPECT_EQ(out_.str(), "db      | ready\nworker  | started\n");
}

TEST_F(PrefixedLogConsumerTest, LongNamesAreNotTruncated) {
    ctrack::PrefixedLogConsumer consumer(transport(), 2);
    consumer.log("frontend", "x");
    EXPECT_EQ(out_.str(), "frontend  | x\n");
}

TEST_F(PrefixedLogConsumerTest, ColourPerService) {
    ctrack::PrefixedLogConsumer consumer(transport(), 0, true);
    ASSERT_TRUE(consumer.isColorEnabled());
    consumer.log("web", "a");
    consumer.log("db", "b");
    consumer.log("web", "c");

    std::string expected;
    expected += std::string(ctrack::PrefixedLogConsumer::paletteColor(0)) + "web  |\033[0m a\n";
    expected += std::string(ctrack::PrefixedLogConsumer::paletteColor(1)) + "db  |\033[0m b\n";
    expected += std::string(ctrack::PrefixedLogConsumer::paletteColor(0)) + "web  |\033[0m c\n";
    EXPECT_EQ(out_.str(), expected);
}

TEST_F(PrefixedLogConsumerTest, NoColorEnvironmentDisablesColour) {
    TestUtils::setEnv("NO_COLOR", "1");
    ctrack::PrefixedLogConsumer consumer(transport(), 0, true);
    EXPECT_FALSE(consumer.isColorEnabled());
    consumer.log("web", "a");
    EXPECT_EQ(out_.str(), "web  | a\n");
}

TEST_F(PrefixedLogConsumerTest, PaletteWraps) {
    EXPECT_STREQ(ctrack::PrefixedLogConsumer::paletteColor(0), ctrack::PrefixedLogConsumer::paletteColor(10));
}

TEST_F(PrefixedLogConsumerTest, BehindFilter) {
    auto printer = std::make_shared<ctrack::PrefixedLogConsumer>(transport(), 3);
    auto consumer = ctrack::filterLogConsumer(printer, {"web"});
    consumer->log("web", "one");
    consumer->log("db", "two");
    EXPECT_EQ(out_.str(), "web  | one\n");
}
