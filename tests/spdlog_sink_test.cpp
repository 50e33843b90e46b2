#include "test_config.h"
#include "fake_transport.hpp"

#include "tglogger/spdlog_sink.hpp"

#include <spdlog/logger.h>

namespace tglogger::test {

class SpdlogSinkTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        HandlerConfig config = HandlerTestHelper::makeConfig();
        config.update_interval = std::chrono::milliseconds(10000);
        config.ignore_patterns = { "heartbeat" };
        auto owned = std::make_unique<FakeTransport>();
        transport = owned.get();
        handler = std::make_shared<TelegramLogHandler>(config, std::move(owned), std::make_shared<CapturingDiagnostics>());
        ASSERT_EQ(handler->start(), 0);
    }

    void TearDown() override
    {
        handler->close();
    }

    FakeTransport *transport = nullptr;
    std::shared_ptr<TelegramLogHandler> handler;
};

TEST_F(SpdlogSinkTest, FormattedRecordsReachTheHandler)
{
    auto sink = std::make_shared<telegram_sink_st>(handler);
    spdlog::logger logger("sink_test", sink);
    logger.set_pattern("[%l] %v");

    logger.info("user {} logged in", 7);
    logger.warn("heartbeat late");

    HandlerStats stats = handler->stats();
    EXPECT_EQ(stats.accepted_lines, 1u);
    EXPECT_EQ(stats.ignored_lines, 1u);

    handler->close();
    ASSERT_EQ(transport->count(CallKind::Send), 1u);
    EXPECT_EQ(transport->calls()[0].text, format_message("TGLogger", "[info] user 7 logged in\n"));
}

TEST_F(SpdlogSinkTest, LevelFilteringStaysWithSpdlog)
{
    auto sink = std::make_shared<telegram_sink_mt>(handler);
    spdlog::logger logger("sink_test", sink);
    logger.set_pattern("%v");
    logger.set_level(spdlog::level::warn);

    logger.info("not shipped");
    logger.error("shipped");

    EXPECT_EQ(handler->stats().accepted_lines, 1u);
}

TEST_F(SpdlogSinkTest, LoggerFlushRequestsDelivery)
{
    auto logger = std::make_shared<spdlog::logger>("sink_test");
    attach_telegram_sink(logger, handler);
    logger->set_pattern("%v");

    logger->error("disk full");
    logger->flush();

    ASSERT_TRUE(HandlerTestHelper::waitFor([this]() { return transport->count(CallKind::Send) >= 1; }));
}

}
