#include "test_config.h"
#include "fake_transport.hpp"

#include "tglogger/delivery_cycle.hpp"

#include <stdexcept>

namespace tglogger::test {

using std::chrono::milliseconds;
using std::chrono::seconds;

class DeliveryCycleTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        config = HandlerTestHelper::makeConfig();
        diagnostics = std::make_shared<CapturingDiagnostics>();
    }

    DeliveryCycle &cycle()
    {
        if (!cycle_) {
            cycle_ = std::make_unique<DeliveryCycle>(config, transport, sleeper.sleeper(), diagnostics);
        }
        return *cycle_;
    }

    void deliver(const std::string &text)
    {
        cycle().deliver(DrainedLogs { text, LogBuffer::count_lines(text) });
    }

    std::string wrap(const std::string &body) const
    {
        return format_message(config.title, body);
    }

    HandlerConfig config;
    FakeTransport transport;
    RecordingSleeper sleeper;
    std::shared_ptr<CapturingDiagnostics> diagnostics;

private:
    std::unique_ptr<DeliveryCycle> cycle_;
};

TEST_F(DeliveryCycleTest, FirstBatchSendsThenLaterBatchesEdit)
{
    transport.set_next_id(42);

    deliver("boot complete\n");
    ASSERT_EQ(transport.calls().size(), 1u);
    EXPECT_EQ(transport.calls()[0].kind, CallKind::Send);
    EXPECT_EQ(transport.calls()[0].text, wrap("boot complete\n"));
    EXPECT_EQ(cycle().state().message_id, 42);

    deliver("request served\n");
    auto calls = transport.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].kind, CallKind::Edit);
    EXPECT_EQ(calls[1].message_id, 42);
    EXPECT_EQ(calls[1].text, wrap("boot complete\nrequest served\n"));
    EXPECT_EQ(cycle().state().text, "boot complete\nrequest served\n");

    DeliveryStats stats = cycle().stats();
    EXPECT_EQ(stats.messages_sent, 1u);
    EXPECT_EQ(stats.messages_edited, 1u);
}

TEST_F(DeliveryCycleTest, EmptyBatchWithoutBacklogMakesNoCall)
{
    deliver("");
    EXPECT_TRUE(transport.calls().empty());
    EXPECT_FALSE(cycle().has_backlog());
}

TEST_F(DeliveryCycleTest, LargeBacklogIsUploadedAsFileAndResetsState)
{
    config.pending_logs = 100;
    deliver("first\n");
    ASSERT_TRUE(cycle().state().active());

    std::string big;
    while (big.size() <= 150) {
        big += "0123456789\n";
    }
    deliver(big);

    auto calls = transport.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].kind, CallKind::File);
    EXPECT_EQ(calls[1].text, big);
    EXPECT_EQ(calls[1].filename, "TGLogger.log");
    EXPECT_EQ(calls[1].caption, "TGLogger: too many logs for text messages, this file contains them.");
    EXPECT_FALSE(cycle().state().active());
    EXPECT_FALSE(cycle().has_backlog());

    deliver("after upload\n");
    calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[2].kind, CallKind::Send);
    EXPECT_EQ(calls[2].text, wrap("after upload\n"));
    EXPECT_EQ(cycle().stats().files_sent, 1u);
}

TEST_F(DeliveryCycleTest, FloodWaitSleepsAtLeastRetryAfter)
{
    transport.fail_next(CallKind::Send, FloodWait(seconds(3), "Too Many Requests: retry after 3"));

    deliver("line\n");

    ASSERT_EQ(sleeper.delays.size(), 1u);
    EXPECT_GE(sleeper.delays[0], milliseconds(3000));
    EXPECT_EQ(transport.count(CallKind::Send), 2u);
    EXPECT_TRUE(cycle().state().active());
    EXPECT_EQ(cycle().stats().flood_waits, 1u);
    EXPECT_TRUE(diagnostics->contains("FloodWait of 3 seconds"));
}

TEST_F(DeliveryCycleTest, PersistentFloodWaitDropsAfterBudget)
{
    const int budget = config.retry.max_flood_waits;
    transport.fail_next(CallKind::Send, FloodWait(seconds(1), "Too Many Requests"), budget + 1);

    deliver("line\n");

    EXPECT_EQ(transport.count(CallKind::Send), static_cast<std::size_t>(budget + 1));
    EXPECT_EQ(sleeper.delays.size(), static_cast<std::size_t>(budget));
    EXPECT_FALSE(cycle().state().active());
    EXPECT_FALSE(cycle().has_backlog());

    DeliveryStats stats = cycle().stats();
    EXPECT_EQ(stats.dropped_batches, 1u);
    EXPECT_EQ(stats.dropped_bytes, 5u);
    EXPECT_TRUE(diagnostics->contains("dropped 5 bytes, 1 lines"));
}

TEST_F(DeliveryCycleTest, TransientFailureRetriesWithBackoff)
{
    transport.fail_next(CallKind::Send, TransportError(502, "Bad Gateway"), 2);

    deliver("line\n");

    std::vector<milliseconds> expected = { milliseconds(1000), milliseconds(2000) };
    EXPECT_EQ(sleeper.delays, expected);
    EXPECT_EQ(transport.count(CallKind::Send), 3u);
    EXPECT_TRUE(cycle().state().active());
    EXPECT_EQ(cycle().stats().retries, 2u);
}

TEST_F(DeliveryCycleTest, FailureBudgetBoundsAttempts)
{
    transport.fail_next(CallKind::Send, TransportError(0, "connection refused"), config.retry.max_failures);

    deliver("line\n");

    EXPECT_EQ(transport.count(CallKind::Send), static_cast<std::size_t>(config.retry.max_failures));
    EXPECT_EQ(cycle().stats().dropped_batches, 1u);
    EXPECT_FALSE(cycle().state().active());

    // The next batch is delivered normally.
    deliver("next\n");
    EXPECT_TRUE(cycle().state().active());
    EXPECT_EQ(cycle().state().text, "next\n");
}

TEST_F(DeliveryCycleTest, UnexpectedExceptionCountsAsFailure)
{
    transport.fail_next(CallKind::Send, std::runtime_error("bad reply"));

    deliver("line\n");

    EXPECT_EQ(transport.count(CallKind::Send), 2u);
    EXPECT_TRUE(cycle().state().active());
}

TEST_F(DeliveryCycleTest, CancelledSleepDropsBatch)
{
    sleeper.cancelled = true;
    transport.fail_next(CallKind::Send, TransportError(500, "Internal Server Error"));

    deliver("line\n");

    EXPECT_EQ(transport.count(CallKind::Send), 1u);
    EXPECT_EQ(cycle().stats().dropped_batches, 1u);
}

TEST_F(DeliveryCycleTest, RejectedEditFallsBackToNewMessage)
{
    transport.set_next_id(7);
    deliver("a\n");
    transport.fail_next(CallKind::Edit, TransportError(400, "Bad Request: message to edit not found"));

    deliver("b\n");

    auto calls = transport.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[1].kind, CallKind::Edit);
    EXPECT_EQ(calls[2].kind, CallKind::Send);
    EXPECT_EQ(calls[2].text, wrap("b\n"));
    EXPECT_EQ(cycle().state().message_id, 8);
    EXPECT_EQ(cycle().state().text, "b\n");
    EXPECT_TRUE(sleeper.delays.empty());
}

TEST_F(DeliveryCycleTest, TransientEditFailureIsRetried)
{
    deliver("a\n");
    transport.fail_next(CallKind::Edit, TransportError(500, "Internal Server Error"));

    deliver("b\n");

    EXPECT_EQ(transport.count(CallKind::Edit), 2u);
    EXPECT_EQ(transport.count(CallKind::Send), 1u);
    EXPECT_EQ(cycle().state().text, "a\nb\n");
}

TEST_F(DeliveryCycleTest, OverflowingEditStartsNewMessage)
{
    config.message_limit = 10;
    deliver("12345678\n");
    deliver("abc\n");

    EXPECT_EQ(transport.count(CallKind::Send), 2u);
    EXPECT_EQ(transport.count(CallKind::Edit), 0u);
    EXPECT_EQ(cycle().state().text, "abc\n");
}

TEST_F(DeliveryCycleTest, OversizedBatchIsCarriedOverAtLineBoundary)
{
    config.message_limit = 10;
    deliver("aaaa\nbbbb\ncccc\n");

    auto calls = transport.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].text, wrap("aaaa\nbbbb\n"));
    EXPECT_TRUE(cycle().has_backlog());
    EXPECT_EQ(cycle().backlog_size(), 5u);

    deliver("");
    calls = transport.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[1].kind, CallKind::Send);
    EXPECT_EQ(calls[1].text, wrap("cccc\n"));
    EXPECT_FALSE(cycle().has_backlog());
}

TEST_F(DeliveryCycleTest, LineLongerThanMessageIsHardCut)
{
    config.message_limit = 10;
    deliver("abcdefghijklmno\n");

    EXPECT_EQ(transport.calls()[0].text, wrap("abcdefghij"));
    EXPECT_EQ(cycle().backlog_size(), 6u);
}

TEST_F(DeliveryCycleTest, HardCutKeepsMultibyteCharactersWhole)
{
    config.message_limit = 10;
    deliver("aaaaaaaaa\xC3\xA9\n");

    EXPECT_EQ(transport.calls()[0].text, wrap("aaaaaaaaa"));
    EXPECT_EQ(cycle().backlog_size(), 3u);
}

TEST_F(DeliveryCycleTest, MultibyteCharacterWiderThanLimitIsKeptWhole)
{
    config.message_limit = 2;
    deliver("\xE2\x82\xAC\n");

    EXPECT_EQ(transport.calls()[0].text, wrap("\xE2\x82\xAC"));
    EXPECT_EQ(cycle().backlog_size(), 1u);
}

TEST(DeliveryFormatTest, MessageIsFencedCodeBlock)
{
    EXPECT_EQ(format_message("svc", "hello\n"), "```svc\nhello\n```");
}

TEST(DeliveryFormatTest, FencesInsideBodyAreNeutralized)
{
    EXPECT_EQ(format_message("T", "x```y\n"), "```T\nx'''y\n```");
}

TEST(DeliveryFormatTest, FencesInsideTitleAreNeutralized)
{
    EXPECT_EQ(format_message("a```b", "x\n"), "```a'''b\nx\n```");
}

TEST(DeliveryFormatTest, FileNameIsSanitized)
{
    EXPECT_EQ(file_name_for("My App/prod"), "My_App_prod.log");
    EXPECT_EQ(file_name_for("api-v2.worker_1"), "api-v2.worker_1.log");
}

}
