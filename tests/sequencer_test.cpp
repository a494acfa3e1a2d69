#include <gtest/gtest.h>
#include "fake_channel.hpp"
#include "nerseq/sequencer.hpp"
#include <future>
#include <map>
#include <thread>

using namespace nerseq;
using nerseq::testing::FakeChannel;
using namespace std::chrono_literals;

namespace {

template <typename T>
bool isReady(const std::future<T>& future) {
    return future.wait_for(0ms) == std::future_status::ready;
}

ErrorKind errorOf(std::future<ClassificationResult>& future) {
    try {
        future.get();
    } catch (const SequencerError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected SequencerError";
    return ErrorKind::Shutdown;
}

const char* kObamaText = "Barack Obama visited Paris";
const char* kObamaTagged = "Barack/PERSON Obama/PERSON visited/O Paris/LOCATION\n";
const char* kMerkelText = "Angela Merkel spoke";
const char* kMerkelTagged = "Angela/PERSON Merkel/PERSON spoke/O\n";
const char* kSpainText = "Spain is nice";
const char* kSpainTagged = "Spain/LOCATION is/O nice/O\n";

}

class SequencerTest : public ::testing::Test {
protected:
    void TearDown() override {
        channel_.stopResponder();
    }

    FakeChannel channel_;
};

TEST_F(SequencerTest, DispatchesImmediatelyWhenIdle) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit(kObamaText);

    EXPECT_EQ(channel_.writes(), std::vector<std::string>({"Barack Obama visited Paris\n"}));
    EXPECT_TRUE(sequencer.isBusy());
    EXPECT_EQ(sequencer.inFlight(), ticket.id);
    EXPECT_FALSE(isReady(ticket.result));
}

TEST_F(SequencerTest, ResolvesWhenTokenBudgetIsCovered) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit(kObamaText);

    channel_.reply(kObamaTagged);

    ASSERT_TRUE(isReady(ticket.result));
    ClassificationResult result = ticket.result.get();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(*result[0].find("PERSON"), std::vector<std::string>({"Barack Obama"}));
    EXPECT_EQ(*result[0].find("LOCATION"), std::vector<std::string>({"Paris"}));
    EXPECT_FALSE(sequencer.isBusy());
    EXPECT_FALSE(sequencer.inFlight().has_value());
}

TEST_F(SequencerTest, OneEntityMapPerWorkerLine) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit("Spain is nice. Paris is big.");

    channel_.emit("Spain/LOCATION is/O nice/O ./O\n");
    EXPECT_FALSE(isReady(ticket.result));

    channel_.emit("Paris/LOCATION is/O big/O ./O\n");
    ASSERT_TRUE(isReady(ticket.result));

    ClassificationResult result = ticket.result.get();
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(*result[0].find("LOCATION"), std::vector<std::string>({"Spain"}));
    EXPECT_EQ(*result[1].find("LOCATION"), std::vector<std::string>({"Paris"}));
}

TEST_F(SequencerTest, ReassemblesLinesSplitAcrossChunks) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit(kObamaText);

    channel_.emit("Barack/PERSON Oba");
    channel_.emit("ma/PERSON visited/O Par");
    EXPECT_FALSE(isReady(ticket.result));
    channel_.emit("is/LOCATION\r\n");

    ASSERT_TRUE(isReady(ticket.result));
    ClassificationResult result = ticket.result.get();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(*result[0].find("PERSON"), std::vector<std::string>({"Barack Obama"}));
    EXPECT_EQ(*result[0].find("LOCATION"), std::vector<std::string>({"Paris"}));
}

TEST_F(SequencerTest, BlankLinesAreNotSentences) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit(kObamaText);

    channel_.emit("\n  \n");
    channel_.emit(kObamaTagged);

    ASSERT_TRUE(isReady(ticket.result));
    EXPECT_EQ(ticket.result.get().size(), 1u);
}

TEST_F(SequencerTest, QueuedRequestsDispatchInArrivalOrder) {
    Sequencer sequencer(channel_);
    Ticket a = sequencer.submit(kObamaText);
    Ticket b = sequencer.submit(kMerkelText);
    Ticket c = sequencer.submit(kSpainText);

    EXPECT_LT(a.id, b.id);
    EXPECT_LT(b.id, c.id);
    EXPECT_EQ(channel_.writes().size(), 1u);
    EXPECT_EQ(sequencer.queueSize(), 2u);

    bool aResolvedBeforeB = false;
    channel_.onWrite([&](const std::string& written) {
        if (written == "Angela Merkel spoke\n") {
            aResolvedBeforeB = isReady(a.result);
        }
    });

    channel_.reply(kObamaTagged);
    EXPECT_TRUE(isReady(a.result));
    EXPECT_TRUE(aResolvedBeforeB);
    EXPECT_FALSE(isReady(b.result));
    EXPECT_EQ(sequencer.inFlight(), b.id);

    channel_.reply(kMerkelTagged);
    EXPECT_TRUE(isReady(b.result));
    EXPECT_EQ(sequencer.inFlight(), c.id);

    channel_.reply(kSpainTagged);
    EXPECT_TRUE(isReady(c.result));

    EXPECT_EQ(channel_.writes(), std::vector<std::string>({
        "Barack Obama visited Paris\n", "Angela Merkel spoke\n", "Spain is nice\n"}));
    EXPECT_EQ(*b.result.get()[0].find("PERSON"), std::vector<std::string>({"Angela Merkel"}));
    EXPECT_EQ(*c.result.get()[0].find("LOCATION"), std::vector<std::string>({"Spain"}));
    EXPECT_EQ(channel_.overlaps(), 0);
}

TEST_F(SequencerTest, OutputWhileIdleIsDiscarded) {
    Sequencer sequencer(channel_);
    channel_.emit("stray/O output/O\n");

    Ticket ticket = sequencer.submit(kSpainText);
    channel_.reply(kSpainTagged);

    ASSERT_TRUE(isReady(ticket.result));
    EXPECT_EQ(ticket.result.get().size(), 1u);
}

TEST_F(SequencerTest, EmptyTextResolvesWithoutTheWorker) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit("  \r\n");

    ASSERT_TRUE(isReady(ticket.result));
    EXPECT_TRUE(ticket.result.get().empty());
    EXPECT_TRUE(channel_.writes().empty());
    EXPECT_FALSE(sequencer.isBusy());
}

TEST_F(SequencerTest, EmptyTextWaitsForEarlierRequests) {
    Sequencer sequencer(channel_);
    Ticket a = sequencer.submit(kObamaText);
    Ticket empty = sequencer.submit("");
    Ticket c = sequencer.submit(kSpainText);

    EXPECT_FALSE(isReady(empty.result));
    EXPECT_EQ(sequencer.queueSize(), 2u);

    channel_.reply(kObamaTagged);

    ASSERT_TRUE(isReady(a.result));
    ASSERT_TRUE(isReady(empty.result));
    EXPECT_TRUE(empty.result.get().empty());
    EXPECT_EQ(sequencer.inFlight(), c.id);
    EXPECT_EQ(channel_.writes(), std::vector<std::string>({
        "Barack Obama visited Paris\n", "Spain is nice\n"}));
}

TEST_F(SequencerTest, TrimsTextAndAppendsOneNewline) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit("  Paris  \r\n");
    EXPECT_EQ(channel_.writes(), std::vector<std::string>({"Paris\n"}));
}

TEST_F(SequencerTest, ZeroBudgetCompletesOnFirstLine) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit("a .");

    channel_.reply("a/O ./O\n");

    ASSERT_TRUE(isReady(ticket.result));
    ClassificationResult result = ticket.result.get();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_TRUE(result[0].empty());
}

TEST_F(SequencerTest, CancelRemovesQueuedRequest) {
    Sequencer sequencer(channel_);
    Ticket a = sequencer.submit(kObamaText);
    Ticket b = sequencer.submit(kMerkelText);

    EXPECT_TRUE(sequencer.cancel(b.id));
    EXPECT_EQ(errorOf(b.result), ErrorKind::Cancelled);
    EXPECT_EQ(sequencer.queueSize(), 0u);

    channel_.reply(kObamaTagged);
    EXPECT_TRUE(isReady(a.result));
    EXPECT_FALSE(sequencer.isBusy());
    EXPECT_EQ(channel_.writes().size(), 1u);
}

TEST_F(SequencerTest, CancelInFlightDrainsBeforeNextDispatch) {
    Sequencer sequencer(channel_);
    Ticket a = sequencer.submit(kObamaText);
    Ticket b = sequencer.submit(kMerkelText);

    EXPECT_TRUE(sequencer.cancel(a.id));
    EXPECT_EQ(errorOf(a.result), ErrorKind::Cancelled);
    EXPECT_TRUE(sequencer.isDraining());
    EXPECT_TRUE(sequencer.isBusy());
    EXPECT_EQ(channel_.writes().size(), 1u);

    // The worker still answers the cancelled text; none of it may reach b
    channel_.reply(kObamaTagged);
    EXPECT_FALSE(sequencer.isDraining());
    ASSERT_EQ(channel_.writes().size(), 2u);
    EXPECT_FALSE(isReady(b.result));

    channel_.reply(kMerkelTagged);
    ASSERT_TRUE(isReady(b.result));
    ClassificationResult result = b.result.get();
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].find("LOCATION"), nullptr);
    EXPECT_EQ(*result[0].find("PERSON"), std::vector<std::string>({"Angela Merkel"}));
}

TEST_F(SequencerTest, CancelOfFinishedRequestReturnsFalse) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit(kSpainText);
    channel_.reply(kSpainTagged);

    EXPECT_FALSE(sequencer.cancel(ticket.id));
    EXPECT_FALSE(sequencer.cancel(9999));
}

TEST_F(SequencerTest, InFlightRequestTimesOut) {
    SequencerOptions options;
    options.timeout = 100ms;
    options.watchdogInterval = 10ms;
    Sequencer sequencer(channel_, options);

    Ticket ticket = sequencer.submit(kObamaText);
    ASSERT_EQ(ticket.result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(errorOf(ticket.result), ErrorKind::Timeout);
    EXPECT_TRUE(sequencer.isDraining());

    // Late answer is drained, then the session is idle again
    channel_.reply(kObamaTagged);
    EXPECT_FALSE(sequencer.isBusy());
}

TEST_F(SequencerTest, QueuedRequestTimesOutBehindStalledWorker) {
    SequencerOptions options;
    options.timeout = 100ms;
    options.watchdogInterval = 10ms;
    Sequencer sequencer(channel_, options);

    Ticket a = sequencer.submit(kObamaText);
    Ticket b = sequencer.submit(kMerkelText);

    ASSERT_EQ(b.result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(errorOf(a.result), ErrorKind::Timeout);
    EXPECT_EQ(errorOf(b.result), ErrorKind::Timeout);
    EXPECT_EQ(sequencer.queueSize(), 0u);
    EXPECT_EQ(channel_.writes().size(), 1u);
}

TEST_F(SequencerTest, NoTimeoutByDefault) {
    Sequencer sequencer(channel_);
    Ticket ticket = sequencer.submit(kObamaText);

    EXPECT_EQ(ticket.result.wait_for(150ms), std::future_status::timeout);
    channel_.reply(kObamaTagged);
    EXPECT_TRUE(isReady(ticket.result));
}

TEST_F(SequencerTest, ChannelCloseFailsOutstandingRequests) {
    Sequencer sequencer(channel_);
    Ticket a = sequencer.submit(kObamaText);
    Ticket b = sequencer.submit(kMerkelText);

    channel_.simulateClose();

    EXPECT_EQ(errorOf(a.result), ErrorKind::ChannelClosed);
    EXPECT_EQ(errorOf(b.result), ErrorKind::ChannelClosed);
    EXPECT_FALSE(sequencer.isBusy());

    Ticket late = sequencer.submit(kSpainText);
    EXPECT_EQ(errorOf(late.result), ErrorKind::ChannelClosed);
}

TEST_F(SequencerTest, WriteFailureFailsRequest) {
    Sequencer sequencer(channel_);
    channel_.close();

    Ticket ticket = sequencer.submit(kObamaText);
    EXPECT_EQ(errorOf(ticket.result), ErrorKind::ChannelClosed);
    EXPECT_FALSE(sequencer.isBusy());
}

TEST_F(SequencerTest, ShutdownFailsOutstandingRequests) {
    Sequencer sequencer(channel_);
    Ticket a = sequencer.submit(kObamaText);
    Ticket b = sequencer.submit(kMerkelText);

    sequencer.shutdown();

    EXPECT_EQ(errorOf(a.result), ErrorKind::Shutdown);
    EXPECT_EQ(errorOf(b.result), ErrorKind::Shutdown);

    Ticket late = sequencer.submit(kSpainText);
    EXPECT_EQ(errorOf(late.result), ErrorKind::Shutdown);
    EXPECT_EQ(channel_.writes().size(), 1u);
}

TEST_F(SequencerTest, DestroyedSequencerStopsReceivingOutput) {
    Ticket ticket;
    {
        Sequencer sequencer(channel_);
        ticket = sequencer.submit(kObamaText);
    }
    EXPECT_EQ(errorOf(ticket.result), ErrorKind::Shutdown);

    // The worker still answers; nothing may reach the destroyed sequencer
    channel_.reply(kObamaTagged);
    channel_.simulateClose();
    EXPECT_EQ(channel_.writes().size(), 1u);
}

TEST_F(SequencerTest, ConcurrentSubmissionsNeverOverlapAndKeepOrder) {
    Sequencer sequencer(channel_);
    channel_.startResponder(nerseq::testing::tagAllOutside);

    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;

    std::mutex ticketsMutex;
    std::map<RequestId, std::string> textById;
    std::vector<Ticket> tickets;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                std::string text = "request " + std::to_string(i) + " from thread " + std::to_string(t);
                Ticket ticket = sequencer.submit(text);
                std::lock_guard<std::mutex> lock(ticketsMutex);
                textById[ticket.id] = text + "\n";
                tickets.push_back(std::move(ticket));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (auto& ticket : tickets) {
        ASSERT_EQ(ticket.result.wait_for(5s), std::future_status::ready);
        EXPECT_EQ(ticket.result.get().size(), 1u);
    }

    std::vector<std::string> expectedOrder;
    for (const auto& entry : textById) {
        expectedOrder.push_back(entry.second);
    }
    EXPECT_EQ(channel_.writes(), expectedOrder);
    EXPECT_EQ(channel_.overlaps(), 0);
    EXPECT_FALSE(sequencer.isBusy());

    // The responder must not outlive the sequencer it feeds
    channel_.stopResponder();
}

TEST(FakeChannelTest, WriteBeforeReplyIsConsumedCountsAsOverlap) {
    FakeChannel channel;
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    channel.setHandlers([&](const std::string&) {
        entered.set_value();
        released.wait();
    }, {});

    ASSERT_TRUE(channel.write("a\n"));
    std::thread replier([&] { channel.reply("a/O\n"); });
    entered.get_future().wait();

    // The reply has been picked up but its consumer has not finished with it
    EXPECT_TRUE(channel.write("b\n"));
    release.set_value();
    replier.join();

    EXPECT_EQ(channel.overlaps(), 1);
}

TEST(FakeChannelTest, WriteFromReplyHandlerIsNotAnOverlap) {
    FakeChannel channel;
    channel.setHandlers([&](const std::string&) {
        EXPECT_TRUE(channel.write("b\n"));
    }, {});

    ASSERT_TRUE(channel.write("a\n"));
    channel.reply("a/O\n");

    EXPECT_EQ(channel.writes().size(), 2u);
    EXPECT_EQ(channel.overlaps(), 0);
}
