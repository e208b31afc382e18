#include <gtest/gtest.h>
#include "../../src/common/worker_pool.h"
#include "../../src/pipeline/phase.h"
#include "../test_util.h"
#include <chrono>
#include <atomic>
#include <functional>

using namespace Pushline;
using namespace Pushline::testing_util;
using namespace std::chrono_literals;

namespace {

// Phase running a test-supplied body.
class LambdaPhase : public Phase {
public:
    LambdaPhase(Context& context, std::shared_ptr<ItemQueue> in_queue, std::function<void(LambdaPhase&)> body)
        : Phase(context, std::move(in_queue), "test phase"), body_(std::move(body)) {}

    using Phase::PutOutput;
    using Phase::PutFutureOutput;

protected:
    void Run() override { body_(*this); }

private:
    std::function<void(LambdaPhase&)> body_;
};

// Phase queuing work on a single-thread pool behind a task which waits for cancellation.
class PooledPhase : public Phase {
public:
    PooledPhase(Context& context, std::shared_ptr<ItemQueue> in_queue, std::atomic<int>* queued_runs)
        : Phase(context, std::move(in_queue), "pooled phase"), queued_runs_(queued_runs), pool_(1, "pooled") {}

    bool cancelled() const { return cancelled_; }

protected:
    void Run() override {
        auto item = ContentItem::Create(MakeFile("f", "s", {"repo"}));
        auto released = release_.get_future().share();
        PutFutureOutput(pool_.ExecuteAsync([item, released]() {
            released.wait();
            return item;
        }));
        for (int i = 0; i < 3; ++i) {
            auto* runs = queued_runs_;
            PutFutureOutput(pool_.ExecuteAsync([item, runs]() {
                ++*runs;
                return item;
            }));
        }
        throw std::runtime_error("failed with work queued");
    }

    void OnCancel() override {
        cancelled_ = true;
        pool_.Cancel();
        release_.set_value();
    }

private:
    std::atomic<int>* queued_runs_;
    std::promise<void> release_;
    bool cancelled_ = false;
    WorkerPool pool_;
};

ItemBatch NumberedItems(int count) {
    ItemBatch items;
    for (int i = 0; i < count; ++i) {
        items.push_back(ContentItem::Create(MakeFile(std::to_string(i), "s" + std::to_string(i), {"repo"})));
    }
    return items;
}

std::vector<std::string> Names(const ItemBatch& batch) {
    std::vector<std::string> names;
    for (const auto& item : batch) {
        names.push_back(item->push_item().name);
    }
    return names;
}

} // namespace

class PhaseTest : public ::testing::Test {
protected:
    PhaseTest() : context_(FastTunables()) {}

    Context context_;
};

TEST_F(PhaseTest, InputIsBatchedBySize) {
    auto in = context_.NewQueue("in");
    ASSERT_TRUE(in->TryPut(NumberedItems(10)));
    ASSERT_TRUE(in->TryPut(std::nullopt));

    std::vector<std::vector<std::string>> batches;
    bool exhausted_stays_exhausted = false;
    LambdaPhase phase(context_, in, [&](LambdaPhase& self) {
        ItemBatch batch;
        while (self.NextInputBatch(&batch, 3)) {
            batches.push_back(Names(batch));
        }
        exhausted_stays_exhausted = !self.NextInputBatch(&batch, 3);
    });
    phase.Start();
    phase.Stop();

    ASSERT_FALSE(context_.has_error()) << context_.ErrorMessage();
    std::vector<std::vector<std::string>> expected = {{"0", "1", "2"}, {"3", "4", "5"}, {"6", "7", "8"}, {"9"}};
    EXPECT_EQ(batches, expected);
    EXPECT_TRUE(exhausted_stays_exhausted);
}

TEST_F(PhaseTest, OutputReachesNextQueueFollowedBySentinel) {
    auto in = context_.NewQueue("in");
    ASSERT_TRUE(in->TryPut(NumberedItems(5)));
    ASSERT_TRUE(in->TryPut(std::nullopt));

    LambdaPhase phase(context_, in, [](LambdaPhase& self) {
        ContentItemPtr item;
        while (self.NextInput(&item)) {
            self.PutOutput(item);
        }
    });
    phase.Start();
    phase.Stop();

    ItemBatch out;
    std::optional<ItemBatch> element;
    while (phase.out_queue()->Get(context_, &element, 1s) && element) {
        out.insert(out.end(), element->begin(), element->end());
    }
    EXPECT_FALSE(element.has_value());
    EXPECT_EQ(Names(out), (std::vector<std::string>{"0", "1", "2", "3", "4"}));
    EXPECT_EQ(phase.out_queue()->put_count(), 5u);
}

TEST_F(PhaseTest, BatchTimeoutScalesWithOutputFullness) {
    LambdaPhase phase(context_, context_.NewQueue("in"), [](LambdaPhase&) {});
    const auto& t = context_.tunables();

    EXPECT_DOUBLE_EQ(phase.BatchTimeout().count(), t.batch_timeout.count());

    const size_t capacity = phase.out_queue()->capacity();
    for (size_t i = 0; i < capacity / 2; ++i) {
        ASSERT_TRUE(phase.out_queue()->TryPut(NumberedItems(1)));
    }
    double half = t.batch_timeout.count() +
                  (t.batch_max_timeout.count() - t.batch_timeout.count()) * (capacity / 2) / capacity;
    EXPECT_NEAR(phase.BatchTimeout().count(), half, 1e-9);

    while (phase.out_queue()->TryPut(NumberedItems(1))) {
    }
    EXPECT_DOUBLE_EQ(phase.BatchTimeout().count(), t.batch_max_timeout.count());
}

TEST_F(PhaseTest, FailureIsRecordedAndOutputDiscarded) {
    // Output stays buffered until the failure
    auto tunables = FastTunables();
    tunables.out_batch_timeout = Seconds(60);
    Context context(tunables);
    auto in = context.NewQueue("in");
    ASSERT_TRUE(in->TryPut(NumberedItems(2)));
    ASSERT_TRUE(in->TryPut(std::nullopt));

    LambdaPhase phase(context, in, [](LambdaPhase& self) {
        ContentItemPtr item;
        self.NextInput(&item);
        self.PutOutput(item);
        throw std::runtime_error("simulated failure");
    });
    phase.Start();
    phase.Stop();

    EXPECT_TRUE(context.has_error());
    EXPECT_EQ(context.error_phase(), "test phase");
    EXPECT_EQ(context.ErrorMessage(), "simulated failure");
    EXPECT_EQ(phase.out_queue()->size(), 0u);
}

TEST_F(PhaseTest, BlockedPhaseIsInterruptedPromptly) {
    // Input never arrives; only the error can end the wait.
    LambdaPhase phase(context_, context_.NewQueue("in"), [](LambdaPhase& self) {
        ItemBatch batch;
        while (self.NextInputBatch(&batch)) {
        }
    });
    phase.Start();
    std::this_thread::sleep_for(100ms);

    auto start = Clock::now();
    context_.SetError("elsewhere", std::make_exception_ptr(std::runtime_error("upstream failed")));
    phase.Stop();
    auto elapsed = Clock::now() - start;

    // One polling interval is 50ms; allow generous scheduling slack.
    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(context_.error_phase(), "elsewhere");
    EXPECT_EQ(phase.out_queue()->size(), 0u);
}

TEST_F(PhaseTest, FutureOutputsKeepWriteOrder) {
    auto in = context_.NewQueue("in");
    ASSERT_TRUE(in->TryPut(NumberedItems(3)));
    ASSERT_TRUE(in->TryPut(std::nullopt));

    LambdaPhase phase(context_, in, [](LambdaPhase& self) {
        ContentItemPtr item;
        int delay_ms = 60;
        while (self.NextInput(&item)) {
            self.PutFutureOutput(std::async(std::launch::async, [item, delay_ms]() {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
                return item;
            }));
            delay_ms -= 30;
        }
    });
    phase.Start();
    phase.Stop();
    ASSERT_FALSE(context_.has_error()) << context_.ErrorMessage();

    ItemBatch out;
    std::optional<ItemBatch> element;
    while (phase.out_queue()->Get(context_, &element, 1s) && element) {
        out.insert(out.end(), element->begin(), element->end());
    }
    EXPECT_EQ(Names(out), (std::vector<std::string>{"0", "1", "2"}));
}

TEST_F(PhaseTest, FailureDropsQueuedPoolWork) {
    std::atomic<int> queued_runs{0};
    {
        PooledPhase phase(context_, context_.NewQueue("in"), &queued_runs);
        phase.Start();
        phase.Stop();
        EXPECT_TRUE(phase.cancelled());
    }
    // The pool has been stopped and joined; dropped tasks never ran.
    EXPECT_EQ(queued_runs.load(), 0);
    EXPECT_EQ(context_.ErrorMessage(), "failed with work queued");
}
