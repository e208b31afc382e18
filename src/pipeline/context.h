#ifndef PUSHLINE_PIPELINE_CONTEXT_H_
#define PUSHLINE_PIPELINE_CONTEXT_H_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

namespace Pushline {

class ItemQueue;

using Clock = std::chrono::steady_clock;
using Seconds = std::chrono::duration<double>;

/// Raised in a stage whose blocking wait was cut short by another stage's fatal error.
class PhaseInterrupted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Queue sizes, batching thresholds and deadlock guards for one run.
 */
struct PipelineTunables {
    size_t queue_size = 10;
    size_t batch_size = 1000;
    Seconds batch_timeout{0.1};
    Seconds batch_max_timeout{60.0};
    size_t out_batch_size = 100;
    Seconds out_batch_timeout{10.0};
    size_t out_max_futures = 10;
    Seconds phase_timeout{200000.0};
    Seconds interrupt_interval{1.0};

    /// Values from the global Configuration (file, environment, command line)
    static PipelineTunables FromConfig();
};

/// Items taken in and written out by one stage
class ProgressInfo {
public:
    explicit ProgressInfo(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    void AddIn(size_t n) { in_count_.fetch_add(n, std::memory_order_relaxed); }
    void AddOut(size_t n) { out_count_.fetch_add(n, std::memory_order_relaxed); }
    size_t in_count() const { return in_count_.load(std::memory_order_relaxed); }
    size_t out_count() const { return out_count_.load(std::memory_order_relaxed); }

private:
    std::string name_;
    std::atomic<size_t> in_count_{0};
    std::atomic<size_t> out_count_{0};
};

/**
 * State shared by every stage of one pipeline run.
 *
 * Holds the first fatal error, what is known about the input as a whole,
 * per-stage progress, and creates the queues linking stages.
 *
 * There is no primitive to wait on "an operation or the error flag", so
 * blocking waits go through Interruptible(), which polls in slices of
 * interrupt_interval and raises PhaseInterrupted once an error is set.
 */
class Context {
public:
    explicit Context(PipelineTunables tunables = PipelineTunables::FromConfig());

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    const PipelineTunables& tunables() const { return tunables_; }

    // ---- Errors ----

    bool has_error() const { return has_error_.load(std::memory_order_acquire); }

    /**
     * Records a fatal error raised in phase. Only the first call has effect.
     * @return true if this call recorded the error
     */
    bool SetError(const std::string& phase, std::exception_ptr error);

    std::string error_phase() const;
    std::exception_ptr error_exception() const;
    /// what() of the recorded exception, or empty
    std::string ErrorMessage() const;

    /// @throws PhaseInterrupted("Interrupted while <activity>") if an error is set
    void RaiseIfInterrupted(std::string_view activity) const;

    /**
     * Calls attempt(slice_deadline) until it returns true or timeout elapses,
     * checking the error flag between slices.
     * @return false on timeout
     * @throws PhaseInterrupted
     */
    template<typename Attempt>
    bool Interruptible(Attempt&& attempt, Clock::duration timeout, std::string_view activity) const {
        const auto deadline = Clock::now() + timeout;
        const auto slice = std::chrono::duration_cast<Clock::duration>(tunables_.interrupt_interval);
        while (true) {
            RaiseIfInterrupted(activity);
            const auto slice_end = std::min(deadline, Clock::now() + slice);
            if (attempt(slice_end)) {
                return true;
            }
            if (Clock::now() >= deadline) {
                return false;
            }
        }
    }

    /**
     * Waits for a deferred result (bounded by phase_timeout) and returns it.
     * @throws PhaseInterrupted, std::runtime_error on timeout, or the result's exception
     */
    template<typename T>
    T AwaitResult(std::future<T> future, std::string_view activity) const {
        bool ready = Interruptible(
            [&future](Clock::time_point until) {
                return future.wait_until(until) == std::future_status::ready;
            },
            std::chrono::duration_cast<Clock::duration>(tunables_.phase_timeout), activity);
        if (!ready) {
            throw std::runtime_error("Timed out " + std::string(activity));
        }
        return future.get();
    }

    // ---- Queues ----

    /// Bounded queue; maxsize 0 uses the configured queue_size.
    std::shared_ptr<ItemQueue> NewQueue(std::string name, size_t maxsize = 0) const;

    void SetCollectQueue(std::shared_ptr<ItemQueue> queue);
    std::shared_ptr<ItemQueue> collect_queue() const;

    // ---- Item discovery ----

    /// Called once every item has been loaded.
    void SetItemsKnown(size_t items_count, absl::flat_hash_map<std::string, size_t> modulemd_count_per_dest);
    bool items_known() const;
    size_t items_count() const;
    /// Number of module items destined for dest; 0 until items are known
    size_t ModulemdCount(const std::string& dest) const;

    // ---- Progress ----

    /// Registers a stage's progress counters; the reference stays valid for the context's lifetime.
    ProgressInfo& NewProgress(std::string name);
    /// One line per stage: name, items in, items out, out of the total if known
    std::string FormatProgress() const;

private:
    PipelineTunables tunables_;

    std::atomic<bool> has_error_{false};

    mutable absl::Mutex mu_;
    std::string error_phase_ ABSL_GUARDED_BY(mu_);
    std::exception_ptr error_exception_ ABSL_GUARDED_BY(mu_);
    std::shared_ptr<ItemQueue> collect_queue_ ABSL_GUARDED_BY(mu_);
    bool items_known_ ABSL_GUARDED_BY(mu_) = false;
    size_t items_count_ ABSL_GUARDED_BY(mu_) = 0;
    absl::flat_hash_map<std::string, size_t> modulemd_count_per_dest_ ABSL_GUARDED_BY(mu_);
    std::vector<std::unique_ptr<ProgressInfo>> progress_ ABSL_GUARDED_BY(mu_);
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_CONTEXT_H_
