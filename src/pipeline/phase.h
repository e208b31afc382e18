#ifndef PUSHLINE_PIPELINE_PHASE_H_
#define PUSHLINE_PIPELINE_PHASE_H_

#include <deque>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "../items/content_item.h"
#include "context.h"
#include "item_queue.h"
#include "output_buffer.h"

namespace Pushline {

/// When a stage reports itself as started
enum class StartupType {
    kQueue,   // on first input
    kNotify,  // when the stage calls NotifyStarted()
};

/// Whether a stage's counters appear in progress output
enum class ProgressType {
    kQueue,
    kNone,
};

/**
 * One concurrent step of the push pipeline.
 *
 * A phase reads batches from its input queue, writes items through an
 * OutputBuffer onto its output queue and runs Run() on a dedicated thread.
 *
 *   Start()  launches the thread
 *   Stop()   joins it (bounded by phase_timeout)
 *
 * After Run() returns the thread flushes output and puts the end-of-stream
 * sentinel. An exception escaping Run() cancels buffered output; unless it
 * is PhaseInterrupted it is recorded on the context, which interrupts every
 * other stage.
 */
class Phase {
public:
    /**
     * @param in_queue Input, or nullptr for a source stage
     * @param has_output Create a new output queue; false for a sink
     */
    Phase(Context& context, std::shared_ptr<ItemQueue> in_queue, std::string name, bool has_output = true);

    /// Phase writing into an existing queue (or none, if out_queue is nullptr)
    Phase(Context& context, std::shared_ptr<ItemQueue> in_queue, std::shared_ptr<ItemQueue> out_queue,
          std::string name);

    virtual ~Phase();

    Phase(const Phase&) = delete;
    Phase& operator=(const Phase&) = delete;

    void Start();
    void Stop();

    const std::string& name() const { return name_; }
    const std::shared_ptr<ItemQueue>& in_queue() const { return in_queue_; }
    const std::shared_ptr<ItemQueue>& out_queue() const { return out_queue_; }

    /**
     * Fetches the next batch of at most batch_size input items (0: configured
     * batch size). Waits up to phase_timeout for the first item, then up to
     * BatchTimeout() for more.
     * @return false once input is exhausted; stays false afterwards
     * @throws PhaseInterrupted
     */
    bool NextInputBatch(ItemBatch* batch, size_t batch_size = 0);

    /// Single-item form of NextInputBatch.
    bool NextInput(ContentItemPtr* item);

    /**
     * How long to keep collecting input for a batch. Scales from batch_timeout
     * with an empty output queue up to batch_max_timeout with a full one.
     */
    Seconds BatchTimeout() const;

protected:
    virtual void Run() = 0;

    virtual StartupType startup_type() const { return StartupType::kQueue; }
    virtual ProgressType progress_type() const { return ProgressType::kQueue; }
    /// Report every flushed output batch to the Collect stage
    virtual bool updates_push_items() const { return false; }

    /// Called on the stage thread when Run() ends by exception, before buffered output is discarded.
    virtual void OnCancel() {}

    void PutOutput(ContentItemPtr item);
    void PutFutureOutput(std::future<ContentItemPtr> item);
    void PutFutureOutputs(std::future<ItemBatch> items);

    /// Flushes written output now, waiting for outstanding results.
    void FlushOutput();

    void NotifyStarted();

    /// Sends items to the Collect stage, if one is running.
    void UpdatePushItems(const ItemBatch& items);

    Context& context_;

private:
    void ThreadMain();
    void CancelOutput();
    void HandleOutputFlushed(const ItemBatch& batch);

    std::string name_;
    std::shared_ptr<ItemQueue> in_queue_;
    std::shared_ptr<ItemQueue> out_queue_;
    std::unique_ptr<OutputBuffer> out_writer_;
    ProgressInfo* progress_ = nullptr;

    std::deque<ContentItemPtr> input_pending_;
    bool input_finished_ = false;
    bool started_ = false;

    std::thread thread_;
    std::promise<void> done_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_PHASE_H_
