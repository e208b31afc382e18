#ifndef PUSHLINE_PIPELINE_OUTPUT_BUFFER_H_
#define PUSHLINE_PIPELINE_OUTPUT_BUFFER_H_

#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <thread>

#include "../items/content_item.h"
#include "context.h"
#include "item_queue.h"

namespace Pushline {

/**
 * Write side of a stage.
 *
 * Collects written items and deferred results and puts them onto the output
 * queue as one batch once flush_threshold items are ready or flush_interval
 * has passed since the last flush. At most max_futures deferred results may
 * be outstanding; writing another blocks until one completes.
 *
 * Only the owning stage thread may call into the buffer.
 */
class OutputBuffer {
public:
    /// Invoked on the owning thread with every non-empty flushed batch
    using FlushCallback = std::function<void(const ItemBatch&)>;

    /**
     * @param queue Output queue, or nullptr to discard output
     */
    OutputBuffer(const Context& context, std::shared_ptr<ItemQueue> queue,
                 size_t flush_threshold, Clock::duration flush_interval, size_t max_futures);

    /// Buffer configured from the context's tunables
    OutputBuffer(const Context& context, std::shared_ptr<ItemQueue> queue);

    OutputBuffer(const OutputBuffer&) = delete;
    OutputBuffer& operator=(const OutputBuffer&) = delete;

    void SetOwnerThread(std::thread::id owner) { owner_ = owner; }
    void SetFlushCallback(FlushCallback callback) { on_flush_ = std::move(callback); }

    void Write(ContentItemPtr item);
    void WriteFuture(std::future<ContentItemPtr> item);
    void WriteFutureBatch(std::future<ItemBatch> items);

    /**
     * Puts buffered items onto the queue. With await_futures, first waits for
     * every outstanding deferred result; otherwise only completed ones are
     * included. Rethrows the exception of any failed deferred result.
     */
    void Flush(bool await_futures = true);

    /// Discards buffered items and abandons outstanding deferred results.
    void Cancel();

    size_t pending_items() const { return pending_items_.size(); }
    size_t pending_futures() const { return pending_futures_.size(); }

private:
    struct PendingResult {
        std::future<ContentItemPtr> item;
        std::future<ItemBatch> batch;

        bool WaitUntil(Clock::time_point until) const;
        void MoveResultTo(ItemBatch* out);
    };

    void CheckOwner() const;
    void AddFuture(PendingResult result);
    /// Moves results of completed futures into pending_items_, keeping write order.
    void CollectCompleted();
    /// Waits until the oldest outstanding result completes.
    void AwaitOne();
    void MaybeFlush();

    const Context& context_;
    std::shared_ptr<ItemQueue> queue_;
    size_t flush_threshold_;
    Clock::duration flush_interval_;
    size_t max_futures_;
    std::thread::id owner_;
    FlushCallback on_flush_;

    ItemBatch pending_items_;
    std::deque<PendingResult> pending_futures_;
    Clock::time_point last_flush_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_OUTPUT_BUFFER_H_
