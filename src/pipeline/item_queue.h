#ifndef PUSHLINE_PIPELINE_ITEM_QUEUE_H_
#define PUSHLINE_PIPELINE_ITEM_QUEUE_H_

#include <atomic>
#include <optional>
#include <string>

#include "folly/MPMCQueue.h"

#include "../items/content_item.h"
#include "context.h"

namespace Pushline {

/**
 * Bounded channel of item batches between two stages.
 *
 * Each element is a non-empty batch, or std::nullopt marking end of stream.
 * Uses folly::MPMCQueue; Collect's queue has many producers, every other
 * queue has exactly one producer and one consumer.
 */
class ItemQueue {
public:
    ItemQueue(std::string name, size_t capacity);

    ItemQueue(const ItemQueue&) = delete;
    ItemQueue& operator=(const ItemQueue&) = delete;

    /**
     * Puts a batch, blocking while the queue is full.
     * @throws PhaseInterrupted, or std::runtime_error after phase_timeout
     */
    void Put(const Context& context, ItemBatch batch);

    /// Puts the end-of-stream sentinel.
    void PutFinished(const Context& context);

    /**
     * Takes the next element, waiting at most timeout.
     * @return false on timeout; *out is nullopt when the sentinel was taken
     * @throws PhaseInterrupted
     */
    bool Get(const Context& context, std::optional<ItemBatch>* out, Clock::duration timeout);

    /// Non-blocking Put used by tests and by stages which know there is room
    bool TryPut(std::optional<ItemBatch> element);

    const std::string& name() const { return name_; }
    size_t capacity() const { return queue_.capacity(); }
    /// Approximate number of queued elements
    size_t size() const;
    /// Items (not batches) put and taken so far
    size_t put_count() const { return put_count_.load(std::memory_order_relaxed); }
    size_t get_count() const { return get_count_.load(std::memory_order_relaxed); }

private:
    void PutElement(const Context& context, std::optional<ItemBatch> element);

    std::string name_;
    folly::MPMCQueue<std::optional<ItemBatch>> queue_;
    std::atomic<size_t> put_count_{0};
    std::atomic<size_t> get_count_{0};
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_ITEM_QUEUE_H_
