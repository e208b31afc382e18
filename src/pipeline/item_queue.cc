#include "item_queue.h"

#include <glog/logging.h>

namespace Pushline {

ItemQueue::ItemQueue(std::string name, size_t capacity)
    : name_(std::move(name)), queue_(capacity ? capacity : 1) {
    VLOG(3) << "\t[ItemQueue]\t\t" << name_ << " created, capacity " << queue_.capacity();
}

void ItemQueue::Put(const Context& context, ItemBatch batch) {
    if (batch.empty()) {
        return;
    }
    size_t n = batch.size();
    PutElement(context, std::move(batch));
    put_count_.fetch_add(n, std::memory_order_relaxed);
}

void ItemQueue::PutFinished(const Context& context) {
    PutElement(context, std::nullopt);
}

void ItemQueue::PutElement(const Context& context, std::optional<ItemBatch> element) {
    // tryWriteUntil only consumes element when it succeeds.
    bool written = context.Interruptible(
        [this, &element](Clock::time_point until) { return queue_.tryWriteUntil(until, std::move(element)); },
        std::chrono::duration_cast<Clock::duration>(context.tunables().phase_timeout),
        "putting items onto " + name_);
    if (!written) {
        throw std::runtime_error("Timed out putting items onto " + name_);
    }
}

bool ItemQueue::TryPut(std::optional<ItemBatch> element) {
    size_t n = element ? element->size() : 0;
    if (!queue_.write(std::move(element))) {
        return false;
    }
    put_count_.fetch_add(n, std::memory_order_relaxed);
    return true;
}

bool ItemQueue::Get(const Context& context, std::optional<ItemBatch>* out, Clock::duration timeout) {
    bool got = context.Interruptible(
        [this, out](Clock::time_point until) { return queue_.tryReadUntil(until, *out); },
        timeout, "waiting for items from " + name_);
    if (got && out->has_value()) {
        get_count_.fetch_add((*out)->size(), std::memory_order_relaxed);
    }
    return got;
}

size_t ItemQueue::size() const {
    auto guess = queue_.sizeGuess();
    return guess > 0 ? static_cast<size_t>(guess) : 0;
}

} // namespace Pushline
