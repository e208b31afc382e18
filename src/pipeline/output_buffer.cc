#include "output_buffer.h"

#include <stdexcept>

#include <glog/logging.h>

namespace Pushline {

namespace {

constexpr char kAwaitActivity[] = "waiting for completion of futures";

} // namespace

bool OutputBuffer::PendingResult::WaitUntil(Clock::time_point until) const {
    if (item.valid()) {
        return item.wait_until(until) == std::future_status::ready;
    }
    return batch.wait_until(until) == std::future_status::ready;
}

void OutputBuffer::PendingResult::MoveResultTo(ItemBatch* out) {
    if (item.valid()) {
        out->push_back(item.get());
        return;
    }
    ItemBatch items = batch.get();
    out->insert(out->end(), items.begin(), items.end());
}

OutputBuffer::OutputBuffer(const Context& context, std::shared_ptr<ItemQueue> queue,
                           size_t flush_threshold, Clock::duration flush_interval, size_t max_futures)
    : context_(context),
      queue_(std::move(queue)),
      flush_threshold_(flush_threshold ? flush_threshold : 1),
      flush_interval_(flush_interval),
      max_futures_(max_futures ? max_futures : 1),
      owner_(std::this_thread::get_id()),
      last_flush_(Clock::now()) {}

OutputBuffer::OutputBuffer(const Context& context, std::shared_ptr<ItemQueue> queue)
    : OutputBuffer(context, std::move(queue), context.tunables().out_batch_size,
                   std::chrono::duration_cast<Clock::duration>(context.tunables().out_batch_timeout),
                   context.tunables().out_max_futures) {}

void OutputBuffer::CheckOwner() const {
    if (std::this_thread::get_id() != owner_) {
        throw std::logic_error("OutputBuffer used from a thread other than its owner");
    }
}

void OutputBuffer::Write(ContentItemPtr item) {
    CheckOwner();
    pending_items_.push_back(std::move(item));
    MaybeFlush();
}

void OutputBuffer::WriteFuture(std::future<ContentItemPtr> item) {
    CheckOwner();
    PendingResult result;
    result.item = std::move(item);
    AddFuture(std::move(result));
}

void OutputBuffer::WriteFutureBatch(std::future<ItemBatch> items) {
    CheckOwner();
    PendingResult result;
    result.batch = std::move(items);
    AddFuture(std::move(result));
}

void OutputBuffer::AddFuture(PendingResult result) {
    CollectCompleted();
    while (pending_futures_.size() >= max_futures_) {
        AwaitOne();
        CollectCompleted();
    }
    pending_futures_.push_back(std::move(result));
    MaybeFlush();
}

void OutputBuffer::CollectCompleted() {
    // Results are taken from the front only, so batch order follows write order.
    while (!pending_futures_.empty() && pending_futures_.front().WaitUntil(Clock::now())) {
        PendingResult done = std::move(pending_futures_.front());
        pending_futures_.pop_front();
        done.MoveResultTo(&pending_items_);
    }
}

void OutputBuffer::AwaitOne() {
    if (pending_futures_.empty()) {
        return;
    }
    const PendingResult& oldest = pending_futures_.front();
    bool done = context_.Interruptible(
        [&oldest](Clock::time_point until) { return oldest.WaitUntil(until); },
        std::chrono::duration_cast<Clock::duration>(context_.tunables().phase_timeout), kAwaitActivity);
    if (!done) {
        throw std::runtime_error(std::string("Timed out ") + kAwaitActivity);
    }
}

void OutputBuffer::MaybeFlush() {
    CollectCompleted();
    if (pending_items_.size() >= flush_threshold_ || Clock::now() - last_flush_ >= flush_interval_) {
        Flush(false);
    }
}

void OutputBuffer::Flush(bool await_futures) {
    CheckOwner();
    if (await_futures) {
        while (!pending_futures_.empty()) {
            AwaitOne();
            CollectCompleted();
        }
    } else {
        CollectCompleted();
    }

    last_flush_ = Clock::now();
    if (pending_items_.empty()) {
        return;
    }

    ItemBatch batch;
    batch.swap(pending_items_);
    if (on_flush_) {
        on_flush_(batch);
    }
    if (queue_) {
        queue_->Put(context_, std::move(batch));
    }
}

void OutputBuffer::Cancel() {
    if (!pending_items_.empty() || !pending_futures_.empty()) {
        VLOG(1) << "\t[OutputBuffer]\tdiscarding " << pending_items_.size() << " item(s) and "
                << pending_futures_.size() << " outstanding result(s)";
    }
    pending_items_.clear();
    pending_futures_.clear();
}

} // namespace Pushline
