#include "phase.h"

#include <algorithm>

#include <glog/logging.h>

#include "../common/worker_pool.h"

namespace Pushline {

Phase::Phase(Context& context, std::shared_ptr<ItemQueue> in_queue, std::string name, bool has_output)
    : Phase(context, std::move(in_queue), has_output ? context.NewQueue(name + " output") : nullptr, name) {}

Phase::Phase(Context& context, std::shared_ptr<ItemQueue> in_queue, std::shared_ptr<ItemQueue> out_queue,
             std::string name)
    : context_(context),
      name_(std::move(name)),
      in_queue_(std::move(in_queue)),
      out_queue_(std::move(out_queue)),
      out_writer_(std::make_unique<OutputBuffer>(context, out_queue_)) {}

Phase::~Phase() {
    if (thread_.joinable()) {
        LOG(ERROR) << name_ << ": destroyed while running";
        context_.SetError(name_, std::make_exception_ptr(std::logic_error(name_ + ": destroyed while running")));
        thread_.join();
    }
}

void Phase::Start() {
    if (progress_type() == ProgressType::kQueue) {
        progress_ = &context_.NewProgress(name_);
    }
    out_writer_->SetFlushCallback([this](const ItemBatch& batch) { HandleOutputFlushed(batch); });
    thread_ = std::thread(&Phase::ThreadMain, this);
}

void Phase::Stop() {
    if (!thread_.joinable()) {
        return;
    }
    auto done = done_.get_future();
    const auto timeout = context_.tunables().phase_timeout;
    if (done.wait_for(timeout) != std::future_status::ready) {
        // Turning the hang into an error interrupts every blocked wait.
        LOG(ERROR) << name_ << ": did not finish within " << timeout.count() << "s, deadlock suspected";
        context_.SetError(name_, std::make_exception_ptr(
            std::runtime_error(name_ + ": timed out after " + std::to_string(timeout.count()) + "s")));
    }
    thread_.join();
}

void Phase::ThreadMain() {
    CleanupGuard signal_done([this]() { done_.set_value(); });
    out_writer_->SetOwnerThread(std::this_thread::get_id());

    try {
        Run();
        out_writer_->Flush(true);
        LOG(INFO) << name_ << ": finished";
        if (out_queue_) {
            out_queue_->PutFinished(context_);
        }
    } catch (const PhaseInterrupted& e) {
        CancelOutput();
        LOG(WARNING) << name_ << ": interrupted";
        VLOG(1) << name_ << ": " << e.what();
    } catch (const std::exception& e) {
        CancelOutput();
        LOG(ERROR) << name_ << ": fatal error occurred: " << e.what();
        context_.SetError(name_, std::current_exception());
    } catch (...) {
        CancelOutput();
        LOG(ERROR) << name_ << ": fatal error occurred (non-standard exception)";
        context_.SetError(name_, std::current_exception());
    }
}

void Phase::CancelOutput() {
    OnCancel();
    out_writer_->Cancel();
}

void Phase::HandleOutputFlushed(const ItemBatch& batch) {
    if (progress_) {
        progress_->AddOut(batch.size());
    }
    if (updates_push_items()) {
        UpdatePushItems(batch);
    }
}

Seconds Phase::BatchTimeout() const {
    const auto& t = context_.tunables();
    if (!out_queue_ || out_queue_->capacity() == 0) {
        return t.batch_timeout;
    }
    double fullness = std::min(1.0, static_cast<double>(out_queue_->size()) / out_queue_->capacity());
    return t.batch_timeout + (t.batch_max_timeout - t.batch_timeout) * fullness;
}

bool Phase::NextInputBatch(ItemBatch* batch, size_t batch_size) {
    batch->clear();
    if (batch_size == 0) {
        batch_size = context_.tunables().batch_size;
    }
    if (!in_queue_) {
        input_finished_ = true;
    }

    const auto batch_timeout = std::chrono::duration_cast<Clock::duration>(BatchTimeout());
    const auto phase_timeout = std::chrono::duration_cast<Clock::duration>(context_.tunables().phase_timeout);
    auto batch_deadline = Clock::now() + batch_timeout;

    while (batch->size() < batch_size) {
        if (!input_pending_.empty()) {
            batch->push_back(std::move(input_pending_.front()));
            input_pending_.pop_front();
            continue;
        }
        if (input_finished_) {
            break;
        }

        std::optional<ItemBatch> element;
        if (batch->empty()) {
            if (!in_queue_->Get(context_, &element, phase_timeout)) {
                throw std::runtime_error(name_ + ": timed out waiting for input");
            }
            batch_deadline = Clock::now() + batch_timeout;
        } else {
            auto now = Clock::now();
            if (now >= batch_deadline || !in_queue_->Get(context_, &element, batch_deadline - now)) {
                break;
            }
        }

        if (!element) {
            input_finished_ = true;
            continue;
        }
        if (startup_type() == StartupType::kQueue) {
            NotifyStarted();
        }
        if (progress_) {
            progress_->AddIn(element->size());
        }
        input_pending_.insert(input_pending_.end(), element->begin(), element->end());
    }

    return !batch->empty();
}

bool Phase::NextInput(ContentItemPtr* item) {
    ItemBatch batch;
    if (!NextInputBatch(&batch, 1)) {
        return false;
    }
    *item = std::move(batch.front());
    return true;
}

void Phase::PutOutput(ContentItemPtr item) {
    out_writer_->Write(std::move(item));
}

void Phase::PutFutureOutput(std::future<ContentItemPtr> item) {
    out_writer_->WriteFuture(std::move(item));
}

void Phase::PutFutureOutputs(std::future<ItemBatch> items) {
    out_writer_->WriteFutureBatch(std::move(items));
}

void Phase::FlushOutput() {
    out_writer_->Flush(true);
}

void Phase::NotifyStarted() {
    if (!started_) {
        started_ = true;
        LOG(INFO) << name_ << ": started";
    }
}

void Phase::UpdatePushItems(const ItemBatch& items) {
    auto collect = context_.collect_queue();
    if (collect && !items.empty()) {
        collect->Put(context_, items);
    }
}

} // namespace Pushline
