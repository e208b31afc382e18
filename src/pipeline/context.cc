#include "context.h"

#include <sstream>

#include <glog/logging.h>

#include "../common/configuration.h"
#include "item_queue.h"

namespace Pushline {

PipelineTunables PipelineTunables::FromConfig() {
    const auto& pipeline = GetConfig().config().pipeline;
    PipelineTunables t;
    t.queue_size = pipeline.queue_size.get();
    t.batch_size = pipeline.batch_size.get();
    t.batch_timeout = Seconds(pipeline.batch_timeout.get());
    t.batch_max_timeout = Seconds(pipeline.batch_max_timeout.get());
    t.out_batch_size = pipeline.out_batch_size.get();
    t.out_batch_timeout = Seconds(pipeline.out_batch_timeout.get());
    t.out_max_futures = pipeline.out_max_futures.get();
    t.phase_timeout = Seconds(pipeline.phase_timeout.get());
    t.interrupt_interval = Seconds(pipeline.interrupt_interval.get());
    return t;
}

Context::Context(PipelineTunables tunables) : tunables_(std::move(tunables)) {}

bool Context::SetError(const std::string& phase, std::exception_ptr error) {
    {
        absl::MutexLock lock(&mu_);
        if (has_error_.load(std::memory_order_relaxed)) {
            return false;
        }
        error_phase_ = phase;
        error_exception_ = error;
        has_error_.store(true, std::memory_order_release);
    }
    VLOG(1) << "\t[Context]\t\tfatal error recorded from " << phase;
    return true;
}

std::string Context::error_phase() const {
    absl::MutexLock lock(&mu_);
    return error_phase_;
}

std::exception_ptr Context::error_exception() const {
    absl::MutexLock lock(&mu_);
    return error_exception_;
}

std::string Context::ErrorMessage() const {
    auto error = error_exception();
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

void Context::RaiseIfInterrupted(std::string_view activity) const {
    if (has_error()) {
        throw PhaseInterrupted("Interrupted while " + std::string(activity));
    }
}

std::shared_ptr<ItemQueue> Context::NewQueue(std::string name, size_t maxsize) const {
    return std::make_shared<ItemQueue>(std::move(name), maxsize ? maxsize : tunables_.queue_size);
}

void Context::SetCollectQueue(std::shared_ptr<ItemQueue> queue) {
    absl::MutexLock lock(&mu_);
    collect_queue_ = std::move(queue);
}

std::shared_ptr<ItemQueue> Context::collect_queue() const {
    absl::MutexLock lock(&mu_);
    return collect_queue_;
}

void Context::SetItemsKnown(size_t items_count, absl::flat_hash_map<std::string, size_t> modulemd_count_per_dest) {
    absl::MutexLock lock(&mu_);
    items_count_ = items_count;
    modulemd_count_per_dest_ = std::move(modulemd_count_per_dest);
    items_known_ = true;
}

bool Context::items_known() const {
    absl::MutexLock lock(&mu_);
    return items_known_;
}

size_t Context::items_count() const {
    absl::MutexLock lock(&mu_);
    return items_count_;
}

size_t Context::ModulemdCount(const std::string& dest) const {
    absl::MutexLock lock(&mu_);
    auto it = modulemd_count_per_dest_.find(dest);
    return it == modulemd_count_per_dest_.end() ? 0 : it->second;
}

ProgressInfo& Context::NewProgress(std::string name) {
    absl::MutexLock lock(&mu_);
    progress_.push_back(std::make_unique<ProgressInfo>(std::move(name)));
    return *progress_.back();
}

std::string Context::FormatProgress() const {
    absl::MutexLock lock(&mu_);
    std::string total = items_known_ ? std::to_string(items_count_) : "???";

    size_t name_width = 0;
    for (const auto& info : progress_) {
        name_width = std::max(name_width, info->name().size());
    }

    std::ostringstream out;
    out << "Progress:";
    for (const auto& info : progress_) {
        out << "\n  " << info->name() << std::string(name_width - info->name().size(), ' ')
            << "  in " << info->in_count() << "/" << total << ", out " << info->out_count() << "/" << total;
    }
    return out.str();
}

} // namespace Pushline
