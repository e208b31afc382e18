#include "progress.h"

#include <glog/logging.h>

namespace Pushline {

ProgressLogger::ProgressLogger(const Context& context, absl::Duration interval)
    : context_(context), interval_(interval) {}

ProgressLogger::~ProgressLogger() {
    Stop();
}

void ProgressLogger::Start() {
    if (interval_ <= absl::ZeroDuration() || thread_.joinable()) {
        return;
    }
    thread_ = std::thread(&ProgressLogger::Loop, this);
}

void ProgressLogger::Stop() {
    if (!thread_.joinable()) {
        return;
    }
    {
        absl::MutexLock lock(&mu_);
        stopping_ = true;
    }
    thread_.join();
    LOG(INFO) << context_.FormatProgress();
}

void ProgressLogger::Loop() {
    absl::MutexLock lock(&mu_);
    while (!stopping_) {
        LOG(INFO) << context_.FormatProgress();
        mu_.AwaitWithTimeout(absl::Condition(&stopping_), interval_);
    }
}

} // namespace Pushline
