#ifndef PUSHLINE_PIPELINE_PROGRESS_H_
#define PUSHLINE_PIPELINE_PROGRESS_H_

#include <thread>

#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>
#include <absl/time/time.h>

#include "context.h"

namespace Pushline {

/**
 * Logs the context's per-stage progress every interval while running, and
 * once more when stopped. A non-positive interval disables logging.
 */
class ProgressLogger {
public:
    ProgressLogger(const Context& context, absl::Duration interval);
    ~ProgressLogger();

    ProgressLogger(const ProgressLogger&) = delete;
    ProgressLogger& operator=(const ProgressLogger&) = delete;

    void Start();
    void Stop();

private:
    void Loop();

    const Context& context_;
    absl::Duration interval_;
    std::thread thread_;
    absl::Mutex mu_;
    bool stopping_ ABSL_GUARDED_BY(mu_) = false;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_PROGRESS_H_
