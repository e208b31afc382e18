#ifndef PUSHLINE_PIPELINE_END_PUSH_H_
#define PUSHLINE_PIPELINE_END_PUSH_H_

#include "phase.h"

namespace Pushline {

/**
 * Terminates a push which stops before Publish (skip-publish).
 *
 * Drains its input so that every earlier stage has completed, reports the
 * final state of each item and logs how many items reached the remote
 * service.
 */
class EndPush : public Phase {
public:
    EndPush(Context& context, std::shared_ptr<ItemQueue> in_queue);

    size_t present_count() const { return present_; }
    size_t pending_count() const { return pending_; }

protected:
    EndPush(Context& context, std::shared_ptr<ItemQueue> in_queue, std::string name, std::string label);

    void Run() override;
    ProgressType progress_type() const override { return ProgressType::kNone; }

private:
    std::string label_;
    size_t present_ = 0;
    size_t pending_ = 0;
};

/// Terminates a pre-push, which stops after Upload.
class EndPrePush : public EndPush {
public:
    EndPrePush(Context& context, std::shared_ptr<ItemQueue> in_queue);
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_END_PUSH_H_
