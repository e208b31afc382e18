#include "end_push.h"

#include <glog/logging.h>

namespace Pushline {

EndPush::EndPush(Context& context, std::shared_ptr<ItemQueue> in_queue)
    : EndPush(context, std::move(in_queue), "End push", "push") {}

EndPush::EndPush(Context& context, std::shared_ptr<ItemQueue> in_queue, std::string name, std::string label)
    : Phase(context, std::move(in_queue), std::move(name), /*has_output=*/false), label_(std::move(label)) {}

void EndPush::Run() {
    ItemBatch batch;
    while (NextInputBatch(&batch)) {
        UpdatePushItems(batch);
        for (const auto& item : batch) {
            if (IsPresentState(item->state())) {
                ++present_;
            } else {
                ++pending_;
            }
        }
    }
    LOG(INFO) << "Ending " << label_ << ". Items in remote: " << present_ << ", pending: " << pending_;
}

EndPrePush::EndPrePush(Context& context, std::shared_ptr<ItemQueue> in_queue)
    : EndPush(context, std::move(in_queue), "End pre-push", "pre-push") {}

} // namespace Pushline
