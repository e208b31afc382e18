#include "upload.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "../common/config.h"

namespace Pushline {

Upload::Upload(Context& context, std::shared_ptr<RemoteClient> client, bool pre_push,
               std::string rpm_upload_repo, std::shared_ptr<ItemQueue> in_queue)
    : Phase(context, std::move(in_queue), "Upload items"),
      client_(std::move(client)),
      pre_push_(pre_push),
      rpm_upload_repo_(std::move(rpm_upload_repo)),
      pool_(context.tunables().out_max_futures, "upload") {}

std::shared_ptr<UploadContext> Upload::ContextFor(ItemKind kind) {
    auto it = upload_contexts_.find(kind);
    if (it != upload_contexts_.end()) {
        return it->second;
    }
    auto ctx = std::make_shared<UploadContext>(client_, kind == ItemKind::kRpm ? rpm_upload_repo_ : "");
    upload_contexts_.emplace(kind, ctx);
    return ctx;
}

void Upload::Run() {
    size_t present = 0;
    size_t uploading = 0;
    size_t prepush_skipped = 0;

    ContentItemPtr item;
    while (NextInput(&item)) {
        if (IsPresentState(item->state())) {
            ++present;
            PutOutput(item->WithPushState(kStateExists));
        } else if (pre_push_ && !item->can_pre_push()) {
            ++prepush_skipped;
            PutOutput(item);
        } else {
            ++uploading;
            auto ctx = ContextFor(item->kind());
            PutFutureOutput(pool_.ExecuteAsync([item, ctx]() {
                return item->EnsureUploaded(*ctx)->WithPushState(kStateExists);
            }));
        }
    }

    std::string message = absl::StrCat(present, " already present, ", uploading, " uploading");
    if (pre_push_) {
        absl::StrAppend(&message, ", ", prepush_skipped, " skipped during pre-push");
    }
    LOG(INFO) << "Upload items: " << message;
}

} // namespace Pushline
