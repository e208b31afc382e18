#include "direct_item.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

namespace Pushline {

std::vector<std::string> DirectUploadItem::InRepos() const {
    std::vector<std::string> repos = uploaded_repos_;
    std::sort(repos.begin(), repos.end());
    return repos;
}

Unit DirectUploadItem::DesiredUnit() const {
    Unit unit;
    unit.type = upload_type();
    unit.name = push_item_.name;
    unit.sha256sum = push_item_.sha256sum;
    unit.md5sum = push_item_.md5sum;
    return unit;
}

ContentItemPtr DirectUploadItem::EnsureUploaded(UploadContext& ctx) const {
    std::vector<std::pair<std::string, std::future<std::vector<Task>>>> uploads;
    for (const auto& repo_id : push_item_.dest) {
        VLOG(1) << "Uploading " << push_item_.name << " to " << repo_id;
        uploads.emplace_back(repo_id, UploadToRepo(ctx.client(), repo_id));
    }

    auto out = std::static_pointer_cast<DirectUploadItem>(Clone());
    for (auto& [repo_id, upload] : uploads) {
        auto tasks = upload.get();
        bool have_unit = std::any_of(tasks.begin(), tasks.end(),
                                     [](const Task& task) { return !task.units.empty(); });
        if (!have_unit) {
            throw ConfirmationError(absl::StrCat(
                "item supposedly uploaded successfully, but remains missing from the remote service:\n  ",
                DebugString(), " (repository ", repo_id, ")"));
        }
        out->uploaded_repos_.push_back(repo_id);
    }
    out->state_ = ItemState::kInRepos;
    return out;
}

} // namespace Pushline
