#include "load_items.h"

#include <algorithm>

#include <absl/strings/match.h>
#include <glog/logging.h>

namespace Pushline {

LoadPushItems::LoadPushItems(Context& context, std::vector<std::unique_ptr<ContentSource>> sources,
                             bool pre_push, bool allow_unsigned)
    : Phase(context, nullptr, "Load push items"),
      sources_(std::move(sources)),
      pre_push_(pre_push),
      allow_unsigned_(allow_unsigned) {}

void LoadPushItems::Run() {
    ItemBatch items;
    absl::flat_hash_map<std::string, size_t> modulemd_count_per_dest;

    for (auto& source : sources_) {
        LOG(INFO) << "Loading items from " << source->description();
        NotifyStarted();

        while (auto push_item = source->Next()) {
            context_.RaiseIfInterrupted("loading push items");

            // Only repository ids are meaningful destinations; paths are not.
            auto& dest = push_item->dest;
            dest.erase(std::remove_if(dest.begin(), dest.end(),
                                      [](const std::string& d) { return d.empty() || absl::StartsWith(d, "/"); }),
                       dest.end());

            auto item = ContentItem::Create(std::move(*push_item));
            if (item->push_item().dest.empty() && !(pre_push_ && item->can_pre_push())) {
                LOG(INFO) << "Skipping item with no destination: " << item->push_item().name;
                continue;
            }

            item->Validate(allow_unsigned_);

            if (item->kind() == ItemKind::kModulemd) {
                for (const auto& repo : item->push_item().dest) {
                    ++modulemd_count_per_dest[repo];
                }
            }
            items.push_back(std::move(item));
        }
    }

    const size_t count = items.size();
    context_.SetItemsKnown(count, std::move(modulemd_count_per_dest));
    LOG(INFO) << "Loaded " << count << " push item(s)";

    for (auto& item : items) {
        PutOutput(std::move(item));
    }
}

} // namespace Pushline
