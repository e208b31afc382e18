#include "collect.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <glog/logging.h>

namespace Pushline {

namespace {

std::string ItemKey(const ContentItem& item) {
    const auto& p = item.push_item();
    return absl::StrCat(p.name, "\n", absl::StrJoin(p.dest, ","), "\n", p.src);
}

} // namespace

Collect::Collect(Context& context, ItemSink& sink)
    : Phase(context, context.NewQueue("collect"), "Collect push item metadata", /*has_output=*/false),
      sink_(sink) {
    context.SetCollectQueue(in_queue());
}

void Collect::Close() {
    try {
        in_queue()->PutFinished(context_);
    } catch (const PhaseInterrupted& e) {
        // The run already failed; Collect exits through the same interruption.
        VLOG(1) << "\t[Collect]\t\t" << e.what();
    }
}

ItemBatch Collect::Deduplicate(const ItemBatch& batch) {
    ItemBatch out;
    absl::flat_hash_map<std::string, size_t> index;
    for (const auto& item : batch) {
        auto [it, inserted] = index.emplace(ItemKey(*item), out.size());
        if (inserted) {
            out.push_back(item);
        } else {
            out[it->second] = item;
        }
    }
    return out;
}

void Collect::Run() {
    ItemBatch batch;
    while (NextInputBatch(&batch)) {
        auto unique = Deduplicate(batch);
        std::vector<PushItem> push_items;
        push_items.reserve(unique.size());
        for (const auto& item : unique) {
            push_items.push_back(item->push_item());
        }
        sink_.UpdatePushItems(push_items);
    }
}

} // namespace Pushline
