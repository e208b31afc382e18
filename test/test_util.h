#ifndef PUSHLINE_TEST_TEST_UTIL_H_
#define PUSHLINE_TEST_TEST_UTIL_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <absl/synchronization/mutex.h>

#include "../src/common/configuration.h"
#include "../src/items/content_item.h"
#include "../src/items/push_item.h"
#include "../src/pipeline/context.h"
#include "../src/pipeline/item_queue.h"
#include "../src/source/item_sink.h"

namespace Pushline {
namespace testing_util {

/// Sink remembering every update in arrival order
class RecordingSink : public ItemSink {
public:
    void UpdatePushItems(const std::vector<PushItem>& items) override {
        absl::MutexLock lock(&mu_);
        for (const auto& item : items) {
            updates_.push_back(item);
        }
    }

    void Finish() override {
        absl::MutexLock lock(&mu_);
        ++finish_calls_;
    }

    std::vector<PushItem> updates() const {
        absl::MutexLock lock(&mu_);
        return updates_;
    }

    int finish_calls() const {
        absl::MutexLock lock(&mu_);
        return finish_calls_;
    }

    /// Index of the first update of name carrying state, or -1
    int IndexOf(const std::string& name, const std::string& state) const {
        absl::MutexLock lock(&mu_);
        for (size_t i = 0; i < updates_.size(); ++i) {
            if (updates_[i].name == name && updates_[i].state == state) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    /// Latest state reported for name, or empty
    std::string LastState(const std::string& name) const {
        absl::MutexLock lock(&mu_);
        std::string state;
        for (const auto& item : updates_) {
            if (item.name == name) {
                state = item.state;
            }
        }
        return state;
    }

private:
    mutable absl::Mutex mu_;
    std::vector<PushItem> updates_ ABSL_GUARDED_BY(mu_);
    int finish_calls_ ABSL_GUARDED_BY(mu_) = 0;
};

/// Tunables with short waits so tests finish quickly
inline PipelineTunables FastTunables() {
    PipelineTunables t;
    t.queue_size = 10;
    t.batch_size = 100;
    t.batch_timeout = Seconds(0.01);
    t.batch_max_timeout = Seconds(0.05);
    t.out_batch_size = 10;
    t.out_batch_timeout = Seconds(0.05);
    t.out_max_futures = 4;
    t.phase_timeout = Seconds(30);
    t.interrupt_interval = Seconds(0.05);
    return t;
}

/// Every item read from queue until its sentinel (or a second of silence)
inline ItemBatch DrainQueue(const Context& context, ItemQueue& queue) {
    ItemBatch items;
    std::optional<ItemBatch> element;
    while (queue.Get(context, &element, std::chrono::seconds(1)) && element) {
        items.insert(items.end(), element->begin(), element->end());
    }
    return items;
}

inline PushItem MakeRpm(const std::string& name, const std::string& sha, std::vector<std::string> dest,
                        const std::string& signing_key = "F21541EB") {
    PushItem item;
    item.kind = ItemKind::kRpm;
    item.name = name;
    item.src = "/staged/" + name;
    item.dest = std::move(dest);
    item.sha256sum = sha;
    item.md5sum = "md5-" + sha;
    item.signing_key = signing_key;
    return item;
}

inline PushItem MakeModulemd(const std::string& name, const std::string& sha, std::vector<std::string> dest) {
    PushItem item;
    item.kind = ItemKind::kModulemd;
    item.name = name;
    item.src = "/staged/" + name;
    item.dest = std::move(dest);
    item.sha256sum = sha;
    item.md5sum = "md5-" + sha;
    return item;
}

inline PushItem MakeFile(const std::string& name, const std::string& sha, std::vector<std::string> dest,
                         const std::string& description = "") {
    PushItem item;
    item.kind = ItemKind::kFile;
    item.name = name;
    item.src = "/staged/" + name;
    item.dest = std::move(dest);
    item.sha256sum = sha;
    item.md5sum = "md5-" + sha;
    item.description = description;
    return item;
}

inline PushItem MakeErratum(const std::string& id, std::vector<std::string> dest, const std::string& title) {
    PushItem item;
    item.kind = ItemKind::kErratum;
    item.name = id;
    item.dest = std::move(dest);
    item.erratum.title = title;
    item.erratum.severity = "Low";
    return item;
}

} // namespace testing_util
} // namespace Pushline

#endif // PUSHLINE_TEST_TEST_UTIL_H_
