#ifndef PUSHLINE_SOURCE_ITEM_SINK_H_
#define PUSHLINE_SOURCE_ITEM_SINK_H_

#include <string>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include "../items/push_item.h"

namespace Pushline {

/**
 * Receives lifecycle updates of push items (PENDING, EXISTS, PUSHED).
 *
 * UpdatePushItems is called repeatedly for each item across a push;
 * Finish is called once at shutdown, after the last update.
 */
class ItemSink {
public:
    virtual ~ItemSink() = default;

    virtual void UpdatePushItems(const std::vector<PushItem>& items) = 0;
    virtual void Finish() = 0;
};

/// Logs every update
class LoggingItemSink : public ItemSink {
public:
    void UpdatePushItems(const std::vector<PushItem>& items) override;
    void Finish() override;
};

/**
 * Keeps the latest state of every item and writes them to a YAML file
 * on Finish().
 */
class YamlItemSink : public ItemSink {
public:
    explicit YamlItemSink(std::string path);

    void UpdatePushItems(const std::vector<PushItem>& items) override;

    /// @throws std::runtime_error if the file cannot be written
    void Finish() override;

private:
    std::string path_;
    absl::Mutex mu_;
    // First-seen order; index_ maps name, dest and src to a position
    std::vector<PushItem> items_ ABSL_GUARDED_BY(mu_);
    absl::flat_hash_map<std::string, size_t> index_ ABSL_GUARDED_BY(mu_);
};

} // namespace Pushline

#endif // PUSHLINE_SOURCE_ITEM_SINK_H_
