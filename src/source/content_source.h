#ifndef PUSHLINE_SOURCE_CONTENT_SOURCE_H_
#define PUSHLINE_SOURCE_CONTENT_SOURCE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../items/push_item.h"

namespace Pushline {

/**
 * Enumerates push items from somewhere.
 */
class ContentSource {
public:
    virtual ~ContentSource() = default;

    /// Next item, or nullopt once exhausted
    virtual std::optional<PushItem> Next() = 0;

    /// URL or description used in log messages
    virtual std::string description() const = 0;

    /**
     * Opens a source by URL. Supported: "staged:<path to manifest.yaml>".
     * @throws std::invalid_argument for an unsupported URL
     * @throws std::runtime_error if the source cannot be read
     */
    static std::unique_ptr<ContentSource> Open(const std::string& url);
};

/// Source over items held in memory
class StaticSource : public ContentSource {
public:
    explicit StaticSource(std::vector<PushItem> items, std::string description = "static");

    std::optional<PushItem> Next() override;
    std::string description() const override { return description_; }

private:
    std::vector<PushItem> items_;
    size_t next_ = 0;
    std::string description_;
};

/**
 * Items listed in a YAML manifest:
 *
 *   items:
 *     - type: rpm
 *       name: walrus-5.21-1.noarch.rpm
 *       src: rpms/walrus-5.21-1.noarch.rpm
 *       dest: [repo1, repo2]
 *       signing_key: F21541EB
 *
 * Relative src paths are resolved against the manifest's directory. Items
 * of an unknown type are skipped.
 */
class StagedSource : public ContentSource {
public:
    explicit StagedSource(const std::string& manifest_path);

    std::optional<PushItem> Next() override;
    std::string description() const override { return "staged:" + manifest_path_; }

    /// Items skipped for having an unsupported type
    size_t skipped() const { return skipped_; }

private:
    std::string manifest_path_;
    std::vector<PushItem> items_;
    size_t next_ = 0;
    size_t skipped_ = 0;
};

} // namespace Pushline

#endif // PUSHLINE_SOURCE_CONTENT_SOURCE_H_
