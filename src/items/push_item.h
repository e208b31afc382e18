#ifndef PUSHLINE_ITEMS_PUSH_ITEM_H_
#define PUSHLINE_ITEMS_PUSH_ITEM_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../common/config.h"
#include "../remote/model.h"

namespace Pushline {

/// Kinds of push item this tool knows how to push
enum class ItemKind {
    kRpm,
    kFile,
    kErratum,
    kModulemd,
    kComps,
    kProductId,
};

std::string_view ItemKindName(ItemKind kind);
std::optional<ItemKind> ParseItemKind(std::string_view name);

/**
 * Desired description of one artifact as read from a content source.
 *
 * Treated as immutable once loaded; stages produce modified copies.
 */
struct PushItem {
    ItemKind kind = ItemKind::kFile;
    std::string name;
    std::string src;
    std::vector<std::string> dest;
    std::string origin;
    std::string md5sum;
    std::string sha256sum;
    std::string signing_key;
    // Lifecycle label reported to the item-state sink
    std::string state = kStatePending;

    // file
    std::string description;
    std::string version;
    std::optional<double> display_order;

    // erratum
    ErratumFields erratum;

    bool operator==(const PushItem&) const = default;

    bool has_checksums() const { return !md5sum.empty() && !sha256sum.empty(); }

    /// Copy with md5sum and sha256sum filled in from src, if missing.
    /// @throws std::system_error if src cannot be read
    PushItem WithChecksums() const;

    std::string DebugString() const;
};

} // namespace Pushline

#endif // PUSHLINE_ITEMS_PUSH_ITEM_H_
