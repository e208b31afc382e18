#include "push_item.h"

#include <sstream>

#include <absl/strings/str_join.h>

#include "../common/checksum.h"

namespace Pushline {

namespace {

struct ItemKindEntry {
    ItemKind kind;
    std::string_view name;
};

constexpr ItemKindEntry kItemKinds[] = {
    {ItemKind::kRpm, "rpm"},
    {ItemKind::kFile, "file"},
    {ItemKind::kErratum, "erratum"},
    {ItemKind::kModulemd, "modulemd"},
    {ItemKind::kComps, "comps"},
    {ItemKind::kProductId, "productid"},
};

} // namespace

std::string_view ItemKindName(ItemKind kind) {
    for (const auto& entry : kItemKinds) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<ItemKind> ParseItemKind(std::string_view name) {
    for (const auto& entry : kItemKinds) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

PushItem PushItem::WithChecksums() const {
    if (has_checksums() || src.empty()) {
        return *this;
    }
    FileChecksums sums = ComputeFileChecksums(src);
    PushItem out = *this;
    out.md5sum = sums.md5sum;
    out.sha256sum = sums.sha256sum;
    return out;
}

std::string PushItem::DebugString() const {
    std::ostringstream out;
    out << "PushItem(kind=" << ItemKindName(kind) << ", name='" << name << "'";
    if (!src.empty()) out << ", src='" << src << "'";
    out << ", dest=[" << absl::StrJoin(dest, ", ") << "]";
    if (!sha256sum.empty()) out << ", sha256sum='" << sha256sum << "'";
    if (!signing_key.empty()) out << ", signing_key='" << signing_key << "'";
    out << ", state='" << state << "')";
    return out.str();
}

} // namespace Pushline
