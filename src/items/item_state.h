#ifndef PUSHLINE_ITEMS_ITEM_STATE_H_
#define PUSHLINE_ITEMS_ITEM_STATE_H_

#include <string_view>

namespace Pushline {

/// Reconciliation state of an item against the remote service
enum class ItemState {
    kUnknown,        // not queried yet, or not queryable
    kMissing,        // no matching unit
    kOrphan,         // unit exists in no repository
    kNeedsReupload,  // immutable content differs
    kNeedsUpdate,    // mutable fields differ
    kPartial,        // in some but not all destinations
    kInRepos,        // in all destinations
};

constexpr std::string_view ItemStateName(ItemState state) {
    switch (state) {
        case ItemState::kUnknown: return "UNKNOWN";
        case ItemState::kMissing: return "MISSING";
        case ItemState::kOrphan: return "ORPHAN";
        case ItemState::kNeedsReupload: return "NEEDS_REUPLOAD";
        case ItemState::kNeedsUpdate: return "NEEDS_UPDATE";
        case ItemState::kPartial: return "PARTIAL";
        case ItemState::kInRepos: return "IN_REPOS";
    }
    return "UNKNOWN";
}

/// True if a unit for the item exists in at least one requested repository.
constexpr bool IsPresentState(ItemState state) {
    return state == ItemState::kNeedsUpdate || state == ItemState::kPartial || state == ItemState::kInRepos;
}

} // namespace Pushline

#endif // PUSHLINE_ITEMS_ITEM_STATE_H_
