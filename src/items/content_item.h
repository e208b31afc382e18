#ifndef PUSHLINE_ITEMS_CONTENT_ITEM_H_
#define PUSHLINE_ITEMS_CONTENT_ITEM_H_

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include "../remote/remote_client.h"
#include "item_state.h"
#include "push_item.h"

namespace Pushline {

class ContentItem;
using ContentItemPtr = std::shared_ptr<const ContentItem>;
using ItemBatch = std::vector<ContentItemPtr>;

/// Input rejected before any remote call was made.
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// The remote service reported success but a follow-up query disagrees.
class ConfirmationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Upload state shared by every item of one kind within an Upload stage.
 */
class UploadContext {
public:
    /**
     * @param client Client used for uploads and confirmation queries
     * @param upload_repo Repository every item of the kind is uploaded into
     *                    first; empty to upload into the item's first destination
     */
    UploadContext(std::shared_ptr<RemoteClient> client, std::string upload_repo = "");

    RemoteClient& client() const { return *client_; }
    const std::string& upload_repo() const { return upload_repo_; }

    /**
     * Starts an upload once per key. Callers presenting a key already seen in
     * this run share the first caller's result instead of uploading again.
     */
    std::shared_future<std::vector<Task>> ShareUpload(
        const std::string& key, const std::function<std::future<std::vector<Task>>()>& start);

private:
    std::shared_ptr<RemoteClient> client_;
    std::string upload_repo_;
    absl::Mutex mu_;
    absl::flat_hash_map<std::string, std::shared_future<std::vector<Task>>> uploads_ ABSL_GUARDED_BY(mu_);
};

/**
 * A push item paired with its reconciliation state and matching remote unit.
 *
 * Instances are immutable; every transition returns a new item. Concrete
 * subclasses supply the per-kind behavior: how to find a matching unit,
 * which unit to upload, and which fields may be updated in place.
 */
class ContentItem : public std::enable_shared_from_this<ContentItem> {
public:
    explicit ContentItem(PushItem push_item) : push_item_(std::move(push_item)) {}
    virtual ~ContentItem() = default;

    /// Handler for the item's kind.
    static ContentItemPtr Create(PushItem push_item);

    const PushItem& push_item() const { return push_item_; }
    ItemState state() const { return state_; }
    const std::optional<Unit>& unit() const { return unit_; }

    virtual ItemKind kind() const = 0;

    /// Type of unit to search for, or nullopt if the kind is never searched
    virtual std::optional<UnitType> unit_type() const = 0;

    /// Whether the item may be uploaded during a pre-push
    virtual bool can_pre_push() const { return false; }

    /// True if obtaining checksums requires reading the source file
    virtual bool blocking_checksums() const;

    /**
     * Rejects content which must not be pushed.
     * @throws ValidationError
     */
    virtual void Validate(bool allow_unsigned) const { (void)allow_unsigned; }

    /// Criteria matching this item's unit (combined with unit_type by callers)
    virtual Criteria criteria() const;

    /**
     * Pairs each item with its unit among units and returns the resulting
     * items in input order. All items must be of the same kind.
     */
    static ItemBatch MatchItemsUnits(const ItemBatch& items, const std::vector<Unit>& units);

    /// Copy of this item with state derived from unit (nullopt: not in the service)
    virtual ContentItemPtr WithUnit(std::optional<Unit> unit) const;

    /// Unit with mutable fields set to their desired values, or nullopt
    virtual std::optional<Unit> UnitForUpdate() const { return std::nullopt; }

    ContentItemPtr WithChecksums() const;
    ContentItemPtr WithPushState(const std::string& label) const;

    /// Repositories the item currently exists in
    virtual std::vector<std::string> InRepos() const;

    /// Destinations the item does not exist in yet, sorted
    std::vector<std::string> MissingRepos() const;

    /// Repositories to publish for this item, sorted
    virtual std::vector<std::string> PublishRepos() const;

    /// Starts an upload of the item's content into repo_id.
    virtual std::future<std::vector<Task>> UploadToRepo(RemoteClient& client, const std::string& repo_id) const;

    /**
     * Uploads the item and confirms it now exists in the service.
     * Blocks on remote calls; run it off the stage thread.
     * @throws ConfirmationError if the item is still missing after upload
     */
    virtual ContentItemPtr EnsureUploaded(UploadContext& ctx) const;

    /**
     * Writes the desired mutable fields and confirms they were applied.
     * Blocks on remote calls; run it off the stage thread.
     * @throws ConfirmationError if actual and desired fields still differ
     */
    ContentItemPtr EnsureUptodate(RemoteClient& client) const;

    /// Copy of this item with unit and state re-read from the service (blocking).
    ContentItemPtr WithRemoteRefreshed(RemoteClient& client) const;

    /// Bulk form of WithRemoteRefreshed, one search per kind (blocking).
    static ItemBatch ItemsWithRemoteState(RemoteClient& client, const ItemBatch& items);

    std::string DebugString() const;

protected:
    virtual std::shared_ptr<ContentItem> Clone() const = 0;

    /// Unit sent with an upload request
    virtual Unit DesiredUnit() const = 0;

    /// Key identifying the item's content among units of its type
    virtual std::string MatchKey() const;
    virtual std::string UnitMatchKey(const Unit& unit) const;

    /// Key under which identical uploads are shared within a run
    virtual std::string UploadKey() const;

    static ItemState StateForUnit(const PushItem& item, const std::optional<Unit>& unit);

    PushItem push_item_;
    ItemState state_ = ItemState::kUnknown;
    std::optional<Unit> unit_;
};

/// Groups items by kind, keeping first-seen kind order and item order.
std::vector<ItemBatch> ItemsByKind(const ItemBatch& items);

} // namespace Pushline

#endif // PUSHLINE_ITEMS_CONTENT_ITEM_H_
