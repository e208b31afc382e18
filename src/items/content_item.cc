#include "content_item.h"

#include <algorithm>

#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

namespace Pushline {

UploadContext::UploadContext(std::shared_ptr<RemoteClient> client, std::string upload_repo)
    : client_(std::move(client)), upload_repo_(std::move(upload_repo)) {}

std::shared_future<std::vector<Task>> UploadContext::ShareUpload(
    const std::string& key, const std::function<std::future<std::vector<Task>>()>& start) {
    absl::MutexLock lock(&mu_);
    auto it = uploads_.find(key);
    if (it != uploads_.end()) {
        VLOG(2) << "\t[UploadContext]\tsharing upload of " << key;
        return it->second;
    }
    auto shared = start().share();
    uploads_.emplace(key, shared);
    return shared;
}

bool ContentItem::blocking_checksums() const {
    return !push_item_.has_checksums() && !push_item_.src.empty();
}

Criteria ContentItem::criteria() const {
    return Criteria::WithField("sha256sum", push_item_.sha256sum);
}

std::string ContentItem::MatchKey() const {
    return push_item_.sha256sum;
}

std::string ContentItem::UnitMatchKey(const Unit& unit) const {
    return unit.sha256sum;
}

std::string ContentItem::UploadKey() const {
    return MatchKey();
}

ItemState ContentItem::StateForUnit(const PushItem& item, const std::optional<Unit>& unit) {
    if (!unit) {
        return ItemState::kMissing;
    }
    if (unit->repository_memberships.empty()) {
        return ItemState::kOrphan;
    }
    for (const auto& repo : item.dest) {
        if (!unit->InRepository(repo)) {
            return ItemState::kPartial;
        }
    }
    return ItemState::kInRepos;
}

ItemBatch ContentItem::MatchItemsUnits(const ItemBatch& items, const std::vector<Unit>& units) {
    ItemBatch out;
    if (items.empty()) {
        return out;
    }
    const ContentItem& first = *items.front();
    auto type = first.unit_type();

    absl::flat_hash_map<std::string, const Unit*> units_by_key;
    for (const auto& unit : units) {
        if (type && unit.type == *type) {
            units_by_key[first.UnitMatchKey(unit)] = &unit;
        }
    }

    out.reserve(items.size());
    for (const auto& item : items) {
        if (item->kind() != first.kind()) {
            throw std::logic_error(absl::StrCat("Cannot match mixed item kinds: ",
                                                ItemKindName(first.kind()), " and ",
                                                ItemKindName(item->kind())));
        }
        auto it = units_by_key.find(item->MatchKey());
        if (it == units_by_key.end()) {
            out.push_back(item->WithUnit(std::nullopt));
        } else {
            out.push_back(item->WithUnit(*it->second));
        }
    }
    return out;
}

ContentItemPtr ContentItem::WithUnit(std::optional<Unit> unit) const {
    auto out = Clone();
    out->state_ = StateForUnit(push_item_, unit);
    out->unit_ = std::move(unit);

    if (out->state_ == ItemState::kPartial || out->state_ == ItemState::kInRepos) {
        auto desired = out->UnitForUpdate();
        if (desired && *desired != *out->unit_) {
            out->state_ = ItemState::kNeedsUpdate;
        }
    }
    return out;
}

ContentItemPtr ContentItem::WithChecksums() const {
    if (push_item_.has_checksums()) {
        return shared_from_this();
    }
    auto out = Clone();
    out->push_item_ = push_item_.WithChecksums();
    return out;
}

ContentItemPtr ContentItem::WithPushState(const std::string& label) const {
    if (push_item_.state == label) {
        return shared_from_this();
    }
    auto out = Clone();
    out->push_item_.state = label;
    return out;
}

std::vector<std::string> ContentItem::InRepos() const {
    if (unit_) {
        return unit_->repository_memberships;
    }
    return {};
}

std::vector<std::string> ContentItem::MissingRepos() const {
    auto present = InRepos();
    absl::flat_hash_set<std::string> have(present.begin(), present.end());
    std::vector<std::string> missing;
    for (const auto& repo : push_item_.dest) {
        if (!have.contains(repo)) {
            missing.push_back(repo);
        }
    }
    std::sort(missing.begin(), missing.end());
    missing.erase(std::unique(missing.begin(), missing.end()), missing.end());
    return missing;
}

std::vector<std::string> ContentItem::PublishRepos() const {
    std::vector<std::string> repos = push_item_.dest;
    std::sort(repos.begin(), repos.end());
    repos.erase(std::unique(repos.begin(), repos.end()), repos.end());
    return repos;
}

std::future<std::vector<Task>> ContentItem::UploadToRepo(RemoteClient& client, const std::string& repo_id) const {
    return client.Upload(repo_id, UploadRequest{push_item_.src, DesiredUnit()});
}

ContentItemPtr ContentItem::EnsureUploaded(UploadContext& ctx) const {
    std::string repo_id = ctx.upload_repo();
    if (repo_id.empty()) {
        if (push_item_.dest.empty()) {
            throw std::runtime_error("Cannot upload " + push_item_.name + ": no destination repository");
        }
        repo_id = push_item_.dest.front();
    }

    auto upload = ctx.ShareUpload(absl::StrCat(UploadKey(), "@", repo_id),
                                  [this, &ctx, &repo_id]() { return UploadToRepo(ctx.client(), repo_id); });
    upload.get();

    auto refreshed = WithRemoteRefreshed(ctx.client());
    if (refreshed->InRepos().empty()) {
        throw ConfirmationError(absl::StrCat(
            "item supposedly uploaded successfully, but remains missing from the remote service:\n  ",
            refreshed->DebugString()));
    }
    if (refreshed->state() == ItemState::kNeedsReupload) {
        throw ConfirmationError(absl::StrCat(
            "item supposedly uploaded successfully, but stored content still differs:\n  item: ",
            refreshed->DebugString(), "\n  current unit: ", refreshed->unit()->DebugString(),
            "\n  desired unit: ", refreshed->DesiredUnit().DebugString()));
    }
    return refreshed;
}

ContentItemPtr ContentItem::EnsureUptodate(RemoteClient& client) const {
    auto desired = UnitForUpdate();
    if (!desired) {
        return shared_from_this();
    }

    LOG(INFO) << "Updating fields on " << push_item_.name;
    client.UpdateContent(*desired).get();

    auto refreshed = WithRemoteRefreshed(client);
    if (refreshed->state() == ItemState::kNeedsUpdate) {
        throw ConfirmationError(absl::StrCat(
            "item supposedly updated successfully, but actual and desired state still differ:\n  item: ",
            refreshed->DebugString(), "\n  current unit: ", refreshed->unit()->DebugString(),
            "\n  desired unit: ", refreshed->UnitForUpdate()->DebugString()));
    }
    return refreshed;
}

ContentItemPtr ContentItem::WithRemoteRefreshed(RemoteClient& client) const {
    auto type = unit_type();
    if (!type) {
        return shared_from_this();
    }
    auto units = client.SearchContent(Criteria::And({Criteria::WithUnitType(*type), criteria()})).get();
    return MatchItemsUnits({shared_from_this()}, units).front();
}

ItemBatch ContentItem::ItemsWithRemoteState(RemoteClient& client, const ItemBatch& items) {
    ItemBatch out;
    out.reserve(items.size());
    for (const auto& group : ItemsByKind(items)) {
        auto type = group.front()->unit_type();
        if (!type) {
            out.insert(out.end(), group.begin(), group.end());
            continue;
        }
        std::vector<Criteria> item_criteria;
        item_criteria.reserve(group.size());
        for (const auto& item : group) {
            item_criteria.push_back(item->criteria());
        }
        auto units = client.SearchContent(
            Criteria::And({Criteria::WithUnitType(*type), Criteria::Or(std::move(item_criteria))})).get();
        auto matched = MatchItemsUnits(group, units);
        out.insert(out.end(), matched.begin(), matched.end());
    }
    return out;
}

std::string ContentItem::DebugString() const {
    return absl::StrCat(ItemKindName(kind()), "Item(state=", ItemStateName(state_), ", ",
                        push_item_.DebugString(), ")");
}

std::vector<ItemBatch> ItemsByKind(const ItemBatch& items) {
    std::vector<ItemBatch> groups;
    absl::flat_hash_map<ItemKind, size_t> index;
    for (const auto& item : items) {
        auto [it, inserted] = index.emplace(item->kind(), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(item);
    }
    return groups;
}

} // namespace Pushline
