#include "associate.h"

#include <algorithm>
#include <map>
#include <random>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <glog/logging.h>

#include "../common/configuration.h"

namespace Pushline {

namespace {

// Source repositories are picked at random to spread load across them.
const std::string& PickSource(const std::vector<std::string>& repos) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, repos.size() - 1);
    return repos[pick(rng)];
}

void CopyMissing(RemoteClient& client, const ItemBatch& items, const CopyOptions& options) {
    const auto type = items.front()->unit_type();

    std::map<std::pair<std::string, std::string>, std::vector<Criteria>> copies;
    for (const auto& item : items) {
        auto in_repos = item->InRepos();
        if (in_repos.empty()) {
            throw std::runtime_error("Cannot associate " + item->push_item().name + ": not present in any repository");
        }
        for (const auto& dest : item->MissingRepos()) {
            copies[{PickSource(in_repos), dest}].push_back(item->criteria());
        }
    }

    std::vector<std::pair<std::string, std::future<std::vector<Task>>>> pending;
    for (auto& [repos, criteria] : copies) {
        const auto& [src, dest] = repos;
        Criteria crit = Criteria::Or(std::move(criteria));
        if (type) {
            crit = Criteria::And({Criteria::WithUnitType(*type), crit});
        }
        LOG(INFO) << "Copy " << src << " => " << dest << ": started";
        pending.emplace_back(absl::StrCat(src, " => ", dest), client.CopyContent(src, dest, crit, options));
    }
    for (auto& [label, copy] : pending) {
        size_t units = 0;
        for (const auto& task : copy.get()) {
            units += task.units.size();
        }
        LOG(INFO) << "Copy " << label << ": " << units << " unit(s)";
    }
}

} // namespace

Associate::Associate(Context& context, std::shared_ptr<RemoteClient> client, bool allow_unsigned,
                     std::shared_ptr<ItemQueue> in_queue)
    : Phase(context, std::move(in_queue), "Associate items"),
      client_(std::move(client)),
      copy_options_{!allow_unsigned},
      retries_(GetConfig().config().associate.retries.get()),
      pool_(context.tunables().out_max_futures, "associate") {}

ItemBatch Associate::AssociateItems(RemoteClient& client, const ItemBatch& items, const CopyOptions& options,
                                    int retries) {
    ItemBatch current = items;
    for (int attempt = 0;; ++attempt) {
        std::vector<size_t> missing_index;
        for (size_t i = 0; i < current.size(); ++i) {
            if (!current[i]->MissingRepos().empty()) {
                missing_index.push_back(i);
            }
        }
        if (missing_index.empty()) {
            return current;
        }
        if (attempt > retries) {
            const auto& item = current[missing_index.front()];
            throw ConfirmationError(absl::StrCat(
                "Fatal error: remote unit not present in repo(s) ", absl::StrJoin(item->MissingRepos(), ", "),
                " after copy: ", item->unit() ? item->unit()->DebugString() : item->DebugString()));
        }
        if (attempt > 0) {
            LOG(WARNING) << "Retrying association for " << missing_index.size() << " item(s). Attempt "
                         << attempt << "/" << retries;
        }

        ItemBatch missing;
        missing.reserve(missing_index.size());
        for (size_t i : missing_index) {
            missing.push_back(current[i]);
        }
        CopyMissing(client, missing, options);

        // Single kind, so the refreshed items keep their order.
        auto refreshed = ContentItem::ItemsWithRemoteState(client, missing);
        for (size_t k = 0; k < missing_index.size(); ++k) {
            current[missing_index[k]] = refreshed[k];
        }
    }
}

bool Associate::ShouldDefer(const ContentItem& item) const {
    if (item.kind() != ItemKind::kRpm) {
        return false;
    }
    if (!context_.items_known()) {
        return true;
    }
    for (const auto& dest : item.push_item().dest) {
        auto it = modulemd_associated_per_dest_.find(dest);
        size_t associated = it == modulemd_associated_per_dest_.end() ? 0 : it->second;
        if (associated < context_.ModulemdCount(dest)) {
            return true;
        }
    }
    return false;
}

void Associate::RecordAssociated(const ItemBatch& items) {
    for (const auto& item : items) {
        if (item->kind() == ItemKind::kModulemd) {
            for (const auto& dest : item->push_item().dest) {
                ++modulemd_associated_per_dest_[dest];
            }
        }
    }
}

void Associate::AssociateBatch(const ItemBatch& batch) {
    NotifyStarted();
    for (const auto& group : ItemsByKind(batch)) {
        ItemBatch to_copy;
        for (const auto& item : group) {
            if (item->MissingRepos().empty()) {
                PutOutput(item);
            } else {
                to_copy.push_back(item);
            }
        }
        if (to_copy.empty()) {
            continue;
        }
        auto client = client_;
        auto options = copy_options_;
        auto retries = retries_;
        PutFutureOutputs(pool_.ExecuteAsync([client, to_copy, options, retries]() {
            return AssociateItems(*client, to_copy, options, retries);
        }));
    }
}

void Associate::Run() {
    ItemBatch deferred;
    ItemBatch batch;
    while (NextInputBatch(&batch)) {
        ItemBatch now;
        for (const auto& item : batch) {
            if (ShouldDefer(*item)) {
                deferred.push_back(item);
            } else {
                now.push_back(item);
            }
        }
        VLOG(1) << "\t[Associate]\t\t" << now.size() << " now, " << deferred.size() << " later";
        if (!now.empty()) {
            AssociateBatch(now);
            RecordAssociated(now);
        }
    }

    // Module items are placed into their repositories during upload, so every
    // module is in place once input is exhausted.
    const size_t batch_size = context_.tunables().batch_size;
    for (size_t i = 0; i < deferred.size(); i += batch_size) {
        size_t end = std::min(deferred.size(), i + batch_size);
        AssociateBatch(ItemBatch(deferred.begin() + i, deferred.begin() + end));
    }
    NotifyStarted();
}

} // namespace Pushline
