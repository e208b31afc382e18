#include "publish.h"

#include <absl/container/btree_set.h>
#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_join.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>
#include <glog/logging.h>

#include "../common/config.h"

namespace Pushline {

Publish::Publish(Context& context, std::shared_ptr<RemoteClient> client, PublishOptions options,
                 std::shared_ptr<ItemQueue> in_queue)
    : Phase(context, std::move(in_queue), "Publish", /*has_output=*/false),
      client_(std::move(client)),
      options_(options) {}

void Publish::PublishRepositories(const std::vector<std::string>& repo_ids) {
    auto found = context_.AwaitResult(client_->SearchRepository(Criteria::WithId(repo_ids)),
                                      "searching repositories to publish");
    absl::flat_hash_set<std::string> found_ids;
    for (const auto& repo : found) {
        found_ids.insert(repo.id);
    }
    std::vector<std::string> missing;
    for (const auto& id : repo_ids) {
        if (!found_ids.contains(id)) {
            missing.push_back(id);
        }
    }
    if (!missing.empty()) {
        throw std::runtime_error("Repository not found: " + absl::StrJoin(missing, ", "));
    }

    std::vector<std::pair<std::string, std::future<std::vector<Task>>>> publishes;
    for (const auto& id : repo_ids) {
        LOG(INFO) << "Publishing " << id;
        publishes.emplace_back(id, client_->Publish(id, options_));
    }
    for (auto& [id, publish] : publishes) {
        context_.AwaitResult(std::move(publish), "publishing " + id);
        LOG(INFO) << "Published " << id;
    }
}

void Publish::MarkPublished(std::vector<Unit> units) {
    if (units.empty()) {
        return;
    }
    const std::string now = absl::FormatTime(absl::RFC3339_sec, absl::Now(), absl::UTCTimeZone());
    std::vector<std::future<void>> updates;
    updates.reserve(units.size());
    for (auto& unit : units) {
        unit.cdn_published = now;
        updates.push_back(client_->UpdateContent(unit));
    }
    for (auto& update : updates) {
        context_.AwaitResult(std::move(update), "setting publish time on units");
    }
    VLOG(1) << "\t[Publish]\t\tset publish time on " << units.size() << " unit(s)";
}

void Publish::Run() {
    absl::btree_set<std::string> repo_ids;
    absl::flat_hash_set<std::string> unpublished_ids;
    std::vector<Unit> unpublished;
    ItemBatch all_items;

    ItemBatch batch;
    while (NextInputBatch(&batch)) {
        for (const auto& item : batch) {
            for (const auto& repo : item->PublishRepos()) {
                repo_ids.insert(repo);
            }
            const auto& unit = item->unit();
            if (unit && (unit->type == UnitType::kRpm || unit->type == UnitType::kFile) && !unit->cdn_published &&
                unpublished_ids.insert(unit->unit_id).second) {
                unpublished.push_back(*unit);
            }
            all_items.push_back(item);
        }
    }

    NotifyStarted();

    if (repo_ids.empty()) {
        LOG(INFO) << "Publish: no repositories to publish";
    } else {
        PublishRepositories(std::vector<std::string>(repo_ids.begin(), repo_ids.end()));
    }
    MarkPublished(std::move(unpublished));

    ItemBatch pushed;
    pushed.reserve(all_items.size());
    for (const auto& item : all_items) {
        pushed.push_back(item->WithPushState(kStatePushed));
    }
    UpdatePushItems(pushed);
    for (auto& item : pushed) {
        PutOutput(std::move(item));
    }
}

} // namespace Pushline
