#include "fake_controller.h"

#include <charconv>
#include <stdexcept>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <glog/logging.h>

#include "../common/worker_pool.h"

namespace Pushline {

namespace {

std::optional<long> ParseVersion(const std::string& version) {
    long value = 0;
    auto [ptr, ec] = std::from_chars(version.data(), version.data() + version.size(), value);
    if (ec != std::errc() || ptr != version.data() + version.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * Client handed out by FakeController. Each call is queued on the client's
 * own pool and executed against the shared controller state.
 */
class FakeClient : public RemoteClient {
public:
    FakeClient(std::shared_ptr<FakeController> controller, size_t num_threads)
        : controller_(std::move(controller)), pool_(num_threads, "fake-remote") {}

    std::future<std::vector<Unit>> SearchContent(const Criteria& criteria) override {
        return pool_.ExecuteAsync([c = controller_, criteria]() { return c->DoSearchContent(criteria); });
    }

    std::future<std::vector<Repository>> SearchRepository(const Criteria& criteria) override {
        return pool_.ExecuteAsync([c = controller_, criteria]() { return c->DoSearchRepository(criteria); });
    }

    std::future<Repository> GetRepository(const std::string& repo_id) override {
        return pool_.ExecuteAsync([c = controller_, repo_id]() { return c->DoGetRepository(repo_id); });
    }

    std::future<std::vector<Task>> Upload(const std::string& repo_id, const UploadRequest& request) override {
        return pool_.ExecuteAsync([c = controller_, repo_id, request]() { return c->DoUpload(repo_id, request); });
    }

    std::future<std::vector<Task>> CopyContent(const std::string& src_repo_id,
                                               const std::string& dest_repo_id,
                                               const Criteria& criteria,
                                               const CopyOptions& options) override {
        return pool_.ExecuteAsync([c = controller_, src_repo_id, dest_repo_id, criteria, options]() {
            return c->DoCopyContent(src_repo_id, dest_repo_id, criteria, options);
        });
    }

    std::future<std::vector<Task>> RemoveContent(const std::string& repo_id, const Criteria& criteria) override {
        return pool_.ExecuteAsync([c = controller_, repo_id, criteria]() { return c->DoRemoveContent(repo_id, criteria); });
    }

    std::future<void> UpdateContent(const Unit& unit) override {
        return pool_.ExecuteAsync([c = controller_, unit]() { c->DoUpdateContent(unit); });
    }

    std::future<std::vector<Task>> Publish(const std::string& repo_id, const PublishOptions& options) override {
        return pool_.ExecuteAsync([c = controller_, repo_id, options]() { return c->DoPublish(repo_id, options); });
    }

private:
    std::shared_ptr<FakeController> controller_;
    WorkerPool pool_;
};

} // namespace

void FakeController::SeedDefaultRepositories() {
    InsertRepository(Repository{"all-rpm-content", "yum", "content/unit/1/client", 0});
    InsertRepository(Repository{"all-iso-content", "iso", "content/unit/2/client", 0});
    InsertRepository(Repository{"redhat-maintenance", "yum", "content/unit/3/client", 0});
}

void FakeController::InsertRepository(Repository repo) {
    absl::MutexLock lock(&mu_);
    std::string id = repo.id;
    repos_[id] = std::move(repo);
}

void FakeController::InsertUnits(std::vector<Unit> units) {
    absl::MutexLock lock(&mu_);
    for (auto& unit : units) {
        if (unit.unit_id.empty()) {
            unit.unit_id = NextUnitId();
        }
        std::sort(unit.repository_memberships.begin(), unit.repository_memberships.end());
        std::string id = unit.unit_id;
        units_[id] = std::move(unit);
    }
}

std::vector<Repository> FakeController::Repositories() const {
    absl::MutexLock lock(&mu_);
    std::vector<Repository> out;
    for (const auto& [id, repo] : repos_) {
        out.push_back(repo);
    }
    return out;
}

std::vector<Unit> FakeController::Units() const {
    absl::MutexLock lock(&mu_);
    std::vector<Unit> out;
    for (const auto& [id, unit] : units_) {
        out.push_back(unit);
    }
    return out;
}

std::vector<Unit> FakeController::UnitsInRepository(const std::string& repo_id) const {
    absl::MutexLock lock(&mu_);
    std::vector<Unit> out;
    for (const auto& [id, unit] : units_) {
        if (unit.InRepository(repo_id)) {
            out.push_back(unit);
        }
    }
    return out;
}

std::vector<std::string> FakeController::PublishHistory() const {
    absl::MutexLock lock(&mu_);
    return publish_history_;
}

std::vector<std::string> FakeController::UploadHistory() const {
    absl::MutexLock lock(&mu_);
    return upload_history_;
}

std::shared_ptr<RemoteClient> FakeController::NewClient(size_t num_threads) {
    return std::make_shared<FakeClient>(shared_from_this(), num_threads);
}

std::string FakeController::NextUnitId() {
    std::string id;
    do {
        id = absl::StrFormat("unit-%06d", next_unit_++);
    } while (units_.contains(id));
    return id;
}

std::string FakeController::NextTaskId() {
    return absl::StrFormat("task-%06d", next_task_++);
}

Repository& FakeController::RequireRepository(const std::string& repo_id) {
    auto it = repos_.find(repo_id);
    if (it == repos_.end()) {
        throw std::runtime_error("Repository id=" + repo_id + " not found");
    }
    return it->second;
}

Unit* FakeController::FindSameContent(const Unit& unit) {
    for (auto& [id, existing] : units_) {
        if (existing.type != unit.type) {
            continue;
        }
        switch (unit.type) {
            case UnitType::kRpm:
                if (existing.sha256sum == unit.sha256sum) return &existing;
                break;
            case UnitType::kErratum:
                if (existing.name == unit.name) return &existing;
                break;
            case UnitType::kFile:
            case UnitType::kModulemd:
            case UnitType::kComps:
            case UnitType::kProductId:
                if (existing.name == unit.name && existing.sha256sum == unit.sha256sum) return &existing;
                break;
        }
    }
    return nullptr;
}

std::vector<Unit> FakeController::DoSearchContent(const Criteria& criteria) {
    absl::MutexLock lock(&mu_);
    std::vector<Unit> out;
    for (const auto& [id, unit] : units_) {
        if (criteria.Matches(unit)) {
            out.push_back(unit);
        }
    }
    VLOG(3) << "\t[FakeController]\tsearch " << criteria.DebugString() << " -> " << out.size() << " unit(s)";
    return out;
}

std::vector<Repository> FakeController::DoSearchRepository(const Criteria& criteria) {
    absl::MutexLock lock(&mu_);
    std::vector<Repository> out;
    for (const auto& [id, repo] : repos_) {
        if (criteria.Matches(repo)) {
            out.push_back(repo);
        }
    }
    return out;
}

Repository FakeController::DoGetRepository(const std::string& repo_id) {
    absl::MutexLock lock(&mu_);
    return RequireRepository(repo_id);
}

std::vector<Task> FakeController::DoUpload(const std::string& repo_id, const UploadRequest& request) {
    absl::MutexLock lock(&mu_);
    RequireRepository(repo_id);

    const Unit& desired = request.unit;
    Unit* unit = FindSameContent(desired);
    if (unit == nullptr) {
        Unit created = desired;
        created.unit_id = NextUnitId();
        created.repository_memberships.clear();
        std::string id = created.unit_id;
        unit = &(units_[id] = std::move(created));
    } else if (desired.type == UnitType::kErratum) {
        // The service keeps the stored advisory unless the version moves forward.
        auto old_version = ParseVersion(unit->version);
        auto new_version = ParseVersion(desired.version);
        if (!old_version || (new_version && *new_version > *old_version)) {
            std::vector<std::string> memberships = std::move(unit->repository_memberships);
            std::string id = unit->unit_id;
            *unit = desired;
            unit->unit_id = id;
            unit->repository_memberships = std::move(memberships);
        } else {
            LOG(WARNING) << "Erratum " << desired.name << " version " << desired.version
                         << " is not newer than " << unit->version << ", keeping stored content";
        }
    } else if (desired.type == UnitType::kFile) {
        unit->description = desired.description;
        unit->version = desired.version;
        unit->display_order = desired.display_order;
        if (!desired.cdn_path.empty()) unit->cdn_path = desired.cdn_path;
        if (desired.cdn_published) unit->cdn_published = desired.cdn_published;
    }

    unit->AddMembership(repo_id);
    upload_history_.push_back(absl::StrCat(repo_id, ":", desired.name));
    return {Task{NextTaskId(), repo_id, {*unit}}};
}

std::vector<Task> FakeController::DoCopyContent(const std::string& src_repo_id,
                                                const std::string& dest_repo_id,
                                                const Criteria& criteria,
                                                const CopyOptions& options) {
    absl::MutexLock lock(&mu_);
    RequireRepository(src_repo_id);
    RequireRepository(dest_repo_id);

    Task task{NextTaskId(), dest_repo_id, {}};
    for (auto& [id, unit] : units_) {
        if (!unit.InRepository(src_repo_id) || !criteria.Matches(unit)) {
            continue;
        }
        if (options.require_signed_rpms && unit.type == UnitType::kRpm && unit.signing_key.empty()) {
            LOG(WARNING) << "Not copying unsigned " << unit.name << " into " << dest_repo_id;
            continue;
        }
        unit.AddMembership(dest_repo_id);
        task.units.push_back(unit);
    }
    return {task};
}

std::vector<Task> FakeController::DoRemoveContent(const std::string& repo_id, const Criteria& criteria) {
    absl::MutexLock lock(&mu_);
    RequireRepository(repo_id);

    Task task{NextTaskId(), repo_id, {}};
    for (auto& [id, unit] : units_) {
        if (unit.InRepository(repo_id) && criteria.Matches(unit)) {
            unit.RemoveMembership(repo_id);
            task.units.push_back(unit);
        }
    }
    return {task};
}

void FakeController::DoUpdateContent(const Unit& unit) {
    absl::MutexLock lock(&mu_);
    auto it = units_.find(unit.unit_id);
    if (it == units_.end()) {
        throw std::runtime_error("Unit id=" + unit.unit_id + " not found");
    }
    Unit& stored = it->second;
    stored.description = unit.description;
    stored.display_order = unit.display_order;
    stored.cdn_path = unit.cdn_path;
    stored.cdn_published = unit.cdn_published;
    if (stored.type == UnitType::kFile) {
        stored.version = unit.version;
    }
}

std::vector<Task> FakeController::DoPublish(const std::string& repo_id, const PublishOptions& options) {
    absl::MutexLock lock(&mu_);
    Repository& repo = RequireRepository(repo_id);
    repo.publish_count++;
    publish_history_.push_back(repo_id);
    VLOG(2) << "\t[FakeController]\tpublished " << repo_id << " (force=" << options.force
            << ", clean=" << options.clean << ")";
    return {Task{NextTaskId(), repo_id, {}}};
}

} // namespace Pushline
