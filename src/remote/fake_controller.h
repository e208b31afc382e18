#ifndef PUSHLINE_REMOTE_FAKE_CONTROLLER_H_
#define PUSHLINE_REMOTE_FAKE_CONTROLLER_H_

#include <memory>
#include <string>
#include <vector>

#include <absl/base/thread_annotations.h>
#include <absl/container/btree_map.h>
#include <absl/synchronization/mutex.h>

#include "remote_client.h"

namespace Pushline {

/**
 * In-memory remote service.
 *
 * Holds repositories, units and their memberships, and hands out clients
 * which execute calls on their own worker pool against this state. Used by
 * tests and by the command line when pushing into a local state file.
 *
 * The Do* methods are the synchronous service operations; tests may
 * override them to simulate a misbehaving service.
 */
class FakeController : public std::enable_shared_from_this<FakeController> {
public:
    FakeController() = default;
    virtual ~FakeController() = default;

    FakeController(const FakeController&) = delete;
    FakeController& operator=(const FakeController&) = delete;

    /// Creates the repositories every push expects to exist.
    void SeedDefaultRepositories();

    void InsertRepository(Repository repo);

    /// Inserts units as given (memberships included); assigns missing unit ids.
    void InsertUnits(std::vector<Unit> units);

    std::vector<Repository> Repositories() const;
    /// All units, ordered by unit id
    std::vector<Unit> Units() const;
    /// Units whose memberships include repo_id
    std::vector<Unit> UnitsInRepository(const std::string& repo_id) const;
    /// Repository ids in the order they were published
    std::vector<std::string> PublishHistory() const;
    /// "<repo>:<unit name>" for every upload call, in call order
    std::vector<std::string> UploadHistory() const;

    /**
     * Replaces the state with the contents of a YAML state file.
     * @return false if the file does not exist
     * @throws std::runtime_error if the file cannot be parsed
     */
    bool LoadState(const std::string& path);

    /// Writes repositories and units to a YAML state file.
    void SaveState(const std::string& path) const;

    /// New client backed by this controller, running calls on num_threads workers.
    std::shared_ptr<RemoteClient> NewClient(size_t num_threads = 4);

    virtual std::vector<Unit> DoSearchContent(const Criteria& criteria);
    virtual std::vector<Repository> DoSearchRepository(const Criteria& criteria);
    virtual Repository DoGetRepository(const std::string& repo_id);
    virtual std::vector<Task> DoUpload(const std::string& repo_id, const UploadRequest& request);
    virtual std::vector<Task> DoCopyContent(const std::string& src_repo_id,
                                            const std::string& dest_repo_id,
                                            const Criteria& criteria,
                                            const CopyOptions& options);
    virtual std::vector<Task> DoRemoveContent(const std::string& repo_id, const Criteria& criteria);
    virtual void DoUpdateContent(const Unit& unit);
    virtual std::vector<Task> DoPublish(const std::string& repo_id, const PublishOptions& options);

private:
    std::string NextUnitId() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
    std::string NextTaskId() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
    Repository& RequireRepository(const std::string& repo_id) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
    Unit* FindSameContent(const Unit& unit) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

    mutable absl::Mutex mu_;
    absl::btree_map<std::string, Repository> repos_ ABSL_GUARDED_BY(mu_);
    absl::btree_map<std::string, Unit> units_ ABSL_GUARDED_BY(mu_);
    uint64_t next_unit_ ABSL_GUARDED_BY(mu_) = 1;
    uint64_t next_task_ ABSL_GUARDED_BY(mu_) = 1;
    std::vector<std::string> publish_history_ ABSL_GUARDED_BY(mu_);
    std::vector<std::string> upload_history_ ABSL_GUARDED_BY(mu_);
};

} // namespace Pushline

#endif // PUSHLINE_REMOTE_FAKE_CONTROLLER_H_
