#ifndef PUSHLINE_REMOTE_CLIENT_H_
#define PUSHLINE_REMOTE_CLIENT_H_

#include <future>
#include <string>
#include <vector>

#include "criteria.h"
#include "model.h"

namespace Pushline {

/**
 * Capability interface of the remote content-repository service.
 *
 * Every call returns immediately with a deferred result. Implementations
 * run calls on their own bounded worker pool; a failed call surfaces as
 * an exception from the future's get().
 */
class RemoteClient {
public:
    virtual ~RemoteClient() = default;

    virtual std::future<std::vector<Unit>> SearchContent(const Criteria& criteria) = 0;
    virtual std::future<std::vector<Repository>> SearchRepository(const Criteria& criteria) = 0;

    /// Fails if the repository does not exist
    virtual std::future<Repository> GetRepository(const std::string& repo_id) = 0;

    virtual std::future<std::vector<Task>> Upload(const std::string& repo_id,
                                                  const UploadRequest& request) = 0;

    /// Links units of src matching criteria into dest without re-uploading
    virtual std::future<std::vector<Task>> CopyContent(const std::string& src_repo_id,
                                                       const std::string& dest_repo_id,
                                                       const Criteria& criteria,
                                                       const CopyOptions& options) = 0;

    virtual std::future<std::vector<Task>> RemoveContent(const std::string& repo_id,
                                                         const Criteria& criteria) = 0;

    /// Writes the mutable fields of an existing unit (matched by unit_id)
    virtual std::future<void> UpdateContent(const Unit& unit) = 0;

    virtual std::future<std::vector<Task>> Publish(const std::string& repo_id,
                                                   const PublishOptions& options) = 0;
};

} // namespace Pushline

#endif // PUSHLINE_REMOTE_CLIENT_H_
