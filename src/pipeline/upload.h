#ifndef PUSHLINE_PIPELINE_UPLOAD_H_
#define PUSHLINE_PIPELINE_UPLOAD_H_

#include <string>

#include "../common/worker_pool.h"
#include "phase.h"

namespace Pushline {

/**
 * Ensures every item exists in at least one remote repository.
 *
 * Items already present pass through; the rest are uploaded concurrently
 * and confirmed by a follow-up query. During a pre-push, kinds which cannot
 * be pre-pushed pass through untouched. Outputs are reported to Collect.
 */
class Upload : public Phase {
public:
    /**
     * @param rpm_upload_repo Repository every rpm is uploaded into before
     *                        being associated into its destinations
     */
    Upload(Context& context, std::shared_ptr<RemoteClient> client, bool pre_push,
           std::string rpm_upload_repo, std::shared_ptr<ItemQueue> in_queue);

protected:
    void Run() override;
    void OnCancel() override { pool_.Cancel(); }
    bool updates_push_items() const override { return true; }

private:
    std::shared_ptr<UploadContext> ContextFor(ItemKind kind);

    std::shared_ptr<RemoteClient> client_;
    bool pre_push_;
    std::string rpm_upload_repo_;
    absl::flat_hash_map<ItemKind, std::shared_ptr<UploadContext>> upload_contexts_;
    WorkerPool pool_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_UPLOAD_H_
