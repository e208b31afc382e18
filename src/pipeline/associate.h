#ifndef PUSHLINE_PIPELINE_ASSOCIATE_H_
#define PUSHLINE_PIPELINE_ASSOCIATE_H_

#include "../common/worker_pool.h"
#include "phase.h"

namespace Pushline {

/**
 * Copies items into every destination they are still missing from.
 *
 * Rpms are held back until every module item headed for the same
 * destination has been associated, so a package never becomes visible in a
 * repository before the module describing it. Until the full item list is
 * known, every rpm is held back.
 */
class Associate : public Phase {
public:
    Associate(Context& context, std::shared_ptr<RemoteClient> client, bool allow_unsigned,
              std::shared_ptr<ItemQueue> in_queue);

    /**
     * Copies items (all of one kind) into their missing repositories and
     * confirms the result, retrying up to retries times. Blocking.
     * @throws ConfirmationError if a unit is still missing from a repository
     */
    static ItemBatch AssociateItems(RemoteClient& client, const ItemBatch& items, const CopyOptions& options,
                                    int retries);

protected:
    void Run() override;
    void OnCancel() override { pool_.Cancel(); }
    StartupType startup_type() const override { return StartupType::kNotify; }

private:
    bool ShouldDefer(const ContentItem& item) const;
    void RecordAssociated(const ItemBatch& items);
    void AssociateBatch(const ItemBatch& batch);

    std::shared_ptr<RemoteClient> client_;
    CopyOptions copy_options_;
    int retries_;
    absl::flat_hash_map<std::string, size_t> modulemd_associated_per_dest_;
    WorkerPool pool_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_ASSOCIATE_H_
