#ifndef PUSHLINE_PIPELINE_LOAD_CHECKSUMS_H_
#define PUSHLINE_PIPELINE_LOAD_CHECKSUMS_H_

#include "../common/worker_pool.h"
#include "phase.h"

namespace Pushline {

/**
 * Fills in missing checksums. Items whose checksums require reading the
 * source file are hashed on a small worker pool; others pass inline.
 * Every item is reported to Collect as it leaves, generally as PENDING.
 */
class LoadChecksums : public Phase {
public:
    LoadChecksums(Context& context, std::shared_ptr<ItemQueue> in_queue, size_t threads);

protected:
    void Run() override;
    void OnCancel() override { pool_.Cancel(); }
    bool updates_push_items() const override { return true; }

private:
    WorkerPool pool_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_LOAD_CHECKSUMS_H_
