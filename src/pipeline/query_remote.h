#ifndef PUSHLINE_PIPELINE_QUERY_REMOTE_H_
#define PUSHLINE_PIPELINE_QUERY_REMOTE_H_

#include "../common/worker_pool.h"
#include "phase.h"

namespace Pushline {

/**
 * Resolves the remote state of items: one content search per unit type per
 * input batch, pairing the returned units with the items.
 */
class QueryRemoteState : public Phase {
public:
    QueryRemoteState(Context& context, std::shared_ptr<RemoteClient> client, std::shared_ptr<ItemQueue> in_queue);

protected:
    void Run() override;
    void OnCancel() override { pool_.Cancel(); }

private:
    std::shared_ptr<RemoteClient> client_;
    WorkerPool pool_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_QUERY_REMOTE_H_
