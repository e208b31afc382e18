#ifndef PUSHLINE_PIPELINE_UPDATE_H_
#define PUSHLINE_PIPELINE_UPDATE_H_

#include "../common/worker_pool.h"
#include "phase.h"

namespace Pushline {

/// Sets mutable unit fields to their desired values, confirming each update.
class Update : public Phase {
public:
    Update(Context& context, std::shared_ptr<RemoteClient> client, std::shared_ptr<ItemQueue> in_queue);

protected:
    void Run() override;
    void OnCancel() override { pool_.Cancel(); }

private:
    std::shared_ptr<RemoteClient> client_;
    WorkerPool pool_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_UPDATE_H_
