#include "query_remote.h"

#include <glog/logging.h>

namespace Pushline {

QueryRemoteState::QueryRemoteState(Context& context, std::shared_ptr<RemoteClient> client,
                                   std::shared_ptr<ItemQueue> in_queue)
    : Phase(context, std::move(in_queue), "Query items in remote service"),
      client_(std::move(client)),
      pool_(context.tunables().out_max_futures, "query") {}

void QueryRemoteState::Run() {
    ItemBatch batch;
    while (NextInputBatch(&batch)) {
        for (auto& group : ItemsByKind(batch)) {
            if (!group.front()->unit_type()) {
                // Never searched; state is settled during upload.
                for (auto& item : group) {
                    PutOutput(std::move(item));
                }
                continue;
            }
            VLOG(1) << "\t[QueryRemoteState]\tsearching " << group.size() << " "
                    << ItemKindName(group.front()->kind()) << " item(s)";
            auto client = client_;
            PutFutureOutputs(pool_.ExecuteAsync([client, group]() {
                return ContentItem::ItemsWithRemoteState(*client, group);
            }));
        }
    }
}

} // namespace Pushline
