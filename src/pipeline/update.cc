#include "update.h"

#include <glog/logging.h>

namespace Pushline {

Update::Update(Context& context, std::shared_ptr<RemoteClient> client, std::shared_ptr<ItemQueue> in_queue)
    : Phase(context, std::move(in_queue), "Update items"),
      client_(std::move(client)),
      pool_(context.tunables().out_max_futures, "update") {}

void Update::Run() {
    size_t uptodate = 0;
    size_t updating = 0;

    ContentItemPtr item;
    while (NextInput(&item)) {
        if (item->state() != ItemState::kNeedsUpdate) {
            ++uptodate;
            PutOutput(item);
        } else {
            ++updating;
            auto client = client_;
            PutFutureOutput(pool_.ExecuteAsync([item, client]() { return item->EnsureUptodate(*client); }));
        }
    }

    LOG(INFO) << "Update: " << uptodate << " item(s) already up-to-date, " << updating << " updating";
}

} // namespace Pushline
