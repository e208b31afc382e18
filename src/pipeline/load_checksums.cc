#include "load_checksums.h"

#include <glog/logging.h>

namespace Pushline {

LoadChecksums::LoadChecksums(Context& context, std::shared_ptr<ItemQueue> in_queue, size_t threads)
    : Phase(context, std::move(in_queue), "Calculate checksums"), pool_(threads, "checksum") {}

void LoadChecksums::Run() {
    size_t computed = 0;
    ContentItemPtr item;
    while (NextInput(&item)) {
        if (item->blocking_checksums()) {
            ++computed;
            PutFutureOutput(pool_.ExecuteAsync([item]() { return item->WithChecksums(); }));
        } else {
            PutOutput(item->WithChecksums());
        }
    }
    VLOG(1) << "\t[LoadChecksums]\t\tcomputed checksums of " << computed << " file(s)";
}

} // namespace Pushline
