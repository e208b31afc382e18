#ifndef PUSHLINE_PIPELINE_LOAD_ITEMS_H_
#define PUSHLINE_PIPELINE_LOAD_ITEMS_H_

#include <memory>
#include <vector>

#include "../source/content_source.h"
#include "phase.h"

namespace Pushline {

/**
 * First stage: enumerates push items from every content source.
 *
 * Output items have no remote state and may lack checksums. Every item is
 * validated before the first one is written, so invalid input fails the
 * run before any remote mutation. The total item count and the number of
 * module items per destination are recorded on the context once all
 * sources are exhausted.
 */
class LoadPushItems : public Phase {
public:
    LoadPushItems(Context& context, std::vector<std::unique_ptr<ContentSource>> sources,
                  bool pre_push, bool allow_unsigned);

protected:
    void Run() override;

private:
    std::vector<std::unique_ptr<ContentSource>> sources_;
    bool pre_push_;
    bool allow_unsigned_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_LOAD_ITEMS_H_
