#ifndef PUSHLINE_PIPELINE_COLLECT_H_
#define PUSHLINE_PIPELINE_COLLECT_H_

#include "../source/item_sink.h"
#include "phase.h"

namespace Pushline {

/**
 * Forwards push item state changes from every stage to an ItemSink.
 *
 * Creates its own input queue and registers it on the context. Must be
 * started before, and closed after, every other stage.
 */
class Collect : public Phase {
public:
    Collect(Context& context, ItemSink& sink);

    /// Ends input; call once every other stage has stopped.
    void Close();

    /// Latest occurrence of each item (by name, dest and src), in first-seen order
    static ItemBatch Deduplicate(const ItemBatch& batch);

protected:
    void Run() override;
    ProgressType progress_type() const override { return ProgressType::kNone; }

private:
    ItemSink& sink_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_COLLECT_H_
