#ifndef PUSHLINE_PIPELINE_PUBLISH_H_
#define PUSHLINE_PIPELINE_PUBLISH_H_

#include "phase.h"

namespace Pushline {

/**
 * Last stage of a full push, and the pipeline's only barrier.
 *
 * Waits for every item to arrive, publishes every repository any item
 * touches, marks unpublished units with the publish time and only then
 * reports all items as PUSHED. Publishing nothing until all content is in
 * place lets dependent content become visible together.
 */
class Publish : public Phase {
public:
    Publish(Context& context, std::shared_ptr<RemoteClient> client, PublishOptions options,
            std::shared_ptr<ItemQueue> in_queue);

protected:
    void Run() override;
    StartupType startup_type() const override { return StartupType::kNotify; }

private:
    /// Publishes repo_ids; fails if any of them does not exist
    void PublishRepositories(const std::vector<std::string>& repo_ids);
    void MarkPublished(std::vector<Unit> units);

    std::shared_ptr<RemoteClient> client_;
    PublishOptions options_;
};

} // namespace Pushline

#endif // PUSHLINE_PIPELINE_PUBLISH_H_
