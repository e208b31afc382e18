#ifndef PUSHLINE_PUSH_PUSH_TASK_H_
#define PUSHLINE_PUSH_PUSH_TASK_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../pipeline/context.h"
#include "../remote/remote_client.h"
#include "../source/content_source.h"
#include "../source/item_sink.h"

namespace Pushline {

/// Which stages a run includes
enum class PushMode {
    kFull,         // every stage, ending with Publish
    kPrePush,      // stop after Upload; only kinds supporting pre-push are uploaded
    kSkipPublish,  // stop after Associate
};

struct PushOptions {
    PushMode mode = PushMode::kFull;
    bool allow_unsigned = false;
    PublishOptions publish;
};

/// Creates a remote client; called once, or once per stage when clients are not shared
using ClientFactory = std::function<std::shared_ptr<RemoteClient>()>;

/**
 * Wires the pipeline for one run mode, runs it to completion and reports
 * the outcome.
 *
 *   LoadPushItems -> LoadChecksums -> QueryRemoteState -> Upload
 *       -> [EndPrePush] -> Update -> Associate -> [EndPush] -> Publish
 *
 * Collect runs alongside, forwarding item state changes to the sink.
 */
class PushTask {
public:
    PushTask(PushOptions options, ClientFactory client_factory, ItemSink& sink,
             PipelineTunables tunables = PipelineTunables::FromConfig());

    /**
     * Runs the pipeline over every item of sources.
     * @return kExitSuccess, or kExitFatalError if any stage failed
     */
    int Run(std::vector<std::unique_ptr<ContentSource>> sources);

    /// Stage and message of the failure of the last run, empty on success
    const std::string& failed_phase() const { return failed_phase_; }
    const std::string& error_message() const { return error_message_; }

private:
    std::shared_ptr<RemoteClient> Client();

    PushOptions options_;
    ClientFactory client_factory_;
    ItemSink& sink_;
    PipelineTunables tunables_;
    bool shared_client_;
    std::shared_ptr<RemoteClient> client_;

    std::string failed_phase_;
    std::string error_message_;
};

} // namespace Pushline

#endif // PUSHLINE_PUSH_PUSH_TASK_H_
