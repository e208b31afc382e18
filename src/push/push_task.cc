#include "push_task.h"

#include <absl/time/time.h>
#include <glog/logging.h>

#include "../common/config.h"
#include "../common/configuration.h"
#include "../pipeline/associate.h"
#include "../pipeline/collect.h"
#include "../pipeline/end_push.h"
#include "../pipeline/load_checksums.h"
#include "../pipeline/load_items.h"
#include "../pipeline/progress.h"
#include "../pipeline/publish.h"
#include "../pipeline/query_remote.h"
#include "../pipeline/update.h"
#include "../pipeline/upload.h"

namespace Pushline {

PushTask::PushTask(PushOptions options, ClientFactory client_factory, ItemSink& sink, PipelineTunables tunables)
    : options_(options),
      client_factory_(std::move(client_factory)),
      sink_(sink),
      tunables_(tunables),
      shared_client_(GetConfig().config().remote.shared_client.get()) {}

std::shared_ptr<RemoteClient> PushTask::Client() {
    if (!shared_client_) {
        return client_factory_();
    }
    if (!client_) {
        client_ = client_factory_();
    }
    return client_;
}

int PushTask::Run(std::vector<std::unique_ptr<ContentSource>> sources) {
    const auto& config = GetConfig().config();
    const bool pre_push = options_.mode == PushMode::kPrePush;
    failed_phase_.clear();
    error_message_.clear();

    Context context(tunables_);
    Collect collect(context, sink_);

    std::vector<std::unique_ptr<Phase>> phases;
    auto add = [&phases](std::unique_ptr<Phase> phase) {
        auto out = phase->out_queue();
        phases.push_back(std::move(phase));
        return out;
    };

    auto queue = add(std::make_unique<LoadPushItems>(context, std::move(sources), pre_push, options_.allow_unsigned));
    queue = add(std::make_unique<LoadChecksums>(context, queue, config.checksum.threads.get()));
    queue = add(std::make_unique<QueryRemoteState>(context, Client(), queue));
    queue = add(std::make_unique<Upload>(context, Client(), pre_push, config.remote.rpm_upload_repo.get(), queue));
    if (pre_push) {
        add(std::make_unique<EndPrePush>(context, queue));
    } else {
        queue = add(std::make_unique<Update>(context, Client(), queue));
        queue = add(std::make_unique<Associate>(context, Client(), options_.allow_unsigned, queue));
        if (options_.mode == PushMode::kSkipPublish) {
            add(std::make_unique<EndPush>(context, queue));
        } else {
            add(std::make_unique<Publish>(context, Client(), options_.publish, queue));
        }
    }

    ProgressLogger progress(context, absl::Seconds(config.progress.interval.get()));

    collect.Start();
    for (auto& phase : phases) {
        phase->Start();
    }
    progress.Start();

    for (auto it = phases.rbegin(); it != phases.rend(); ++it) {
        (*it)->Stop();
    }
    progress.Stop();
    collect.Close();
    collect.Stop();

    try {
        sink_.Finish();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to record push item states: " << e.what();
        context.SetError("Collect push item metadata", std::current_exception());
    }

    if (context.has_error()) {
        failed_phase_ = context.error_phase();
        error_message_ = context.ErrorMessage();
        LOG(ERROR) << "Push failed in " << failed_phase_ << ": " << error_message_;
        return kExitFatalError;
    }

    LOG(INFO) << (pre_push ? "Pre-push completed" : "Push completed");
    return kExitSuccess;
}

} // namespace Pushline
