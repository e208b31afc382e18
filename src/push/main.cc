#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/config.h"
#include "common/configuration.h"
#include "push_task.h"
#include "remote/fake_controller.h"

namespace {

std::unique_ptr<Pushline::ItemSink> MakeSink(const std::string& collect_path) {
    if (collect_path.empty()) {
        return std::make_unique<Pushline::LoggingItemSink>();
    }
    return std::make_unique<Pushline::YamlItemSink>(collect_path);
}

} // end of namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    cxxopts::Options options("pushline", "Push content into a content-repository service");
    options.add_options()
        ("source", "Content source URL, e.g. staged:/path/manifest.yaml (repeatable)",
         cxxopts::value<std::vector<std::string>>())
        ("pre-push", "Only upload content which supports pre-push; do not associate or publish")
        ("skip-publish", "Stop after association; do not publish")
        ("allow-unsigned", "Allow pushing unsigned content")
        ("force", "Force publish of every repository")
        ("clean", "Clean publish (remove stale published content)")
        ("fake-state", "Remote state file, loaded before and saved after the push",
         cxxopts::value<std::string>()->default_value(""))
        ("config", "Configuration file (YAML)", cxxopts::value<std::string>()->default_value(""))
        ("collect", "Write final item states to this YAML file", cxxopts::value<std::string>()->default_value(""))
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return Pushline::kExitUsage;
    }
    const auto& arguments = *parsed;

    if (arguments.count("help")) {
        std::cout << options.help() << std::endl;
        return Pushline::kExitSuccess;
    }

    FLAGS_v = arguments["log_level"].as<int>();
    FLAGS_logtostderr = 1; // log only to console, no files

    // *************** Configuration **********************
    auto& configuration = Pushline::Configuration::getInstance();
    const std::string config_path = arguments["config"].as<std::string>();
    if (!config_path.empty() && !configuration.loadFromFile(config_path)) {
        LOG(ERROR) << "Invalid configuration " << config_path;
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "  " << error;
        }
        return Pushline::kExitUsage;
    }
    if (arguments.count("force")) {
        configuration.config().publish.force.set(true);
    }
    if (arguments.count("clean")) {
        configuration.config().publish.clean.set(true);
    }
    if (!configuration.validate()) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return Pushline::kExitUsage;
    }
    const auto& config = configuration.config();

    if (!arguments.count("source")) {
        std::cerr << "At least one --source is required\n" << options.help() << std::endl;
        return Pushline::kExitUsage;
    }
    if (arguments.count("pre-push") && arguments.count("skip-publish")) {
        std::cerr << "--pre-push and --skip-publish are mutually exclusive" << std::endl;
        return Pushline::kExitUsage;
    }

    std::vector<std::unique_ptr<Pushline::ContentSource>> sources;
    try {
        for (const auto& url : arguments["source"].as<std::vector<std::string>>()) {
            sources.push_back(Pushline::ContentSource::Open(url));
        }
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << e.what();
        return Pushline::kExitUsage;
    } catch (const std::runtime_error& e) {
        LOG(ERROR) << e.what();
        return Pushline::kExitFatalError;
    }

    // *************** Remote service **********************
    auto controller = std::make_shared<Pushline::FakeController>();
    const std::string state_path = arguments["fake-state"].as<std::string>();
    try {
        if (state_path.empty() || !controller->LoadState(state_path)) {
            if (state_path.empty()) {
                LOG(WARNING) << "No --fake-state given, pushing into a discarded in-memory service";
            }
            controller->SeedDefaultRepositories();
        }
    } catch (const std::runtime_error& e) {
        LOG(ERROR) << e.what();
        return Pushline::kExitFatalError;
    }

    Pushline::PushOptions push_options;
    if (arguments.count("pre-push")) {
        push_options.mode = Pushline::PushMode::kPrePush;
    } else if (arguments.count("skip-publish")) {
        push_options.mode = Pushline::PushMode::kSkipPublish;
    }
    push_options.allow_unsigned = arguments.count("allow-unsigned") > 0;
    push_options.publish.force = config.publish.force.get();
    push_options.publish.clean = config.publish.clean.get();

    auto sink = MakeSink(arguments["collect"].as<std::string>());
    const size_t client_threads = static_cast<size_t>(config.remote.worker_threads.get());
    Pushline::PushTask task(push_options, [controller, client_threads]() { return controller->NewClient(client_threads); },
                            *sink);

    int exit_code = task.Run(std::move(sources));

    if (!state_path.empty()) {
        try {
            controller->SaveState(state_path);
        } catch (const std::runtime_error& e) {
            LOG(ERROR) << e.what();
            return Pushline::kExitFatalError;
        }
    }
    return exit_code;
}
