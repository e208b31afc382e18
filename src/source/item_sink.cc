#include "item_sink.h"

#include <fstream>
#include <stdexcept>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Pushline {

void LoggingItemSink::UpdatePushItems(const std::vector<PushItem>& items) {
    for (const auto& item : items) {
        LOG(INFO) << item.name << " [" << absl::StrJoin(item.dest, ", ") << "]: " << item.state;
    }
}

void LoggingItemSink::Finish() {
    VLOG(1) << "\t[ItemSink]\t\tno more updates";
}

YamlItemSink::YamlItemSink(std::string path) : path_(std::move(path)) {}

void YamlItemSink::UpdatePushItems(const std::vector<PushItem>& items) {
    absl::MutexLock lock(&mu_);
    for (const auto& item : items) {
        auto key = absl::StrCat(item.name, "\n", absl::StrJoin(item.dest, ","), "\n", item.src);
        auto [it, inserted] = index_.emplace(std::move(key), items_.size());
        if (inserted) {
            items_.push_back(item);
        } else {
            items_[it->second] = item;
        }
    }
}

void YamlItemSink::Finish() {
    absl::MutexLock lock(&mu_);
    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "items" << YAML::Value << YAML::BeginSeq;
    for (const auto& item : items_) {
        out << YAML::BeginMap;
        out << YAML::Key << "type" << YAML::Value << std::string(ItemKindName(item.kind));
        out << YAML::Key << "name" << YAML::Value << item.name;
        out << YAML::Key << "dest" << YAML::Value << YAML::Flow << item.dest;
        if (!item.sha256sum.empty()) out << YAML::Key << "sha256sum" << YAML::Value << item.sha256sum;
        out << YAML::Key << "state" << YAML::Value << item.state;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq << YAML::EndMap;

    std::ofstream file(path_, std::ios::trunc);
    if (!file || !(file << out.c_str() << "\n")) {
        throw std::runtime_error("Failed to write item states to " + path_);
    }
    LOG(INFO) << "Wrote " << items_.size() << " item state(s) to " << path_;
}

} // namespace Pushline
