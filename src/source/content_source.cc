#include "content_source.h"

#include <filesystem>
#include <stdexcept>

#include <absl/strings/match.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Pushline {

namespace {

constexpr char kStagedPrefix[] = "staged:";

std::string GetString(const YAML::Node& node, const char* key) {
    return node[key] ? node[key].as<std::string>() : std::string();
}

std::vector<std::string> GetStrings(const YAML::Node& node, const char* key) {
    std::vector<std::string> out;
    if (!node[key]) {
        return out;
    }
    if (node[key].IsScalar()) {
        out.push_back(node[key].as<std::string>());
        return out;
    }
    for (const auto& value : node[key]) {
        out.push_back(value.as<std::string>());
    }
    return out;
}

ErratumFields ParseErratum(const YAML::Node& node) {
    ErratumFields e;
    e.title = GetString(node, "title");
    e.severity = GetString(node, "severity");
    e.status = GetString(node, "status");
    e.advisory_type = GetString(node, "type");
    e.issued = GetString(node, "issued");
    e.updated = GetString(node, "updated");
    e.release = GetString(node, "release");
    e.solution = GetString(node, "solution");
    e.summary = GetString(node, "summary");
    if (node["reboot_suggested"]) e.reboot_suggested = node["reboot_suggested"].as<bool>();
    e.references = GetStrings(node, "references");
    e.pkglist = GetStrings(node, "pkglist");
    return e;
}

} // namespace

std::unique_ptr<ContentSource> ContentSource::Open(const std::string& url) {
    if (absl::StartsWith(url, kStagedPrefix)) {
        return std::make_unique<StagedSource>(url.substr(sizeof(kStagedPrefix) - 1));
    }
    throw std::invalid_argument("Unsupported content source: " + url);
}

StaticSource::StaticSource(std::vector<PushItem> items, std::string description)
    : items_(std::move(items)), description_(std::move(description)) {}

std::optional<PushItem> StaticSource::Next() {
    if (next_ >= items_.size()) {
        return std::nullopt;
    }
    return items_[next_++];
}

StagedSource::StagedSource(const std::string& manifest_path) : manifest_path_(manifest_path) {
    namespace fs = std::filesystem;
    const fs::path base = fs::path(manifest_path).parent_path();

    YAML::Node root;
    try {
        root = YAML::LoadFile(manifest_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load manifest " + manifest_path + ": " + e.what());
    }

    try {
        for (const auto& node : root["items"]) {
            std::string type = GetString(node, "type");
            auto kind = ParseItemKind(type);
            if (!kind) {
                LOG(INFO) << "Skipping unsupported type: " << type << " (" << GetString(node, "name") << ")";
                ++skipped_;
                continue;
            }

            PushItem item;
            item.kind = *kind;
            item.name = GetString(node, "name");
            if (item.name.empty()) {
                throw std::runtime_error("Item without a name in " + manifest_path);
            }
            item.src = GetString(node, "src");
            if (!item.src.empty() && fs::path(item.src).is_relative()) {
                item.src = (base / item.src).string();
            }
            item.dest = GetStrings(node, "dest");
            item.origin = node["origin"] ? GetString(node, "origin") : "staged:" + manifest_path;
            item.md5sum = GetString(node, "md5sum");
            item.sha256sum = GetString(node, "sha256sum");
            item.signing_key = GetString(node, "signing_key");
            if (node["state"]) item.state = GetString(node, "state");
            item.description = GetString(node, "description");
            item.version = GetString(node, "version");
            if (node["display_order"]) item.display_order = node["display_order"].as<double>();
            if (node["erratum"]) item.erratum = ParseErratum(node["erratum"]);
            items_.push_back(std::move(item));
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid manifest " + manifest_path + ": " + e.what());
    }

    LOG(INFO) << "Loaded " << items_.size() << " item(s) from " << manifest_path;
}

std::optional<PushItem> StagedSource::Next() {
    if (next_ >= items_.size()) {
        return std::nullopt;
    }
    return items_[next_++];
}

} // namespace Pushline
