#include "fake_controller.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

// YAML persistence of FakeController state.

namespace Pushline {

namespace {

std::string OptionalString(const YAML::Node& node, const char* key) {
    return node[key] ? node[key].as<std::string>() : std::string();
}

std::vector<std::string> StringList(const YAML::Node& node, const char* key) {
    std::vector<std::string> out;
    if (node[key]) {
        for (const auto& value : node[key]) {
            out.push_back(value.as<std::string>());
        }
    }
    return out;
}

Unit UnitFromYAML(const YAML::Node& node) {
    Unit unit;
    auto type = ParseUnitType(node["type"].as<std::string>());
    if (!type) {
        throw std::runtime_error("Unknown unit type " + node["type"].as<std::string>());
    }
    unit.type = *type;
    unit.unit_id = OptionalString(node, "unit_id");
    unit.name = node["name"].as<std::string>();
    unit.sha256sum = OptionalString(node, "sha256sum");
    unit.md5sum = OptionalString(node, "md5sum");
    if (node["size"]) unit.size = node["size"].as<uint64_t>();
    unit.signing_key = OptionalString(node, "signing_key");
    unit.cdn_path = OptionalString(node, "cdn_path");
    if (node["cdn_published"]) unit.cdn_published = node["cdn_published"].as<std::string>();
    unit.description = OptionalString(node, "description");
    unit.version = OptionalString(node, "version");
    if (node["display_order"]) unit.display_order = node["display_order"].as<double>();
    if (const auto& e = node["erratum"]) {
        unit.erratum.title = OptionalString(e, "title");
        unit.erratum.severity = OptionalString(e, "severity");
        unit.erratum.status = OptionalString(e, "status");
        unit.erratum.advisory_type = OptionalString(e, "type");
        unit.erratum.issued = OptionalString(e, "issued");
        unit.erratum.updated = OptionalString(e, "updated");
        unit.erratum.release = OptionalString(e, "release");
        unit.erratum.solution = OptionalString(e, "solution");
        unit.erratum.summary = OptionalString(e, "summary");
        if (e["reboot_suggested"]) unit.erratum.reboot_suggested = e["reboot_suggested"].as<bool>();
        unit.erratum.references = StringList(e, "references");
        unit.erratum.pkglist = StringList(e, "pkglist");
    }
    unit.repository_memberships = StringList(node, "repository_memberships");
    return unit;
}

void EmitUnit(YAML::Emitter& out, const Unit& unit) {
    out << YAML::BeginMap;
    out << YAML::Key << "unit_id" << YAML::Value << unit.unit_id;
    out << YAML::Key << "type" << YAML::Value << std::string(UnitTypeName(unit.type));
    out << YAML::Key << "name" << YAML::Value << unit.name;
    if (!unit.sha256sum.empty()) out << YAML::Key << "sha256sum" << YAML::Value << unit.sha256sum;
    if (!unit.md5sum.empty()) out << YAML::Key << "md5sum" << YAML::Value << unit.md5sum;
    if (unit.size) out << YAML::Key << "size" << YAML::Value << unit.size;
    if (!unit.signing_key.empty()) out << YAML::Key << "signing_key" << YAML::Value << unit.signing_key;
    if (!unit.cdn_path.empty()) out << YAML::Key << "cdn_path" << YAML::Value << unit.cdn_path;
    if (unit.cdn_published) out << YAML::Key << "cdn_published" << YAML::Value << *unit.cdn_published;
    if (!unit.description.empty()) out << YAML::Key << "description" << YAML::Value << unit.description;
    if (!unit.version.empty()) out << YAML::Key << "version" << YAML::Value << unit.version;
    if (unit.display_order) out << YAML::Key << "display_order" << YAML::Value << *unit.display_order;
    if (unit.type == UnitType::kErratum) {
        const auto& e = unit.erratum;
        out << YAML::Key << "erratum" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "title" << YAML::Value << e.title;
        out << YAML::Key << "severity" << YAML::Value << e.severity;
        out << YAML::Key << "status" << YAML::Value << e.status;
        out << YAML::Key << "type" << YAML::Value << e.advisory_type;
        out << YAML::Key << "issued" << YAML::Value << e.issued;
        out << YAML::Key << "updated" << YAML::Value << e.updated;
        out << YAML::Key << "release" << YAML::Value << e.release;
        out << YAML::Key << "solution" << YAML::Value << e.solution;
        out << YAML::Key << "summary" << YAML::Value << e.summary;
        out << YAML::Key << "reboot_suggested" << YAML::Value << e.reboot_suggested;
        out << YAML::Key << "references" << YAML::Value << YAML::Flow << e.references;
        out << YAML::Key << "pkglist" << YAML::Value << YAML::Flow << e.pkglist;
        out << YAML::EndMap;
    }
    out << YAML::Key << "repository_memberships" << YAML::Value << YAML::Flow << unit.repository_memberships;
    out << YAML::EndMap;
}

} // namespace

bool FakeController::LoadState(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return false;
    }

    std::vector<Repository> repos;
    std::vector<Unit> units;
    try {
        YAML::Node root = YAML::LoadFile(path);
        for (const auto& node : root["repos"]) {
            Repository repo;
            repo.id = node["id"].as<std::string>();
            if (node["content_type"]) repo.content_type = node["content_type"].as<std::string>();
            repo.relative_url = OptionalString(node, "relative_url");
            if (node["publish_count"]) repo.publish_count = node["publish_count"].as<uint64_t>();
            repos.push_back(std::move(repo));
        }
        for (const auto& node : root["units"]) {
            units.push_back(UnitFromYAML(node));
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load remote state " + path + ": " + e.what());
    }

    {
        absl::MutexLock lock(&mu_);
        repos_.clear();
        units_.clear();
    }
    for (auto& repo : repos) {
        InsertRepository(std::move(repo));
    }
    InsertUnits(std::move(units));
    LOG(INFO) << "Loaded remote state from " << path << ": " << repos.size() << " repo(s), "
              << Units().size() << " unit(s)";
    return true;
}

void FakeController::SaveState(const std::string& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "repos" << YAML::Value << YAML::BeginSeq;
    for (const auto& repo : Repositories()) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << repo.id;
        out << YAML::Key << "content_type" << YAML::Value << repo.content_type;
        out << YAML::Key << "relative_url" << YAML::Value << repo.relative_url;
        out << YAML::Key << "publish_count" << YAML::Value << repo.publish_count;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "units" << YAML::Value << YAML::BeginSeq;
    for (const auto& unit : Units()) {
        EmitUnit(out, unit);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
    file << out.c_str() << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write " + path);
    }
}

} // namespace Pushline
