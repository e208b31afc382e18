#include "model.h"

#include <algorithm>
#include <sstream>

#include <absl/strings/str_join.h>

namespace Pushline {

namespace {

struct UnitTypeEntry {
    UnitType type;
    std::string_view name;
};

constexpr UnitTypeEntry kUnitTypes[] = {
    {UnitType::kRpm, "rpm"},
    {UnitType::kFile, "iso"},
    {UnitType::kErratum, "erratum"},
    {UnitType::kModulemd, "modulemd"},
    {UnitType::kComps, "comps"},
    {UnitType::kProductId, "productid"},
};

} // namespace

std::string_view UnitTypeName(UnitType type) {
    for (const auto& entry : kUnitTypes) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<UnitType> ParseUnitType(std::string_view name) {
    for (const auto& entry : kUnitTypes) {
        if (entry.name == name) {
            return entry.type;
        }
    }
    return std::nullopt;
}

std::optional<std::string> Unit::Field(std::string_view field) const {
    if (field == "unit_id") return unit_id;
    if (field == "name") return name;
    if (field == "sha256sum") return sha256sum;
    if (field == "md5sum") return md5sum;
    if (field == "signing_key") return signing_key;
    if (field == "cdn_path") return cdn_path;
    if (field == "version") return version;
    // Type-specific aliases of `name`
    if (field == "filename" && type == UnitType::kRpm) return name;
    if (field == "path" && type == UnitType::kFile) return name;
    if (field == "id" && type == UnitType::kErratum) return name;
    return std::nullopt;
}

bool Unit::InRepository(std::string_view repo_id) const {
    return std::binary_search(repository_memberships.begin(), repository_memberships.end(), repo_id);
}

void Unit::AddMembership(const std::string& repo_id) {
    auto it = std::lower_bound(repository_memberships.begin(), repository_memberships.end(), repo_id);
    if (it == repository_memberships.end() || *it != repo_id) {
        repository_memberships.insert(it, repo_id);
    }
}

void Unit::RemoveMembership(std::string_view repo_id) {
    auto it = std::lower_bound(repository_memberships.begin(), repository_memberships.end(), repo_id);
    if (it != repository_memberships.end() && *it == repo_id) {
        repository_memberships.erase(it);
    }
}

std::string Unit::DebugString() const {
    std::ostringstream out;
    out << "Unit(type=" << UnitTypeName(type) << ", unit_id='" << unit_id << "', name='" << name << "'";
    if (!sha256sum.empty()) out << ", sha256sum='" << sha256sum << "'";
    if (!signing_key.empty()) out << ", signing_key='" << signing_key << "'";
    if (!version.empty()) out << ", version='" << version << "'";
    if (!description.empty()) out << ", description='" << description << "'";
    if (display_order) out << ", display_order=" << *display_order;
    if (type == UnitType::kErratum) {
        out << ", title='" << erratum.title << "', severity='" << erratum.severity
            << "', status='" << erratum.status << "', updated='" << erratum.updated << "'";
    }
    if (cdn_published) out << ", cdn_published='" << *cdn_published << "'";
    out << ", repository_memberships=[" << absl::StrJoin(repository_memberships, ", ") << "])";
    return out.str();
}

std::optional<std::string> Repository::Field(std::string_view field) const {
    if (field == "id") return id;
    if (field == "content_type") return content_type;
    if (field == "relative_url") return relative_url;
    return std::nullopt;
}

} // namespace Pushline
