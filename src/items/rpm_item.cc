#include "rpm_item.h"

#include <algorithm>
#include <cctype>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

namespace Pushline {

namespace {

std::string Basename(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

RpmNvra ParseRpmFilename(const std::string& filename) {
    auto invalid = [&filename]() {
        return ValidationError(absl::StrCat("Invalid RPM filename ", filename,
                                            " (expected: [name]-[version]-[release].[arch].rpm)"));
    };

    std::string base = Basename(filename);
    if (!absl::EndsWith(base, ".rpm")) {
        throw invalid();
    }
    base.resize(base.size() - 4);

    auto dot = base.rfind('.');
    if (dot == std::string::npos || dot + 1 == base.size()) {
        throw invalid();
    }
    RpmNvra nvra;
    nvra.arch = base.substr(dot + 1);
    base.resize(dot);

    auto dash = base.rfind('-');
    if (dash == std::string::npos || dash + 1 == base.size()) {
        throw invalid();
    }
    nvra.release = base.substr(dash + 1);
    base.resize(dash);

    dash = base.rfind('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 == base.size()) {
        throw invalid();
    }
    nvra.version = base.substr(dash + 1);
    nvra.name = base.substr(0, dash);
    return nvra;
}

void RpmItem::Validate(bool allow_unsigned) const {
    ParseRpmFilename(push_item_.name);
    if (!allow_unsigned && push_item_.signing_key.empty()) {
        throw ValidationError("Unsigned content is not allowed: " + push_item_.DebugString());
    }
}

std::string RpmItem::CdnPath() const {
    RpmNvra nvra = ParseRpmFilename(push_item_.name);
    std::string key = push_item_.signing_key.empty() ? "none" : absl::AsciiStrToLower(push_item_.signing_key);
    return absl::StrCat("/content/origin/rpms/", nvra.name, "/", nvra.version, "/", nvra.release, "/",
                        key, "/", Basename(push_item_.name));
}

Unit RpmItem::DesiredUnit() const {
    Unit unit;
    unit.type = UnitType::kRpm;
    unit.name = Basename(push_item_.name);
    unit.sha256sum = push_item_.sha256sum;
    unit.md5sum = push_item_.md5sum;
    unit.signing_key = absl::AsciiStrToLower(push_item_.signing_key);
    unit.cdn_path = CdnPath();
    return unit;
}

} // namespace Pushline
