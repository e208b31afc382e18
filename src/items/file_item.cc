#include "file_item.h"

#include <absl/strings/str_cat.h>

namespace Pushline {

Criteria FileItem::criteria() const {
    return Criteria::And({Criteria::WithField("sha256sum", push_item_.sha256sum),
                          Criteria::WithField("path", push_item_.name)});
}

std::string FileItem::MatchKey() const {
    return absl::StrCat(push_item_.name, "\n", push_item_.sha256sum);
}

std::string FileItem::UnitMatchKey(const Unit& unit) const {
    return absl::StrCat(unit.name, "\n", unit.sha256sum);
}

std::optional<Unit> FileItem::UnitForUpdate() const {
    if (!unit_) {
        return std::nullopt;
    }
    // cdn_path is only set on upload; it must not move once published.
    Unit unit = *unit_;
    unit.description = push_item_.description;
    unit.version = push_item_.version;
    unit.display_order = push_item_.display_order;
    return unit;
}

std::string FileItem::CdnPath() const {
    const std::string& sum = push_item_.sha256sum;
    auto slash = push_item_.name.rfind('/');
    std::string basename = slash == std::string::npos ? push_item_.name : push_item_.name.substr(slash + 1);
    return absl::StrCat("/content/origin/files/sha256/", sum.substr(0, 2), "/", sum, "/", basename);
}

Unit FileItem::DesiredUnit() const {
    Unit unit;
    unit.type = UnitType::kFile;
    unit.name = push_item_.name;
    unit.sha256sum = push_item_.sha256sum;
    unit.md5sum = push_item_.md5sum;
    unit.description = push_item_.description;
    unit.version = push_item_.version;
    unit.display_order = push_item_.display_order;
    unit.cdn_path = CdnPath();
    // An orphan being re-uploaded keeps its published timestamp.
    if (unit_) {
        unit.cdn_published = unit_->cdn_published;
    }
    return unit;
}

} // namespace Pushline
