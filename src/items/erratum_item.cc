#include "erratum_item.h"

#include <algorithm>
#include <charconv>

#include <absl/strings/match.h>

namespace Pushline {

namespace {

// Content equality ignoring the version counter and service bookkeeping.
bool SameContent(const Unit& a, const Unit& b) {
    return a.name == b.name && a.description == b.description && a.erratum == b.erratum;
}

} // namespace

Criteria ErratumItem::criteria() const {
    return Criteria::WithField("id", push_item_.name);
}

std::string ErratumItem::NextVersion() const {
    if (!unit_) {
        return push_item_.version.empty() ? "1" : push_item_.version;
    }
    const std::string& current = unit_->version;
    long value = 0;
    auto [ptr, ec] = std::from_chars(current.data(), current.data() + current.size(), value);
    if (current.empty() || ec != std::errc() || ptr != current.data() + current.size()) {
        return "1";
    }
    return std::to_string(value + 1);
}

Unit ErratumItem::DesiredUnit() const {
    Unit unit;
    unit.type = UnitType::kErratum;
    unit.name = push_item_.name;
    unit.description = push_item_.description;
    unit.version = NextVersion();
    unit.erratum = push_item_.erratum;
    return unit;
}

ContentItemPtr ErratumItem::WithUnit(std::optional<Unit> unit) const {
    auto out = std::static_pointer_cast<const ErratumItem>(ContentItem::WithUnit(std::move(unit)));
    if (out->state() == ItemState::kPartial || out->state() == ItemState::kInRepos) {
        if (!SameContent(out->DesiredUnit(), *out->unit())) {
            auto reupload = std::make_shared<ErratumItem>(*out);
            reupload->state_ = ItemState::kNeedsReupload;
            return reupload;
        }
    }
    return out;
}

std::vector<std::string> ErratumItem::PublishRepos() const {
    std::vector<std::string> repos = push_item_.dest;
    auto present = InRepos();
    repos.insert(repos.end(), present.begin(), present.end());
    repos.erase(std::remove_if(repos.begin(), repos.end(),
                               [](const std::string& r) { return absl::StartsWith(r, kAllRpmContentPrefix); }),
                repos.end());
    std::sort(repos.begin(), repos.end());
    repos.erase(std::unique(repos.begin(), repos.end()), repos.end());
    return repos;
}

} // namespace Pushline
