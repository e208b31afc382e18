#ifndef PUSHLINE_ITEMS_ERRATUM_ITEM_H_
#define PUSHLINE_ITEMS_ERRATUM_ITEM_H_

#include "content_item.h"

namespace Pushline {

/**
 * Advisory. Matched by id; the service keeps a version counter which must
 * move forward for changed content to be accepted, so any content change
 * is a re-upload with a bumped version.
 */
class ErratumItem : public ContentItem {
public:
    using ContentItem::ContentItem;

    ItemKind kind() const override { return ItemKind::kErratum; }
    std::optional<UnitType> unit_type() const override { return UnitType::kErratum; }
    bool blocking_checksums() const override { return false; }

    Criteria criteria() const override;
    ContentItemPtr WithUnit(std::optional<Unit> unit) const override;

    /// Every repository holding the advisory except the all-rpm-content ones
    std::vector<std::string> PublishRepos() const override;

    /// Version to upload with: one past the stored counter
    std::string NextVersion() const;

protected:
    std::shared_ptr<ContentItem> Clone() const override { return std::make_shared<ErratumItem>(*this); }
    Unit DesiredUnit() const override;
    std::string MatchKey() const override { return push_item_.name; }
    std::string UnitMatchKey(const Unit& unit) const override { return unit.name; }
};

} // namespace Pushline

#endif // PUSHLINE_ITEMS_ERRATUM_ITEM_H_
