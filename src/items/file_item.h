#ifndef PUSHLINE_ITEMS_FILE_ITEM_H_
#define PUSHLINE_ITEMS_FILE_ITEM_H_

#include "content_item.h"

namespace Pushline {

/**
 * Generic file. Matched by (path, sha256sum); description, version and
 * display_order may be updated in place.
 */
class FileItem : public ContentItem {
public:
    using ContentItem::ContentItem;

    ItemKind kind() const override { return ItemKind::kFile; }
    std::optional<UnitType> unit_type() const override { return UnitType::kFile; }

    Criteria criteria() const override;
    std::optional<Unit> UnitForUpdate() const override;

    std::string CdnPath() const;

protected:
    std::shared_ptr<ContentItem> Clone() const override { return std::make_shared<FileItem>(*this); }
    Unit DesiredUnit() const override;
    std::string MatchKey() const override;
    std::string UnitMatchKey(const Unit& unit) const override;
};

} // namespace Pushline

#endif // PUSHLINE_ITEMS_FILE_ITEM_H_
