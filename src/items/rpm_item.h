#ifndef PUSHLINE_ITEMS_RPM_ITEM_H_
#define PUSHLINE_ITEMS_RPM_ITEM_H_

#include "content_item.h"

namespace Pushline {

/// Name, version, release and arch parsed from an RPM filename
struct RpmNvra {
    std::string name;
    std::string version;
    std::string release;
    std::string arch;
};

/**
 * Parses "<name>-<version>-<release>.<arch>.rpm".
 * @throws ValidationError if filename does not follow that pattern
 */
RpmNvra ParseRpmFilename(const std::string& filename);

/**
 * Binary or source RPM. Matched by sha256sum; uploaded into the shared
 * rpm upload repository, then associated into its destinations.
 */
class RpmItem : public ContentItem {
public:
    using ContentItem::ContentItem;

    ItemKind kind() const override { return ItemKind::kRpm; }
    std::optional<UnitType> unit_type() const override { return UnitType::kRpm; }
    bool can_pre_push() const override { return true; }

    void Validate(bool allow_unsigned) const override;

    /// Path under which the package is served once published
    std::string CdnPath() const;

protected:
    std::shared_ptr<ContentItem> Clone() const override { return std::make_shared<RpmItem>(*this); }
    Unit DesiredUnit() const override;
};

} // namespace Pushline

#endif // PUSHLINE_ITEMS_RPM_ITEM_H_
