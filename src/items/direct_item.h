#ifndef PUSHLINE_ITEMS_DIRECT_ITEM_H_
#define PUSHLINE_ITEMS_DIRECT_ITEM_H_

#include "content_item.h"

namespace Pushline {

/**
 * Content uploaded straight into every destination on every push, with no
 * existence check. Presence is tracked by the repositories uploaded to
 * during this run.
 */
class DirectUploadItem : public ContentItem {
public:
    using ContentItem::ContentItem;

    std::optional<UnitType> unit_type() const override { return std::nullopt; }

    const std::vector<std::string>& uploaded_repos() const { return uploaded_repos_; }

    /// Sorted uploaded_repos
    std::vector<std::string> InRepos() const override;

    /**
     * Uploads into every destination and confirms each upload reported a unit.
     * @throws ConfirmationError if an upload returned no unit
     */
    ContentItemPtr EnsureUploaded(UploadContext& ctx) const override;

protected:
    virtual UnitType upload_type() const = 0;
    Unit DesiredUnit() const override;

    std::vector<std::string> uploaded_repos_;
};

/// Module metadata; Associate orders packages behind these.
class ModulemdItem : public DirectUploadItem {
public:
    using DirectUploadItem::DirectUploadItem;
    ItemKind kind() const override { return ItemKind::kModulemd; }

protected:
    std::shared_ptr<ContentItem> Clone() const override { return std::make_shared<ModulemdItem>(*this); }
    UnitType upload_type() const override { return UnitType::kModulemd; }
};

/// Package group metadata
class CompsItem : public DirectUploadItem {
public:
    using DirectUploadItem::DirectUploadItem;
    ItemKind kind() const override { return ItemKind::kComps; }

protected:
    std::shared_ptr<ContentItem> Clone() const override { return std::make_shared<CompsItem>(*this); }
    UnitType upload_type() const override { return UnitType::kComps; }
};

/// Product certificate
class ProductIdItem : public DirectUploadItem {
public:
    using DirectUploadItem::DirectUploadItem;
    ItemKind kind() const override { return ItemKind::kProductId; }

protected:
    std::shared_ptr<ContentItem> Clone() const override { return std::make_shared<ProductIdItem>(*this); }
    UnitType upload_type() const override { return UnitType::kProductId; }
};

} // namespace Pushline

#endif // PUSHLINE_ITEMS_DIRECT_ITEM_H_
