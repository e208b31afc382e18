#include "content_item.h"
#include "direct_item.h"
#include "erratum_item.h"
#include "file_item.h"
#include "rpm_item.h"

// Maps each ItemKind to its handler.

namespace Pushline {

ContentItemPtr ContentItem::Create(PushItem push_item) {
    switch (push_item.kind) {
        case ItemKind::kRpm:
            return std::make_shared<RpmItem>(std::move(push_item));
        case ItemKind::kFile:
            return std::make_shared<FileItem>(std::move(push_item));
        case ItemKind::kErratum:
            return std::make_shared<ErratumItem>(std::move(push_item));
        case ItemKind::kModulemd:
            return std::make_shared<ModulemdItem>(std::move(push_item));
        case ItemKind::kComps:
            return std::make_shared<CompsItem>(std::move(push_item));
        case ItemKind::kProductId:
            return std::make_shared<ProductIdItem>(std::move(push_item));
    }
    throw std::logic_error("Unhandled item kind");
}

} // namespace Pushline
