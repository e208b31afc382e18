#include <gtest/gtest.h>
#include "../../src/items/direct_item.h"
#include "../../src/items/erratum_item.h"
#include "../../src/items/file_item.h"
#include "../../src/items/rpm_item.h"
#include "../test_util.h"

using namespace Pushline;
using namespace Pushline::testing_util;

TEST(RpmFilenameTest, ParsesNameVersionReleaseArch) {
    auto nvra = ParseRpmFilename("/some/dir/python3-libs-3.9.16-1.el9.x86_64.rpm");
    EXPECT_EQ(nvra.name, "python3-libs");
    EXPECT_EQ(nvra.version, "3.9.16");
    EXPECT_EQ(nvra.release, "1.el9");
    EXPECT_EQ(nvra.arch, "x86_64");
}

TEST(RpmFilenameTest, RejectsMalformedNames) {
    EXPECT_THROW(ParseRpmFilename("walrus.tar.gz"), ValidationError);
    EXPECT_THROW(ParseRpmFilename("walrus.noarch.rpm"), ValidationError);
    EXPECT_THROW(ParseRpmFilename("walrus-1.noarch.rpm"), ValidationError);
    EXPECT_THROW(ParseRpmFilename("-1-2.noarch.rpm"), ValidationError);
}

TEST(RpmItemTest, UnsignedRpmsNeedPermission) {
    auto item = ContentItem::Create(MakeRpm("walrus-5.21-1.noarch.rpm", "s1", {"repo1"}, ""));
    EXPECT_THROW(item->Validate(false), ValidationError);
    EXPECT_NO_THROW(item->Validate(true));

    auto signed_item = ContentItem::Create(MakeRpm("walrus-5.21-1.noarch.rpm", "s1", {"repo1"}));
    EXPECT_NO_THROW(signed_item->Validate(false));
}

TEST(RpmItemTest, CdnPath) {
    RpmItem item(MakeRpm("walrus-5.21-1.noarch.rpm", "s1", {"repo1"}, "F21541EB"));
    EXPECT_EQ(item.CdnPath(), "/content/origin/rpms/walrus/5.21/1/f21541eb/walrus-5.21-1.noarch.rpm");
    EXPECT_TRUE(item.can_pre_push());
}

TEST(ErratumItemTest, NextVersion) {
    auto erratum = MakeErratum("RHBA-1", {"repo1"}, "title");
    EXPECT_EQ(ErratumItem(erratum).NextVersion(), "1");

    erratum.version = "5";
    EXPECT_EQ(ErratumItem(erratum).NextVersion(), "5");

    Unit unit;
    unit.type = UnitType::kErratum;
    unit.name = "RHBA-1";
    unit.version = "7";
    unit.repository_memberships = {"repo1"};
    auto with_unit = std::static_pointer_cast<const ErratumItem>(ErratumItem(erratum).WithUnit(unit));
    EXPECT_EQ(with_unit->NextVersion(), "8");

    unit.version = "not-a-number";
    with_unit = std::static_pointer_cast<const ErratumItem>(ErratumItem(erratum).WithUnit(unit));
    EXPECT_EQ(with_unit->NextVersion(), "1");
}

TEST(ErratumItemTest, PublishReposSkipAllRpmContent) {
    auto item = std::make_shared<ErratumItem>(MakeErratum("RHBA-1", {"repo2"}, "title"));
    Unit unit;
    unit.type = UnitType::kErratum;
    unit.name = "RHBA-1";
    unit.erratum = item->push_item().erratum;
    unit.repository_memberships = {"all-rpm-content-ab", "repo1"};

    auto with_unit = item->WithUnit(unit);
    EXPECT_EQ(with_unit->PublishRepos(), (std::vector<std::string>{"repo1", "repo2"}));
}

TEST(FileItemTest, CdnPathUsesChecksum) {
    FileItem item(MakeFile("images/disk.iso", "abcdef", {"iso-repo"}));
    EXPECT_EQ(item.CdnPath(), "/content/origin/files/sha256/ab/abcdef/disk.iso");
}

TEST(DirectItemTest, NeverSearched) {
    auto module = ContentItem::Create(MakeModulemd("walrus:1:2:abc:x86_64", "m1", {"repo1"}));
    EXPECT_EQ(module->kind(), ItemKind::kModulemd);
    EXPECT_FALSE(module->unit_type().has_value());
    EXPECT_FALSE(module->can_pre_push());
    EXPECT_TRUE(module->InRepos().empty());
}

TEST(ItemKindTest, NamesRoundTrip) {
    for (auto kind : {ItemKind::kRpm, ItemKind::kFile, ItemKind::kErratum, ItemKind::kModulemd, ItemKind::kComps,
                      ItemKind::kProductId}) {
        auto parsed = ParseItemKind(ItemKindName(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
    EXPECT_FALSE(ParseItemKind("container-image").has_value());
}
