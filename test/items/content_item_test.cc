#include <gtest/gtest.h>
#include "../../src/items/content_item.h"
#include "../../src/items/erratum_item.h"
#include "../../src/items/file_item.h"
#include "../../src/items/rpm_item.h"
#include "../../src/remote/fake_controller.h"
#include "../test_util.h"

using namespace Pushline;
using namespace Pushline::testing_util;

class ItemStateTest : public ::testing::Test {
protected:
    static Unit RpmUnit(const std::string& sha, std::vector<std::string> repos) {
        Unit unit;
        unit.type = UnitType::kRpm;
        unit.unit_id = "unit-" + sha;
        unit.name = "walrus-5.21-1.noarch.rpm";
        unit.sha256sum = sha;
        unit.repository_memberships = std::move(repos);
        return unit;
    }

    ContentItemPtr rpm_ = ContentItem::Create(MakeRpm("walrus-5.21-1.noarch.rpm", "aaa", {"repo1", "repo2"}));
};

TEST_F(ItemStateTest, InitialStateIsUnknown) {
    EXPECT_EQ(rpm_->state(), ItemState::kUnknown);
    EXPECT_FALSE(rpm_->unit().has_value());
}

TEST_F(ItemStateTest, NoUnitIsMissing) {
    EXPECT_EQ(rpm_->WithUnit(std::nullopt)->state(), ItemState::kMissing);
}

TEST_F(ItemStateTest, UnitWithoutMembershipsIsOrphan) {
    EXPECT_EQ(rpm_->WithUnit(RpmUnit("aaa", {}))->state(), ItemState::kOrphan);
}

TEST_F(ItemStateTest, SomeDestinationsMissingIsPartial) {
    auto item = rpm_->WithUnit(RpmUnit("aaa", {"all-rpm-content", "repo1"}));
    EXPECT_EQ(item->state(), ItemState::kPartial);
    EXPECT_EQ(item->MissingRepos(), std::vector<std::string>{"repo2"});
}

TEST_F(ItemStateTest, AllDestinationsPresentIsInRepos) {
    auto item = rpm_->WithUnit(RpmUnit("aaa", {"repo1", "repo2"}));
    EXPECT_EQ(item->state(), ItemState::kInRepos);
    EXPECT_TRUE(item->MissingRepos().empty());
}

TEST_F(ItemStateTest, TransitionsLeaveOriginalUntouched) {
    auto item = rpm_->WithUnit(RpmUnit("aaa", {"repo1"}));
    EXPECT_EQ(rpm_->state(), ItemState::kUnknown);
    EXPECT_NE(item.get(), rpm_.get());
}

TEST_F(ItemStateTest, FileFieldMismatchNeedsUpdate) {
    auto file = ContentItem::Create(MakeFile("disk.iso", "bbb", {"iso-repo"}, "Boot disk"));

    Unit unit;
    unit.type = UnitType::kFile;
    unit.unit_id = "unit-1";
    unit.name = "disk.iso";
    unit.sha256sum = "bbb";
    unit.description = "Old description";
    unit.repository_memberships = {"iso-repo"};

    auto item = file->WithUnit(unit);
    EXPECT_EQ(item->state(), ItemState::kNeedsUpdate);
    ASSERT_TRUE(item->UnitForUpdate().has_value());
    EXPECT_EQ(item->UnitForUpdate()->description, "Boot disk");
    EXPECT_EQ(item->UnitForUpdate()->unit_id, "unit-1");

    unit.description = "Boot disk";
    EXPECT_EQ(file->WithUnit(unit)->state(), ItemState::kInRepos);
}

TEST_F(ItemStateTest, ErratumContentMismatchNeedsReupload) {
    auto erratum = ContentItem::Create(MakeErratum("RHSA-1", {"repo1"}, "New title"));

    Unit unit;
    unit.type = UnitType::kErratum;
    unit.unit_id = "unit-2";
    unit.name = "RHSA-1";
    unit.version = "3";
    unit.erratum.title = "Old title";
    unit.erratum.severity = "Low";
    unit.repository_memberships = {"repo1"};

    EXPECT_EQ(erratum->WithUnit(unit)->state(), ItemState::kNeedsReupload);

    unit.erratum.title = "New title";
    EXPECT_EQ(erratum->WithUnit(unit)->state(), ItemState::kInRepos);
}

TEST_F(ItemStateTest, PresentStates) {
    EXPECT_TRUE(IsPresentState(ItemState::kPartial));
    EXPECT_TRUE(IsPresentState(ItemState::kInRepos));
    EXPECT_TRUE(IsPresentState(ItemState::kNeedsUpdate));
    EXPECT_FALSE(IsPresentState(ItemState::kMissing));
    EXPECT_FALSE(IsPresentState(ItemState::kOrphan));
    EXPECT_FALSE(IsPresentState(ItemState::kNeedsReupload));
    EXPECT_FALSE(IsPresentState(ItemState::kUnknown));
}

TEST(MatchItemsUnitsTest, PairsByChecksumInInputOrder) {
    ItemBatch items = {
        ContentItem::Create(MakeRpm("a-1-1.noarch.rpm", "s1", {"repo1"})),
        ContentItem::Create(MakeRpm("b-1-1.noarch.rpm", "s2", {"repo1"})),
    };
    Unit unit;
    unit.type = UnitType::kRpm;
    unit.name = "b-1-1.noarch.rpm";
    unit.sha256sum = "s2";
    unit.repository_memberships = {"repo1"};

    auto matched = ContentItem::MatchItemsUnits(items, {unit});
    ASSERT_EQ(matched.size(), 2u);
    EXPECT_EQ(matched[0]->push_item().name, "a-1-1.noarch.rpm");
    EXPECT_EQ(matched[0]->state(), ItemState::kMissing);
    EXPECT_EQ(matched[1]->state(), ItemState::kInRepos);
}

TEST(MatchItemsUnitsTest, MixedKindsAreRejected) {
    ItemBatch items = {
        ContentItem::Create(MakeRpm("a-1-1.noarch.rpm", "s1", {"repo1"})),
        ContentItem::Create(MakeFile("f.txt", "s1", {"repo1"})),
    };
    EXPECT_THROW(ContentItem::MatchItemsUnits(items, {}), std::logic_error);
}

TEST(ItemsByKindTest, KeepsFirstSeenOrder) {
    ItemBatch items = {
        ContentItem::Create(MakeFile("f1", "s1", {"r"})),
        ContentItem::Create(MakeRpm("a-1-1.noarch.rpm", "s2", {"r"})),
        ContentItem::Create(MakeFile("f2", "s3", {"r"})),
    };
    auto groups = ItemsByKind(items);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].front()->kind(), ItemKind::kFile);
    ASSERT_EQ(groups[0].size(), 2u);
    EXPECT_EQ(groups[0][1]->push_item().name, "f2");
    EXPECT_EQ(groups[1].front()->kind(), ItemKind::kRpm);
}

TEST(PushStateTest, LabelTransitions) {
    auto item = ContentItem::Create(MakeRpm("a-1-1.noarch.rpm", "s1", {"repo1"}));
    EXPECT_EQ(item->push_item().state, kStatePending);
    auto exists = item->WithPushState(kStateExists);
    EXPECT_EQ(exists->push_item().state, kStateExists);
    EXPECT_EQ(exists->WithPushState(kStateExists).get(), exists.get());
}
