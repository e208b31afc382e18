#include <gtest/gtest.h>
#include "../../src/source/content_source.h"
#include "../../src/source/item_sink.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

using namespace Pushline;

class ContentSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("pushline_source_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::string WriteManifest(const std::string& content) {
        auto path = dir_ / "manifest.yaml";
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

TEST_F(ContentSourceTest, StagedManifestItems) {
    auto path = WriteManifest(R"(
items:
  - type: rpm
    name: walrus-5.21-1.noarch.rpm
    src: rpms/walrus-5.21-1.noarch.rpm
    dest: [repo1, repo2]
    signing_key: F21541EB
    sha256sum: abc
  - type: file
    name: disk.iso
    src: /abs/disk.iso
    dest: iso-repo
    description: install media
  - type: container-image
    name: ignored
  - type: erratum
    name: RHSA-2026:0001
    dest: [repo1]
    erratum:
      title: fix walrus
      severity: Low
      references:
        - "https://example.com/bug/1"
)");

    StagedSource source(path);
    EXPECT_EQ(source.skipped(), 1u);
    EXPECT_EQ(source.description(), "staged:" + path);

    auto rpm = source.Next();
    ASSERT_TRUE(rpm);
    EXPECT_EQ(rpm->kind, ItemKind::kRpm);
    EXPECT_EQ(rpm->src, (dir_ / "rpms/walrus-5.21-1.noarch.rpm").string());
    EXPECT_EQ(rpm->dest, (std::vector<std::string>{"repo1", "repo2"}));
    EXPECT_EQ(rpm->signing_key, "F21541EB");
    EXPECT_EQ(rpm->origin, "staged:" + path);

    auto file = source.Next();
    ASSERT_TRUE(file);
    EXPECT_EQ(file->src, "/abs/disk.iso");
    EXPECT_EQ(file->dest, std::vector<std::string>{"iso-repo"});
    EXPECT_EQ(file->description, "install media");

    auto erratum = source.Next();
    ASSERT_TRUE(erratum);
    EXPECT_EQ(erratum->kind, ItemKind::kErratum);
    EXPECT_EQ(erratum->erratum.title, "fix walrus");
    EXPECT_EQ(erratum->erratum.references, std::vector<std::string>{"https://example.com/bug/1"});

    EXPECT_FALSE(source.Next());
    EXPECT_FALSE(source.Next());
}

TEST_F(ContentSourceTest, ItemWithoutNameIsRejected) {
    auto path = WriteManifest("items:\n  - type: rpm\n    dest: [repo1]\n");
    EXPECT_THROW(StagedSource source(path), std::runtime_error);
}

TEST_F(ContentSourceTest, MissingManifestIsRejected) {
    EXPECT_THROW(StagedSource source((dir_ / "absent.yaml").string()), std::runtime_error);
}

TEST_F(ContentSourceTest, OpenByUrl) {
    auto path = WriteManifest("items: []\n");
    auto source = ContentSource::Open("staged:" + path);
    ASSERT_NE(source, nullptr);
    EXPECT_FALSE(source->Next());

    EXPECT_THROW(ContentSource::Open("koji:https://koji.example.com"), std::invalid_argument);
}

TEST_F(ContentSourceTest, StaticSourceYieldsItemsInOrder) {
    PushItem a;
    a.name = "a";
    PushItem b;
    b.name = "b";
    StaticSource source({a, b});
    EXPECT_EQ(source.Next()->name, "a");
    EXPECT_EQ(source.Next()->name, "b");
    EXPECT_FALSE(source.Next());
}

TEST_F(ContentSourceTest, YamlSinkWritesLatestStates) {
    auto out_path = (dir_ / "states.yaml").string();
    YamlItemSink sink(out_path);

    PushItem item;
    item.kind = ItemKind::kFile;
    item.name = "disk.iso";
    item.src = "/abs/disk.iso";
    item.dest = {"iso-repo"};
    item.sha256sum = "abc";
    sink.UpdatePushItems({item});
    item.state = "PUSHED";
    sink.UpdatePushItems({item});
    sink.Finish();

    auto root = YAML::LoadFile(out_path);
    ASSERT_EQ(root["items"].size(), 1u);
    EXPECT_EQ(root["items"][0]["name"].as<std::string>(), "disk.iso");
    EXPECT_EQ(root["items"][0]["state"].as<std::string>(), "PUSHED");
    EXPECT_EQ(root["items"][0]["dest"][0].as<std::string>(), "iso-repo");
}

TEST_F(ContentSourceTest, YamlSinkReportsWriteFailure) {
    YamlItemSink sink((dir_ / "no-such-dir" / "states.yaml").string());
    EXPECT_THROW(sink.Finish(), std::runtime_error);
}

TEST_F(ContentSourceTest, YamlSinkKeepsOneEntryPerItemAndDestination) {
    auto out_path = (dir_ / "states.yaml").string();
    YamlItemSink sink(out_path);

    std::vector<PushItem> items;
    for (int i = 0; i < 3; ++i) {
        PushItem item;
        item.kind = ItemKind::kRpm;
        item.name = "pkg-" + std::to_string(i);
        item.src = "/staged/pkg-" + std::to_string(i);
        item.dest = {"repo1"};
        items.push_back(item);
    }
    PushItem other_dest = items[0];
    other_dest.dest = {"repo2"};
    items.push_back(other_dest);
    sink.UpdatePushItems(items);

    for (auto& item : items) {
        item.state = "EXISTS";
    }
    sink.UpdatePushItems({items[2], items[0]});
    items[1].state = "PUSHED";
    sink.UpdatePushItems({items[1]});
    sink.Finish();

    auto root = YAML::LoadFile(out_path);
    ASSERT_EQ(root["items"].size(), 4u);
    EXPECT_EQ(root["items"][0]["name"].as<std::string>(), "pkg-0");
    EXPECT_EQ(root["items"][0]["state"].as<std::string>(), "EXISTS");
    EXPECT_EQ(root["items"][1]["state"].as<std::string>(), "PUSHED");
    EXPECT_EQ(root["items"][2]["state"].as<std::string>(), "EXISTS");
    EXPECT_EQ(root["items"][3]["name"].as<std::string>(), "pkg-0");
    EXPECT_EQ(root["items"][3]["dest"][0].as<std::string>(), "repo2");
    EXPECT_EQ(root["items"][3]["state"].as<std::string>(), "PENDING");
}
