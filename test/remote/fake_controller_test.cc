#include <gtest/gtest.h>
#include "../../src/remote/fake_controller.h"
#include <filesystem>

using namespace Pushline;

class FakeControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        controller_ = std::make_shared<FakeController>();
        controller_->SeedDefaultRepositories();
        controller_->InsertRepository(Repository{"repo1", "yum", "content/dist/repo1", 0});
        controller_->InsertRepository(Repository{"repo2", "yum", "content/dist/repo2", 0});
        client_ = controller_->NewClient(2);
    }

    static Unit RpmUnit(const std::string& name, const std::string& sha, const std::string& key = "f21541eb") {
        Unit unit;
        unit.type = UnitType::kRpm;
        unit.name = name;
        unit.sha256sum = sha;
        unit.signing_key = key;
        return unit;
    }

    std::shared_ptr<FakeController> controller_;
    std::shared_ptr<RemoteClient> client_;
};

TEST_F(FakeControllerTest, UploadCreatesUnitInRepository) {
    auto tasks = client_->Upload("all-rpm-content", UploadRequest{"/src/a.rpm", RpmUnit("a-1-1.x86_64.rpm", "s1")}).get();
    ASSERT_EQ(tasks.size(), 1u);
    ASSERT_EQ(tasks[0].units.size(), 1u);
    EXPECT_EQ(tasks[0].units[0].repository_memberships, std::vector<std::string>{"all-rpm-content"});

    auto units = controller_->Units();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_FALSE(units[0].unit_id.empty());
    EXPECT_EQ(controller_->UploadHistory(), std::vector<std::string>{"all-rpm-content:a-1-1.x86_64.rpm"});
}

TEST_F(FakeControllerTest, UploadOfSameContentReusesUnit) {
    client_->Upload("all-rpm-content", UploadRequest{"", RpmUnit("a-1-1.x86_64.rpm", "s1")}).get();
    client_->Upload("repo1", UploadRequest{"", RpmUnit("a-1-1.x86_64.rpm", "s1")}).get();

    auto units = controller_->Units();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].repository_memberships, (std::vector<std::string>{"all-rpm-content", "repo1"}));
}

TEST_F(FakeControllerTest, UploadToMissingRepositoryFails) {
    auto upload = client_->Upload("nope", UploadRequest{"", RpmUnit("a-1-1.x86_64.rpm", "s1")});
    EXPECT_THROW(upload.get(), std::runtime_error);
}

TEST_F(FakeControllerTest, SearchContent) {
    controller_->InsertUnits({RpmUnit("a-1-1.x86_64.rpm", "s1"), RpmUnit("b-1-1.x86_64.rpm", "s2")});
    auto found = client_->SearchContent(Criteria::WithField("sha256sum", "s2")).get();
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "b-1-1.x86_64.rpm");
}

TEST_F(FakeControllerTest, CopyContent) {
    auto unit = RpmUnit("a-1-1.x86_64.rpm", "s1");
    unit.repository_memberships = {"all-rpm-content"};
    controller_->InsertUnits({unit});

    auto tasks = client_->CopyContent("all-rpm-content", "repo1", Criteria::WithField("sha256sum", "s1"),
                                      CopyOptions{}).get();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].units.size(), 1u);
    EXPECT_EQ(controller_->UnitsInRepository("repo1").size(), 1u);
}

TEST_F(FakeControllerTest, CopyRequiringSignaturesSkipsUnsignedRpms) {
    auto unsigned_unit = RpmUnit("a-1-1.x86_64.rpm", "s1", "");
    unsigned_unit.repository_memberships = {"all-rpm-content"};
    controller_->InsertUnits({unsigned_unit});

    client_->CopyContent("all-rpm-content", "repo1", Criteria::True(), CopyOptions{true}).get();
    EXPECT_TRUE(controller_->UnitsInRepository("repo1").empty());

    client_->CopyContent("all-rpm-content", "repo1", Criteria::True(), CopyOptions{false}).get();
    EXPECT_EQ(controller_->UnitsInRepository("repo1").size(), 1u);
}

TEST_F(FakeControllerTest, RemoveContent) {
    auto unit = RpmUnit("a-1-1.x86_64.rpm", "s1");
    unit.repository_memberships = {"repo1", "repo2"};
    controller_->InsertUnits({unit});

    client_->RemoveContent("repo1", Criteria::True()).get();
    auto units = controller_->Units();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].repository_memberships, std::vector<std::string>{"repo2"});
}

TEST_F(FakeControllerTest, UpdateContent) {
    Unit file;
    file.type = UnitType::kFile;
    file.name = "disk.iso";
    file.sha256sum = "s3";
    file.description = "old";
    controller_->InsertUnits({file});
    auto stored = controller_->Units().front();

    stored.description = "new";
    stored.version = "2.0";
    client_->UpdateContent(stored).get();

    auto updated = controller_->Units().front();
    EXPECT_EQ(updated.description, "new");
    EXPECT_EQ(updated.version, "2.0");

    Unit unknown = stored;
    unknown.unit_id = "unit-999999";
    EXPECT_THROW(client_->UpdateContent(unknown).get(), std::runtime_error);
}

TEST_F(FakeControllerTest, ErratumIsReplacedOnlyByNewerVersion) {
    Unit erratum;
    erratum.type = UnitType::kErratum;
    erratum.name = "RHBA-1";
    erratum.version = "3";
    erratum.erratum.title = "first";
    client_->Upload("repo1", UploadRequest{"", erratum}).get();

    erratum.version = "2";
    erratum.erratum.title = "older";
    client_->Upload("repo1", UploadRequest{"", erratum}).get();
    EXPECT_EQ(controller_->Units().front().erratum.title, "first");

    erratum.version = "4";
    erratum.erratum.title = "newer";
    client_->Upload("repo1", UploadRequest{"", erratum}).get();
    auto units = controller_->Units();
    ASSERT_EQ(units.size(), 1u);
    EXPECT_EQ(units[0].erratum.title, "newer");
    EXPECT_EQ(units[0].version, "4");
}

TEST_F(FakeControllerTest, PublishCountsAndHistory) {
    client_->Publish("repo1", PublishOptions{}).get();
    client_->Publish("repo2", PublishOptions{true, false}).get();
    client_->Publish("repo1", PublishOptions{}).get();

    EXPECT_EQ(controller_->PublishHistory(), (std::vector<std::string>{"repo1", "repo2", "repo1"}));
    auto repo = client_->GetRepository("repo1").get();
    EXPECT_EQ(repo.publish_count, 2u);
}

TEST_F(FakeControllerTest, StateSurvivesSaveAndLoad) {
    auto unit = RpmUnit("a-1-1.x86_64.rpm", "s1");
    unit.repository_memberships = {"repo1"};
    unit.cdn_published = "2024-01-01T00:00:00Z";
    controller_->InsertUnits({unit});

    auto path = std::filesystem::temp_directory_path() / "pushline_fake_state_test.yaml";
    controller_->SaveState(path.string());

    auto restored = std::make_shared<FakeController>();
    ASSERT_TRUE(restored->LoadState(path.string()));
    EXPECT_EQ(restored->Units(), controller_->Units());
    EXPECT_EQ(restored->Repositories(), controller_->Repositories());
    std::filesystem::remove(path);

    EXPECT_FALSE(restored->LoadState(path.string()));
}
