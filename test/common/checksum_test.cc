#include <gtest/gtest.h>
#include "../../src/common/checksum.h"
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <openssl/evp.h>

using namespace Pushline;

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("pushline_checksum_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::ofstream out(path_, std::ios::binary);
        out << "abc";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    std::filesystem::path path_;
};

TEST_F(ChecksumTest, KnownDigests) {
    auto sums = ComputeFileChecksums(path_.string());
    EXPECT_EQ(sums.md5sum, "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(sums.sha256sum, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, MissingFileThrows) {
    EXPECT_THROW(ComputeFileChecksums((path_.string() + ".missing")), std::system_error);
}

namespace {

std::string OneShotHex(const std::string& data, const EVP_MD* md) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EXPECT_EQ(EVP_Digest(data.data(), data.size(), digest, &len, md, nullptr), 1);
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0xf]);
    }
    return out;
}

} // namespace

TEST_F(ChecksumTest, LargeFileIsDigestedAcrossReads) {
    // Several read chunks, the last one partial
    std::string data;
    for (size_t i = 0; i < (3u << 20) + 12345; ++i) {
        data.push_back(static_cast<char>('a' + i % 26));
    }
    {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out << data;
    }

    auto sums = ComputeFileChecksums(path_.string());
    EXPECT_EQ(sums.md5sum, OneShotHex(data, EVP_md5()));
    EXPECT_EQ(sums.sha256sum, OneShotHex(data, EVP_sha256()));
}
