#include "checksum.h"

#include <cerrno>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <glog/logging.h>
#include <openssl/evp.h>

namespace Pushline {

namespace {

constexpr size_t kReadChunk = 1 << 20;

struct FileCloser {
    void operator()(FILE* f) const { if (f) fclose(f); }
};

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

DigestCtx NewDigest(const EVP_MD* md) {
    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest context");
    }
    return ctx;
}

std::string FinishHex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0xf]);
    }
    return out;
}

} // namespace

FileChecksums ComputeFileChecksums(const std::string& path) {
    std::unique_ptr<FILE, FileCloser> file(fopen(path.c_str(), "rb"));
    if (!file) {
        throw std::system_error(errno, std::generic_category(), "Failed to open " + path);
    }

    DigestCtx md5 = NewDigest(EVP_md5());
    DigestCtx sha256 = NewDigest(EVP_sha256());

    std::vector<unsigned char> buf(kReadChunk);
    size_t total = 0;
    while (true) {
        size_t n = fread(buf.data(), 1, buf.size(), file.get());
        if (n > 0) {
            if (EVP_DigestUpdate(md5.get(), buf.data(), n) != 1 ||
                EVP_DigestUpdate(sha256.get(), buf.data(), n) != 1) {
                throw std::runtime_error("Failed to update digest of " + path);
            }
            total += n;
        }
        if (n < buf.size()) {
            if (ferror(file.get())) {
                throw std::system_error(errno, std::generic_category(), "Failed to read " + path);
            }
            break;
        }
    }

    FileChecksums sums;
    sums.md5sum = FinishHex(md5.get());
    sums.sha256sum = FinishHex(sha256.get());
    VLOG(3) << "\t[Checksum]\t\t" << path << " (" << total << " bytes) sha256=" << sums.sha256sum;
    return sums;
}

} // namespace Pushline
