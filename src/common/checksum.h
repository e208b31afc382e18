#ifndef PUSHLINE_CHECKSUM_H_
#define PUSHLINE_CHECKSUM_H_

#include <string>

namespace Pushline {

struct FileChecksums {
    std::string md5sum;
    std::string sha256sum;
};

/**
 * Reads the file once and returns its md5 and sha256 as lowercase hex.
 * @throws std::system_error if the file cannot be read
 */
FileChecksums ComputeFileChecksums(const std::string& path);

} // namespace Pushline

#endif // PUSHLINE_CHECKSUM_H_
