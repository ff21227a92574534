#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <cstddef>
#include <string>

struct FileDigests {
    std::string md5;
    std::string sha1;
};

// Lowercase hex encoding of a byte buffer.
std::string HexEncode(const unsigned char* data, size_t len);

// MD5 and SHA-1 of the given contents, both fed from the same buffer.
FileDigests ComputeFileDigests(const std::string& contents);

#endif // DIGEST_HPP
