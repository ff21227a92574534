#include "digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpMdCtxPtr NewDigestContext(const EVP_MD* md, const char* name) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error(std::string("Failed to allocate ") + name + " context");
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        throw std::runtime_error(std::string("Failed to initialise ") + name + " digest");
    }
    return ctx;
}

std::string FinalHex(EVP_MD_CTX* ctx, const char* name) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1) {
        throw std::runtime_error(std::string("Failed to finalise ") + name + " digest");
    }
    return HexEncode(hash, len);
}

} // namespace

std::string HexEncode(const unsigned char* data, size_t len) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << (int)data[i];
    }
    return ss.str();
}

FileDigests ComputeFileDigests(const std::string& contents) {
    EvpMdCtxPtr md5 = NewDigestContext(EVP_md5(), "MD5");
    EvpMdCtxPtr sha1 = NewDigestContext(EVP_sha1(), "SHA-1");

    if (EVP_DigestUpdate(md5.get(), contents.data(), contents.size()) != 1 ||
        EVP_DigestUpdate(sha1.get(), contents.data(), contents.size()) != 1) {
        throw std::runtime_error("Failed to update file digests");
    }

    FileDigests digests;
    digests.md5 = FinalHex(md5.get(), "MD5");
    digests.sha1 = FinalHex(sha1.get(), "SHA-1");
    return digests;
}
