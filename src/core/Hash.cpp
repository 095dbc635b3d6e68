#include "bastion/core/Hash.hpp"

#include <openssl/evp.h>

namespace bastion {

std::string sha256Hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];   // stack-local
    unsigned int  digest_len = 0;

    if (EVP_Digest(data.data(), data.size(),
                   digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        return std::string();
    }

    static const char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

} // namespace bastion
