#include "ledger/Sha256.hpp"
#include <stdexcept>
#include <openssl/evp.h>

namespace champ {

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];   // stack-local
    unsigned int  digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(HEX[digest[i] >> 4]);
        out.push_back(HEX[digest[i] & 0x0F]);
    }
    return out;
}

} // namespace champ
