#include "common/checksum.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <memory>
#include <vector>
#include <openssl/evp.h>

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string toHex(const unsigned char* hash, unsigned int hashLen) {
    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace

std::string Checksum::sha256File(const std::string& filePath, std::string& error) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        error = "Failed to open " + filePath;
        return "";
    }

    DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        error = "Failed to create OpenSSL context";
        return "";
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        error = "Failed to initialize digest";
        return "";
    }

    std::vector<char> buffer(64 * 1024);
    while (file.good()) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file.gcount() > 0) {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(file.gcount())) != 1) {
                error = "Failed to update digest";
                return "";
            }
        }
    }
    if (file.bad()) {
        error = "Read error on " + filePath;
        return "";
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
        error = "Failed to finalize digest";
        return "";
    }

    return toHex(hash, hashLen);
}

std::string Checksum::sha256(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1) {
        return "";
    }
    return toHex(hash, hashLen);
}
