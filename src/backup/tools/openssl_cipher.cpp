#include "backup/tools/openssl_cipher.hpp"
#include "common/logger.hpp"
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace {

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

const char kMagic[] = "Salted__";
const size_t kMagicLen = 8;
const size_t kSaltLen = 8;
const size_t kChunkSize = 64 * 1024;

bool deriveKey(const std::string& passphrase, const unsigned char* salt,
               unsigned char* key, unsigned char* iv) {
    int keyLen = EVP_BytesToKey(EVP_aes_256_cbc(), EVP_sha256(), salt,
                                reinterpret_cast<const unsigned char*>(passphrase.data()),
                                static_cast<int>(passphrase.size()), 1, key, iv);
    return keyLen == EVP_CIPHER_key_length(EVP_aes_256_cbc());
}

// Streams in through the initialized context into out.
bool transform(EVP_CIPHER_CTX* ctx, std::ifstream& in, std::ofstream& out, std::string& error) {
    std::vector<unsigned char> input(kChunkSize);
    std::vector<unsigned char> output(kChunkSize + EVP_MAX_BLOCK_LENGTH);
    int outLen = 0;

    while (in.good()) {
        in.read(reinterpret_cast<char*>(input.data()), static_cast<std::streamsize>(input.size()));
        std::streamsize readLen = in.gcount();
        if (readLen <= 0) {
            break;
        }
        if (EVP_CipherUpdate(ctx, output.data(), &outLen, input.data(), static_cast<int>(readLen)) != 1) {
            error = "cipher update failed";
            return false;
        }
        out.write(reinterpret_cast<const char*>(output.data()), outLen);
    }

    if (EVP_CipherFinal_ex(ctx, output.data(), &outLen) != 1) {
        error = "bad passphrase or corrupt data";
        return false;
    }
    out.write(reinterpret_cast<const char*>(output.data()), outLen);
    out.flush();
    if (!out) {
        error = "write failed";
        return false;
    }
    return true;
}

} // namespace

ToolResult OpenSSLCipher::encrypt(const std::string& plainFile, const std::string& cipherFile,
                                  const std::string& passphrase) {
    std::ifstream in(plainFile, std::ios::binary);
    if (!in.is_open()) {
        return ToolResult::failure("Failed to open " + plainFile);
    }
    std::ofstream out(cipherFile, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ToolResult::failure("Failed to open " + cipherFile + " for writing");
    }

    unsigned char salt[kSaltLen];
    if (RAND_bytes(salt, sizeof(salt)) != 1) {
        return ToolResult::failure("Failed to generate salt");
    }
    unsigned char key[EVP_MAX_KEY_LENGTH];
    unsigned char iv[EVP_MAX_IV_LENGTH];
    if (!deriveKey(passphrase, salt, key, iv)) {
        return ToolResult::failure("Failed to derive key");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key, iv, 1) != 1) {
        return ToolResult::failure("Failed to initialize cipher");
    }

    out.write(kMagic, kMagicLen);
    out.write(reinterpret_cast<const char*>(salt), sizeof(salt));

    std::string error;
    if (!transform(ctx.get(), in, out, error)) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(cipherFile, ec);
        return ToolResult::failure("Encryption of " + plainFile + " failed: " + error);
    }
    Logger::info("Encrypted " + plainFile + " to " + cipherFile);
    return ToolResult::ok();
}

ToolResult OpenSSLCipher::decrypt(const std::string& cipherFile, const std::string& plainFile,
                                  const std::string& passphrase) {
    std::ifstream in(cipherFile, std::ios::binary);
    if (!in.is_open()) {
        return ToolResult::failure("Failed to open " + cipherFile);
    }

    char header[kMagicLen + kSaltLen];
    in.read(header, sizeof(header));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(header)) ||
        std::memcmp(header, kMagic, kMagicLen) != 0) {
        return ToolResult::failure(cipherFile + " is not a salted OpenSSL file");
    }

    unsigned char key[EVP_MAX_KEY_LENGTH];
    unsigned char iv[EVP_MAX_IV_LENGTH];
    if (!deriveKey(passphrase, reinterpret_cast<const unsigned char*>(header + kMagicLen), key, iv)) {
        return ToolResult::failure("Failed to derive key");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key, iv, 0) != 1) {
        return ToolResult::failure("Failed to initialize cipher");
    }

    std::ofstream out(plainFile, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ToolResult::failure("Failed to open " + plainFile + " for writing");
    }

    std::string error;
    if (!transform(ctx.get(), in, out, error)) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(plainFile, ec);
        return ToolResult::failure("Decryption of " + cipherFile + " failed: " + error);
    }
    Logger::info("Decrypted " + cipherFile + " to " + plainFile);
    return ToolResult::ok();
}

std::string OpenSSLCipher::generatePassphrase() {
    unsigned char random[32];
    if (RAND_bytes(random, sizeof(random)) != 1) {
        return "";
    }
    // 32 bytes encode to 44 characters plus the terminator
    unsigned char encoded[4 * ((sizeof(random) + 2) / 3) + 1];
    int length = EVP_EncodeBlock(encoded, random, sizeof(random));
    return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(length));
}
