#pragma once

#include "backup/collaborators.hpp"

// AES-256-CBC with a random 8-byte salt, readable by
// `openssl enc -d -aes-256-cbc -md sha256`.
class OpenSSLCipher : public Cipher {
public:
    ToolResult encrypt(const std::string& plainFile, const std::string& cipherFile,
                       const std::string& passphrase) override;
    ToolResult decrypt(const std::string& cipherFile, const std::string& plainFile,
                       const std::string& passphrase) override;

    // Base64 of 32 random bytes, as `openssl rand -base64 32` prints it.
    static std::string generatePassphrase();
};
