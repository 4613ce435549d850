#pragma once

#include <string>

class Checksum {
public:
    // Hex encoded SHA-256 of the file contents. Returns an empty string and
    // fills error on failure.
    static std::string sha256File(const std::string& filePath, std::string& error);
    static std::string sha256(const std::string& data);
};
