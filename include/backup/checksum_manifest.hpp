#pragma once

#include <string>
#include <vector>

struct ManifestEntry {
    std::string checksum;
    std::string relativePath;   // relative to the job directory, e.g. "etc/hosts"
};

// Per-step list of SHA-256 digests, stored as <job>/.manifest/<step>.sha256
// in sha256sum format ("<digest>  <path>").
class ChecksumManifest {
public:
    static std::string pathFor(const std::string& jobDir, const std::string& stepId);

    // Digests every non-directory entry below <root>/<stepId>. Symlinks are
    // hashed by their target, other special files by their type.
    static bool build(const std::string& root, const std::string& stepId,
                      std::vector<ManifestEntry>& entries, std::string& error);

    // Digest of one entry as build() computes it.
    static std::string digestEntry(const std::string& path, std::string& error);

    static bool write(const std::string& manifestPath, const std::vector<ManifestEntry>& entries,
                      std::string& error);
    static bool read(const std::string& manifestPath, std::vector<ManifestEntry>& entries,
                     std::string& error);

    // build() + atomic write() for a step of the job.
    static bool commit(const std::string& jobDir, const std::string& stepId, std::string& error);
};
