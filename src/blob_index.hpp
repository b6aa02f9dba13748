#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct BlobEntry {
    std::string hash; // hex
    std::filesystem::path path;
    uint64_t size = 0;
    std::string name;
};

// Blobs this node is currently providing, keyed by content hash.
class BlobIndex {
public:
    void add_or_update(const BlobEntry&);
    bool has(const std::string& hash) const;
    bool find(const std::string& hash, BlobEntry& out) const;
    std::size_t size() const;

    // Reads up to `length` bytes of the blob starting at `offset`. Fails with
    // a reason for an unknown hash, an offset at or past the end, or a file
    // that can no longer be read.
    bool read_range(const std::string& hash, uint64_t offset, std::size_t length,
                    std::vector<char>& out, std::string& error) const;
private:
    mutable std::mutex m_;
    std::unordered_map<std::string, BlobEntry> map_; // hash -> entry
};
