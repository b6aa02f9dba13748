#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "blob_index.hpp"

using json = nlohmann::json;

// protocol.hpp
// Newline-delimited JSON spoken between a fetching node and a provider.
inline constexpr std::size_t kMaxChunkSize = 256 * 1024;
inline constexpr std::size_t kMinChunkSize = 4 * 1024;

json make_blob_info_request(const std::string& hash);
json make_blob_info_response(const BlobEntry& entry);
json make_chunk_request(const std::string& request_id,
                        const std::string& hash,
                        uint64_t offset,
                        std::size_t length);
json make_chunk_response(const std::string& request_id,
                         const std::string& hash,
                         uint64_t offset,
                         const std::vector<char>& data);
json make_error_response(const std::string& type,
                         const std::string& request_id,
                         const std::string& hash,
                         const std::string& error);

struct BlobInfo {
  std::string hash;
  uint64_t size = 0;
  std::string name;
  std::string error;
};

struct ChunkResponse {
  std::string request_id;
  std::string hash;
  uint64_t offset = 0;
  std::vector<char> data;
  std::string chunk_sha;
  bool success = false;
  std::string error;
};

// False when the message is not a well-formed response of the expected type.
bool parse_blob_info_response(const json& j, BlobInfo& out);
bool parse_chunk_response(const json& j, ChunkResponse& out);
