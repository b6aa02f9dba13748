#include "protocol.hpp"

#include "utils.hpp"

json make_blob_info_request(const std::string& hash) {
    json j;
    j["type"] = "blob_info_request";
    j["hash"] = hash;
    return j;
}

json make_blob_info_response(const BlobEntry& entry) {
    json j;
    j["type"] = "blob_info_response";
    j["hash"] = entry.hash;
    j["size"] = entry.size;
    j["name"] = entry.name;
    return j;
}

json make_chunk_request(const std::string& request_id,
                        const std::string& hash,
                        uint64_t offset,
                        std::size_t length) {
    json j;
    j["type"] = "blob_chunk_request";
    j["request_id"] = request_id;
    j["hash"] = hash;
    j["offset"] = offset;
    j["length"] = length;
    return j;
}

json make_chunk_response(const std::string& request_id,
                         const std::string& hash,
                         uint64_t offset,
                         const std::vector<char>& data) {
    json j;
    j["type"] = "blob_chunk_response";
    j["request_id"] = request_id;
    j["hash"] = hash;
    j["offset"] = offset;
    j["length"] = data.size();
    j["chunk_sha"] = sha256_hex(data);
    j["data"] = base64_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
    return j;
}

json make_error_response(const std::string& type,
                         const std::string& request_id,
                         const std::string& hash,
                         const std::string& error) {
    json j;
    j["type"] = type;
    if(!request_id.empty()) j["request_id"] = request_id;
    j["hash"] = hash;
    j["error"] = error;
    return j;
}

bool parse_blob_info_response(const json& j, BlobInfo& out) {
    if(!j.is_object() || j.value("type", "") != "blob_info_response") return false;
    out.hash = j.value("hash", "");
    out.error = j.value("error", "");
    if(!out.error.empty()) return true;
    if(!j.contains("size") || !j["size"].is_number_unsigned()) return false;
    out.size = j["size"].get<uint64_t>();
    out.name = j.value("name", "");
    return true;
}

bool parse_chunk_response(const json& j, ChunkResponse& out) {
    if(!j.is_object() || j.value("type", "") != "blob_chunk_response") return false;
    out.request_id = j.value("request_id", "");
    out.hash = j.value("hash", "");
    out.offset = j.value("offset", 0ULL);
    out.error = j.value("error", "");
    if(!out.error.empty()) {
        out.success = false;
        return true;
    }
    auto decoded = base64_decode(j.value("data", ""));
    if(!decoded) return false;
    out.data.assign(decoded->begin(), decoded->end());
    out.chunk_sha = j.value("chunk_sha", "");
    out.success = true;
    return true;
}
