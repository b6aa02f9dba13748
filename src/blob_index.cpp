#include "blob_index.hpp"

#include <algorithm>
#include <fstream>

void BlobIndex::add_or_update(const BlobEntry& e){
    std::lock_guard lg(m_);
    map_[e.hash] = e;
}

bool BlobIndex::has(const std::string& hash) const {
    std::lock_guard lg(m_);
    return map_.count(hash) > 0;
}

bool BlobIndex::find(const std::string& hash, BlobEntry& out) const {
    std::lock_guard lg(m_);
    auto it = map_.find(hash);
    if(it == map_.end()) return false;
    out = it->second;
    return true;
}

std::size_t BlobIndex::size() const {
    std::lock_guard lg(m_);
    return map_.size();
}

bool BlobIndex::read_range(const std::string& hash, uint64_t offset, std::size_t length,
                           std::vector<char>& out, std::string& error) const {
    BlobEntry entry;
    if(!find(hash, entry)){
        error = "Unknown blob hash";
        return false;
    }
    if(offset >= entry.size){
        error = "Offset beyond blob size";
        return false;
    }
    auto wanted = static_cast<std::size_t>(std::min<uint64_t>(length, entry.size - offset));
    std::ifstream file(entry.path, std::ios::binary);
    if(!file || !file.seekg(static_cast<std::streamoff>(offset))){
        error = "Cannot open " + entry.path.filename().string();
        return false;
    }
    out.resize(wanted);
    file.read(out.data(), static_cast<std::streamsize>(wanted));
    if(file.gcount() != static_cast<std::streamsize>(wanted)){
        error = "Short read from " + entry.path.filename().string();
        return false;
    }
    return true;
}
