#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct evp_md_ctx_st;

std::string hex_from_bytes(const std::vector<unsigned char>& bytes);
bool is_lower_hex(const std::string& value, std::size_t expected_length);
std::vector<unsigned char> sha256_bytes(const std::string& data);
std::string sha256_hex(const std::string& data);
std::string sha256_hex(const std::vector<char>& data);

// Incremental SHA-256 over a byte stream.
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();
  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const char* data, std::size_t size);
  std::string finish_hex();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
  bool finished_ = false;
};

std::string base64_encode(const unsigned char* data, std::size_t size);
std::optional<std::string> base64_decode(const std::string& encoded);

// URL-safe alphabet ('-' and '_'), no padding.
std::string base64url_encode(const std::string& data);
std::optional<std::string> base64url_decode(const std::string& encoded);

std::string random_hex_id(std::size_t bytes);
std::string format_size(uint64_t bytes);
std::string trim_copy(std::string value);
