#include "utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
  std::ostringstream oss;
  for(auto c : b) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  return oss.str();
}

bool is_lower_hex(const std::string& value, std::size_t expected_length) {
  if(value.size() != expected_length) return false;
  return std::all_of(value.begin(), value.end(), [](char c){
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
}

std::vector<unsigned char> sha256_bytes(const std::string& data){
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
  return out;
}

std::string sha256_hex(const std::string& data){
  return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_hex(const std::vector<char>& data){
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
  return hex_from_bytes(out);
}

void Sha256Stream::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
  if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Unable to initialise SHA-256 context");
  }
}

Sha256Stream::~Sha256Stream() = default;

void Sha256Stream::update(const char* data, std::size_t size) {
  if(finished_) throw std::logic_error("Sha256Stream::update after finish");
  if(size == 0) return;
  if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("SHA-256 update failed");
  }
}

std::string Sha256Stream::finish_hex() {
  if(finished_) throw std::logic_error("Sha256Stream::finish_hex called twice");
  finished_ = true;
  std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
  unsigned int length = 0;
  if(EVP_DigestFinal_ex(ctx_.get(), out.data(), &length) != 1) {
    throw std::runtime_error("SHA-256 finalisation failed");
  }
  out.resize(length);
  return hex_from_bytes(out);
}

std::string base64_encode(const unsigned char* data, std::size_t size) {
  if(size == 0) return {};
  std::string out(4 * ((size + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                data,
                                static_cast<int>(size));
  out.resize(static_cast<std::size_t>(std::max(written, 0)));
  return out;
}

std::optional<std::string> base64_decode(const std::string& encoded) {
  if(encoded.empty()) return std::string();
  if(encoded.size() % 4 != 0) return std::nullopt;
  std::string out(3 * encoded.size() / 4, '\0');
  int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                reinterpret_cast<const unsigned char*>(encoded.data()),
                                static_cast<int>(encoded.size()));
  if(written < 0) return std::nullopt;
  // EVP_DecodeBlock keeps the bytes produced by '=' padding; drop them.
  std::size_t padding = 0;
  if(encoded[encoded.size() - 1] == '=') ++padding;
  if(encoded[encoded.size() - 2] == '=') ++padding;
  out.resize(static_cast<std::size_t>(written) - padding);
  return out;
}

std::string base64url_encode(const std::string& data) {
  auto out = base64_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
  for(auto& c : out) {
    if(c == '+') c = '-';
    else if(c == '/') c = '_';
  }
  while(!out.empty() && out.back() == '=') out.pop_back();
  return out;
}

std::optional<std::string> base64url_decode(const std::string& encoded) {
  // 4n+1 characters can never come out of the encoder.
  if(encoded.size() % 4 == 1) return std::nullopt;
  std::string standard;
  standard.reserve(encoded.size() + 3);
  for(char c : encoded) {
    if(c == '-') standard.push_back('+');
    else if(c == '_') standard.push_back('/');
    else if(std::isalnum(static_cast<unsigned char>(c))) standard.push_back(c);
    else return std::nullopt;
  }
  while(standard.size() % 4 != 0) standard.push_back('=');
  return base64_decode(standard);
}

std::string random_hex_id(std::size_t bytes) {
  std::vector<unsigned char> buf(bytes);
  if(RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
    std::random_device rd;
    for(auto& b : buf) b = static_cast<unsigned char>(rd() & 0xff);
  }
  return hex_from_bytes(buf);
}

std::string format_size(uint64_t bytes) {
  static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  std::size_t unit = 0;
  while(value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  if(unit == 0) {
    oss << bytes << " " << kUnits[unit];
  } else {
    oss << std::fixed << std::setprecision(1) << value << " " << kUnits[unit];
  }
  return oss.str();
}

std::string trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}
