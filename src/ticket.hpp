#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "transfer_error.hpp"

struct NodeAddr {
  std::string peer_id;
  std::vector<std::string> addrs; // "host:port", tried in order

  bool operator==(const NodeAddr& other) const {
    return peer_id == other.peer_id && addrs == other.addrs;
  }
  bool operator!=(const NodeAddr& other) const { return !(*this == other); }
};

// Everything a receiver needs to locate and verify one provided blob.
struct Ticket {
  static constexpr const char* kPrefix = "blob";
  static constexpr std::size_t kHashHexLength = 64;

  std::string hash; // SHA-256, lowercase hex
  uint64_t size = 0;
  std::string name;
  NodeAddr node;

  // Copyable text form: kPrefix followed by unpadded base64url of the CBOR body.
  std::string to_string() const;

  // Pure; leading and trailing whitespace is ignored.
  static bool parse(const std::string& text, Ticket& out, TicketParseError& error);

  bool operator==(const Ticket& other) const {
    return hash == other.hash && size == other.size &&
           name == other.name && node == other.node;
  }
  bool operator!=(const Ticket& other) const { return !(*this == other); }
};

// A bare file name a receiver can create as-is: no separators of either
// platform, not "." or "..".
bool is_valid_ticket_name(const std::string& name);

bool split_host_port(const std::string& addr, std::string& host, uint16_t& port);
