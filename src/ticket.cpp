#include "ticket.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <exception>

#include "utils.hpp"

bool is_valid_ticket_name(const std::string& name) {
  if(name.empty() || name == "." || name == "..") return false;
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

bool split_host_port(const std::string& addr, std::string& host, uint16_t& port) {
  auto pos = addr.rfind(':');
  if(pos == std::string::npos || pos == 0 || pos + 1 >= addr.size()) return false;
  auto port_text = addr.substr(pos + 1);
  if(port_text.size() > 5) return false;
  for(char c : port_text) {
    if(!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  unsigned long value = std::stoul(port_text);
  if(value == 0 || value > 65535) return false;
  host = addr.substr(0, pos);
  if(host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  port = static_cast<uint16_t>(value);
  return !host.empty();
}

std::string Ticket::to_string() const {
  nlohmann::json body;
  body["h"] = hash;
  body["s"] = size;
  body["n"] = name;
  body["p"] = node.peer_id;
  body["a"] = node.addrs;
  auto cbor = nlohmann::json::to_cbor(body);
  return std::string(kPrefix) + base64url_encode(std::string(cbor.begin(), cbor.end()));
}

bool Ticket::parse(const std::string& text, Ticket& out, TicketParseError& error) {
  error.text = text;
  auto fail = [&](std::string reason){
    error.reason = std::move(reason);
    return false;
  };

  std::string clean = trim_copy(text);
  if(clean.empty()) return fail("ticket is empty");
  const std::string prefix(kPrefix);
  if(clean.compare(0, prefix.size(), prefix) != 0) {
    return fail("ticket must start with '" + prefix + "'");
  }
  auto payload = base64url_decode(clean.substr(prefix.size()));
  if(!payload || payload->empty()) return fail("ticket is not valid base64url");

  nlohmann::json body;
  try {
    body = nlohmann::json::from_cbor(*payload);
  } catch(const std::exception& e) {
    return fail(std::string("ticket payload is corrupt (") + e.what() + ")");
  }
  if(!body.is_object()) return fail("ticket payload is not an object");

  auto string_field = [&](const char* key, std::string& target) {
    auto it = body.find(key);
    if(it == body.end() || !it->is_string()) return false;
    target = it->get<std::string>();
    return true;
  };

  Ticket parsed;
  if(!string_field("h", parsed.hash) || !is_lower_hex(parsed.hash, kHashHexLength)) {
    return fail("ticket hash is missing or malformed");
  }
  auto size_it = body.find("s");
  if(size_it == body.end() || !size_it->is_number_unsigned()) {
    return fail("ticket size is missing");
  }
  parsed.size = size_it->get<uint64_t>();
  if(!string_field("n", parsed.name) || !is_valid_ticket_name(parsed.name)) {
    return fail("ticket file name is missing or unsafe");
  }
  if(!string_field("p", parsed.node.peer_id)) {
    return fail("ticket peer id is missing");
  }
  auto addrs_it = body.find("a");
  if(addrs_it == body.end() || !addrs_it->is_array() || addrs_it->empty()) {
    return fail("ticket carries no provider address");
  }
  for(const auto& entry : *addrs_it) {
    std::string host;
    uint16_t port = 0;
    if(!entry.is_string() || !split_host_port(entry.get<std::string>(), host, port)) {
      return fail("ticket provider address is malformed");
    }
    parsed.node.addrs.push_back(entry.get<std::string>());
  }

  out = std::move(parsed);
  error = TicketParseError{};
  return true;
}
