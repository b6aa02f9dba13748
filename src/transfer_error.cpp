#include "transfer_error.hpp"

namespace {

class TransferCategory : public std::error_category {
public:
  const char* name() const noexcept override { return "transfer"; }

  std::string message(int value) const override {
    switch(static_cast<transfer_errc>(value)) {
      case transfer_errc::file_not_found: return "file not found";
      case transfer_errc::not_a_regular_file: return "not a regular file";
      case transfer_errc::read_failed: return "read failed";
      case transfer_errc::write_failed: return "write failed";
      case transfer_errc::connect_failed: return "unable to reach provider";
      case transfer_errc::protocol_error: return "protocol error";
      case transfer_errc::unknown_blob: return "provider does not have this blob";
      case transfer_errc::hash_mismatch: return "content hash mismatch";
      case transfer_errc::unsupported_name: return "file name cannot be carried in a ticket";
      case transfer_errc::cancelled: return "operation cancelled";
    }
    return "unknown transfer error";
  }
};

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string engine_detail(const EngineError& cause) {
  if(cause.message.empty()) return cause.code.message();
  return cause.code.message() + ": " + cause.message;
}

} // namespace

const std::error_category& transfer_category() noexcept {
  static TransferCategory category;
  return category;
}

std::error_code make_error_code(transfer_errc e) noexcept {
  return {static_cast<int>(e), transfer_category()};
}

const char* context_label(const TransferError& error) {
  return std::visit(overloaded{
    [](const TicketParseError&) { return "parsing ticket"; },
    [](const ShareError&) { return "sharing"; },
    [](const GetError&) { return "get"; }
  }, error);
}

std::string describe(const TransferError& error) {
  std::string detail = std::visit(overloaded{
    [](const TicketParseError& e) { return e.reason; },
    [](const ShareError& e) {
      return e.source.filename().string() + ": " + engine_detail(e.cause);
    },
    [](const GetError& e) { return engine_detail(e.cause); }
  }, error);
  return std::string(context_label(error)) + ": " + detail;
}
