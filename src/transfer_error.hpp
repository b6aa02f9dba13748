#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

enum class transfer_errc {
  file_not_found = 1,
  not_a_regular_file,
  read_failed,
  write_failed,
  connect_failed,
  protocol_error,
  unknown_blob,
  hash_mismatch,
  unsupported_name,
  cancelled
};

const std::error_category& transfer_category() noexcept;
std::error_code make_error_code(transfer_errc e) noexcept;

namespace std {
template<>
struct is_error_code_enum<transfer_errc> : true_type {};
} // namespace std

// Failure reported by a transfer engine call.
struct EngineError {
  std::error_code code;
  std::string message;

  bool cancelled() const { return code == transfer_errc::cancelled; }
};

inline EngineError make_engine_error(transfer_errc code, std::string message) {
  return EngineError{make_error_code(code), std::move(message)};
}

// Ticket text that could not be decoded. Raised before the engine is touched.
struct TicketParseError {
  std::string text;
  std::string reason;
};

struct ShareError {
  std::filesystem::path source;
  EngineError cause;
};

struct GetError {
  std::string ticket;
  std::filesystem::path destination;
  EngineError cause;
};

using TransferError = std::variant<TicketParseError, ShareError, GetError>;

// "parsing ticket", "sharing" or "get".
const char* context_label(const TransferError& error);

// "<context>: <detail>" as shown to the user.
std::string describe(const TransferError& error);
