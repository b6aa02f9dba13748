#pragma once

#include <asio.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "log.hpp"
#include "shared_state.hpp"
#include "transfer_engine.hpp"

struct ShareRequest {
  std::filesystem::path source;
};

struct GetRequest {
  std::string ticket_text;
  std::filesystem::path destination;
};

// Stops the loop once everything queued before it has been handled.
struct ShutdownRequest {};

using OperationRequest = std::variant<ShareRequest, GetRequest, ShutdownRequest>;

// Unbounded one-way handoff from the front end to the worker.
class RequestQueue {
public:
  void push(OperationRequest request);

  // Blocks while empty. std::nullopt once closed.
  std::optional<OperationRequest> pop();

  // Wakes the consumer and drops whatever is still queued; returns how many.
  std::size_t close();

  std::size_t size() const;

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<OperationRequest> queue_;
  bool closed_ = false;
};

enum class OperationKind { Share, Get };

const char* to_string(OperationKind kind);

struct OperationHandle {
  uint64_t id = 0;
  OperationKind kind = OperationKind::Share;
  CancellationToken token;
};

// Dispatch loop. Owns one thread hosting one io_context, reused for every
// operation; requests run one at a time in arrival order and report their
// outcome only through the StateStore.
class Worker {
public:
  struct Options {
    std::size_t progress_capacity = 32;
  };

  Worker(std::shared_ptr<TransferEngine> engine,
         std::shared_ptr<StateStore> state,
         Options options,
         std::shared_ptr<Logger> logger = nullptr);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  void start();

  void send(OperationRequest request);
  void share(const std::filesystem::path& source);
  void get(const std::string& ticket_text, const std::filesystem::path& destination);

  // Cancels the in-flight operation, optionally only if it is of `kind`.
  bool cancel_current();
  bool cancel_current(OperationKind kind);
  std::optional<OperationHandle> current_operation() const;

  // Cancels the in-flight operation, discards queued requests and joins.
  void stop();

  // Number of requests fully handled so far.
  uint64_t completed_requests() const { return completed_requests_.load(); }
  bool running() const { return running_.load(); }

private:
  void run_loop();
  bool dispatch(OperationRequest& request);
  void handle_share(const ShareRequest& request);
  void handle_get(const GetRequest& request);

  OperationHandle begin_operation(OperationKind kind);
  void end_operation();
  void run_scheduler();

  std::shared_ptr<TransferEngine> engine_;
  std::shared_ptr<StateStore> state_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  RequestQueue queue_;
  asio::io_context io_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> completed_requests_{0};

  mutable std::mutex op_mutex_;
  std::optional<OperationHandle> current_;
  bool stopping_ = false;
  uint64_t next_operation_id_ = 1;
};
