#pragma once

#include <asio.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "progress.hpp"

// Bounded single-consumer channel carrying the progress events of one
// operation. Producers may live on any thread and block while the channel is
// full; the consumer receives asynchronously on an io_context.
class ProgressChannel : public std::enable_shared_from_this<ProgressChannel> {
public:
  using ReceiveHandler = std::function<void(std::optional<ProgressEvent>)>;

  static std::shared_ptr<ProgressChannel> create(asio::io_context& io, std::size_t capacity);

  // Blocks while full. Returns false once the channel is closed.
  bool send(ProgressEvent event);

  // Handler runs on the io_context with the next event, or std::nullopt once
  // the channel is closed and drained. One receive may be pending at a time.
  void async_receive(ReceiveHandler handler);

  // Idempotent. Queued events are still delivered before end-of-stream.
  void close();

  bool closed() const;
  std::size_t capacity() const { return capacity_; }
  std::size_t size() const;

private:
  ProgressChannel(asio::io_context& io, std::size_t capacity);

  using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

  asio::io_context& io_;
  const std::size_t capacity_;
  mutable std::mutex m_;
  std::condition_variable not_full_;
  std::deque<ProgressEvent> queue_;
  ReceiveHandler pending_;
  std::optional<WorkGuard> pending_guard_;
  bool closed_ = false;
};

// Producer half handed to the engine. Closes the channel when it goes away so a
// failing engine cannot leave the relay waiting forever.
class ProgressSender {
public:
  ProgressSender() = default;
  explicit ProgressSender(std::shared_ptr<ProgressChannel> channel);
  ~ProgressSender();

  ProgressSender(ProgressSender&& other) noexcept;
  ProgressSender& operator=(ProgressSender&& other) noexcept;
  ProgressSender(const ProgressSender&) = delete;
  ProgressSender& operator=(const ProgressSender&) = delete;

  bool send(ProgressEvent event) const;
  void close();
  explicit operator bool() const { return static_cast<bool>(channel_); }

private:
  std::shared_ptr<ProgressChannel> channel_;
};

// Drains the channel, folding every event through a fresh aggregator and
// handing the result to sink. Stops at end-of-stream.
void spawn_progress_relay(const std::shared_ptr<ProgressChannel>& channel,
                          std::function<void(const Progress&)> sink);
