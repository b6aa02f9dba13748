#pragma once

#include <asio.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>

#include "progress_channel.hpp"
#include "ticket.hpp"
#include "transfer_error.hpp"

class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Provide/fetch contract. Handlers are invoked exactly once, through the
// io_context passed to the call; a default-constructed EngineError means
// success. Progress events go to the sender, which the engine drops (closing
// the channel) when it is done with the operation. Implementations check the
// token between units of work and fail with transfer_errc::cancelled.
class TransferEngine {
public:
  using ProvideHandler = std::function<void(EngineError error, Ticket ticket)>;
  using FetchHandler = std::function<void(EngineError error)>;

  virtual ~TransferEngine() = default;

  virtual void async_provide(asio::io_context& io,
                             const std::filesystem::path& source,
                             ProgressSender progress,
                             CancellationToken cancel,
                             ProvideHandler handler) = 0;

  virtual void async_fetch(asio::io_context& io,
                           const Ticket& ticket,
                           const std::filesystem::path& destination,
                           ProgressSender progress,
                           CancellationToken cancel,
                           FetchHandler handler) = 0;
};
