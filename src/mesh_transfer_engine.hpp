#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include "blob_index.hpp"
#include "log.hpp"
#include "transfer_engine.hpp"

// TCP transfer engine. Provided blobs are served from an acceptor running on
// the engine's own io_context; hashing and fetching run on a small blocking
// pool and report back to the caller's io_context.
class MeshTransferEngine : public TransferEngine {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 0;
    std::string advertise_ip = "127.0.0.1";
    std::string peer_id;
    std::size_t chunk_size = 256 * 1024;
    std::chrono::milliseconds io_timeout{5000};
    std::size_t blocking_threads = 2;
  };

  explicit MeshTransferEngine(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~MeshTransferEngine() override;

  MeshTransferEngine(const MeshTransferEngine&) = delete;
  MeshTransferEngine& operator=(const MeshTransferEngine&) = delete;

  // Binds the acceptor and starts the provider thread. Throws on bad
  // listen settings.
  void start();
  void stop();

  bool started() const { return started_.load(); }
  uint16_t listen_port() const { return listen_port_; }
  const std::string& peer_id() const { return peer_id_; }
  NodeAddr node_addr() const;
  std::shared_ptr<BlobIndex> index() const { return index_; }

  void async_provide(asio::io_context& io,
                     const std::filesystem::path& source,
                     ProgressSender progress,
                     CancellationToken cancel,
                     ProvideHandler handler) override;

  void async_fetch(asio::io_context& io,
                   const Ticket& ticket,
                   const std::filesystem::path& destination,
                   ProgressSender progress,
                   CancellationToken cancel,
                   FetchHandler handler) override;

private:
  using tcp = asio::ip::tcp;

  void start_accept();

  EngineError provide_blocking(const std::filesystem::path& source,
                               const ProgressSender& progress,
                               const CancellationToken& cancel,
                               Ticket& out);
  EngineError fetch_blocking(const Ticket& ticket,
                             const std::filesystem::path& destination,
                             const ProgressSender& progress,
                             const CancellationToken& cancel);

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<BlobIndex> index_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  asio::thread_pool pool_;
  std::atomic<bool> started_{false};
  std::string peer_id_;
  uint16_t listen_port_ = 0;
};
