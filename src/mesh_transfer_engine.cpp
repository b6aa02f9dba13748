#include "mesh_transfer_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "connection.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace {

void emit(const ProgressSender& progress, ProgressEvent event, Logger* logger) {
  if(!progress.send(std::move(event))) {
    log_debug(logger, "progress channel closed, event dropped");
  }
}

// Blocking line-oriented client over async operations with a deadline, in the
// style of asio's blocking_tcp_client example.
class LineClient {
public:
  explicit LineClient(std::chrono::milliseconds timeout)
    : socket_(ctx_), timeout_(timeout) {}

  std::error_code connect(const std::string& host, uint16_t port) {
    asio::ip::tcp::resolver resolver(ctx_);
    std::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if(ec) return ec;
    return run([&](std::error_code& result){
      asio::async_connect(socket_, endpoints,
        [&result](std::error_code e, const asio::ip::tcp::endpoint&){ result = e; });
    });
  }

  std::error_code write_line(const nlohmann::json& message) {
    auto payload = std::make_shared<std::string>(message.dump() + "\n");
    return run([&](std::error_code& result){
      asio::async_write(socket_, asio::buffer(*payload),
        [&result, payload](std::error_code e, std::size_t){ result = e; });
    });
  }

  std::error_code read_line(std::string& line) {
    auto ec = run([&](std::error_code& result){
      asio::async_read_until(socket_, buf_, "\n",
        [&result](std::error_code e, std::size_t){ result = e; });
    });
    if(ec) return ec;
    std::istream is(&buf_);
    std::getline(is, line);
    return {};
  }

  void close() {
    std::error_code ec;
    socket_.close(ec);
  }

private:
  template<typename Start>
  std::error_code run(Start start) {
    std::error_code result = asio::error::would_block;
    ctx_.restart();
    start(result);
    ctx_.run_for(timeout_);
    if(result == asio::error::would_block) {
      close();
      ctx_.restart();
      ctx_.run();
      return asio::error::timed_out;
    }
    return result;
  }

  asio::io_context ctx_;
  asio::ip::tcp::socket socket_;
  asio::streambuf buf_;
  std::chrono::milliseconds timeout_;
};

// Removes the partial download unless the transfer got as far as the rename.
struct PartFile {
  std::filesystem::path path;
  bool keep = false;

  ~PartFile() {
    if(keep || path.empty()) return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
};

EngineError read_response(LineClient& client, nlohmann::json& out) {
  std::string line;
  if(auto ec = client.read_line(line)) {
    return make_engine_error(transfer_errc::connect_failed, "read failed: " + ec.message());
  }
  try {
    out = nlohmann::json::parse(line);
  } catch(const std::exception& e) {
    return make_engine_error(transfer_errc::protocol_error, std::string("malformed response: ") + e.what());
  }
  return {};
}

} // namespace

MeshTransferEngine::MeshTransferEngine(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("engine")),
    index_(std::make_shared<BlobIndex>()),
    pool_(std::max<std::size_t>(1, options_.blocking_threads)) {
  options_.chunk_size = std::clamp(options_.chunk_size, kMinChunkSize, kMaxChunkSize);
  peer_id_ = options_.peer_id.empty() ? random_hex_id(16) : options_.peer_id;
}

MeshTransferEngine::~MeshTransferEngine() {
  stop();
  pool_.join();
}

void MeshTransferEngine::start() {
  if(started_) return;

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
    throw std::runtime_error("Invalid listen_ip '" + options_.listen_ip + "'");
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();

  started_ = true;
  start_accept();
  io_thread_ = std::thread([this](){
    io_.run();
  });
  logger_->info("providing as {} on {}:{}", peer_id_, options_.listen_ip, listen_port_);
}

void MeshTransferEngine::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else {
        ProviderConnection::serve(std::move(socket), index_, logger_);
      }
      if(started_) {
        start_accept();
      }
    });
}

void MeshTransferEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  acceptor_.reset();
  io_.restart();
}

NodeAddr MeshTransferEngine::node_addr() const {
  NodeAddr node;
  node.peer_id = peer_id_;
  node.addrs.push_back(options_.advertise_ip + ":" + std::to_string(listen_port_));
  return node;
}

void MeshTransferEngine::async_provide(asio::io_context& io,
                                       const std::filesystem::path& source,
                                       ProgressSender progress,
                                       CancellationToken cancel,
                                       ProvideHandler handler) {
  auto guard = asio::make_work_guard(io);
  asio::post(pool_,
    [this, &io, guard, source, progress = std::move(progress), cancel, handler = std::move(handler)]() mutable {
      Ticket ticket;
      EngineError error = provide_blocking(source, progress, cancel, ticket);
      progress.close();
      asio::post(io, [handler = std::move(handler), error = std::move(error), ticket = std::move(ticket)]() {
        handler(error, ticket);
      });
    });
}

void MeshTransferEngine::async_fetch(asio::io_context& io,
                                     const Ticket& ticket,
                                     const std::filesystem::path& destination,
                                     ProgressSender progress,
                                     CancellationToken cancel,
                                     FetchHandler handler) {
  auto guard = asio::make_work_guard(io);
  asio::post(pool_,
    [this, &io, guard, ticket, destination, progress = std::move(progress), cancel, handler = std::move(handler)]() mutable {
      EngineError error = fetch_blocking(ticket, destination, progress, cancel);
      progress.close();
      asio::post(io, [handler = std::move(handler), error = std::move(error)]() {
        handler(error);
      });
    });
}

EngineError MeshTransferEngine::provide_blocking(const std::filesystem::path& source,
                                                 const ProgressSender& progress,
                                                 const CancellationToken& cancel,
                                                 Ticket& out) {
  if(!started_) {
    return make_engine_error(transfer_errc::protocol_error, "engine is not listening");
  }

  std::error_code ec;
  auto status = std::filesystem::status(source, ec);
  if(ec || !std::filesystem::exists(status)) {
    return make_engine_error(transfer_errc::file_not_found, source.string() + " does not exist");
  }
  if(!std::filesystem::is_regular_file(status)) {
    return make_engine_error(transfer_errc::not_a_regular_file, source.string() + " is not a regular file");
  }
  const auto name = source.filename().string();
  if(!is_valid_ticket_name(name)) {
    return make_engine_error(transfer_errc::unsupported_name,
                             "'" + name + "' cannot be recreated by a receiver");
  }
  uint64_t size = std::filesystem::file_size(source, ec);
  if(ec) {
    return make_engine_error(transfer_errc::read_failed, ec.message());
  }
  emit(progress, DeclaredSize{0, size}, logger_.get());

  std::ifstream file(source, std::ios::binary);
  if(!file) {
    return make_engine_error(transfer_errc::read_failed, "cannot open " + source.string());
  }

  Sha256Stream hasher;
  std::vector<char> buffer(options_.chunk_size);
  uint64_t hashed = 0;
  while(hashed < size) {
    if(cancel.cancelled()) {
      return make_engine_error(transfer_errc::cancelled, "share cancelled");
    }
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = file.gcount();
    if(got <= 0) break;
    hasher.update(buffer.data(), static_cast<std::size_t>(got));
    hashed += static_cast<uint64_t>(got);
    emit(progress, Processed{0, static_cast<uint64_t>(got)}, logger_.get());
  }
  if(file.bad() || hashed != size) {
    return make_engine_error(transfer_errc::read_failed, "short read from " + source.string());
  }

  BlobEntry entry;
  entry.hash = hasher.finish_hex();
  entry.path = std::filesystem::absolute(source, ec);
  if(ec) entry.path = source;
  entry.size = size;
  entry.name = name;
  index_->add_or_update(entry);

  out.hash = entry.hash;
  out.size = entry.size;
  out.name = entry.name;
  out.node = node_addr();
  logger_->debug("registered blob {} ({})", entry.hash, entry.path.string());
  return {};
}

EngineError MeshTransferEngine::fetch_blocking(const Ticket& ticket,
                                               const std::filesystem::path& destination,
                                               const ProgressSender& progress,
                                               const CancellationToken& cancel) {
  std::error_code ec;
  std::filesystem::create_directories(destination, ec);
  if(ec) {
    return make_engine_error(transfer_errc::write_failed,
                             "cannot create " + destination.string() + ": " + ec.message());
  }

  LineClient client(options_.io_timeout);
  std::string last_failure = "no addresses";
  bool connected = false;
  for(const auto& addr : ticket.node.addrs) {
    if(cancel.cancelled()) {
      return make_engine_error(transfer_errc::cancelled, "download cancelled");
    }
    std::string host;
    uint16_t port = 0;
    if(!split_host_port(addr, host, port)) {
      last_failure = "bad address " + addr;
      continue;
    }
    if(auto err = client.connect(host, port)) {
      last_failure = addr + ": " + err.message();
      logger_->debug("connect to {} failed: {}", addr, err.message());
      client.close();
      continue;
    }
    connected = true;
    break;
  }
  if(!connected) {
    return make_engine_error(transfer_errc::connect_failed,
                             "could not reach " + ticket.node.peer_id + " (" + last_failure + ")");
  }

  if(auto err = client.write_line(make_blob_info_request(ticket.hash))) {
    return make_engine_error(transfer_errc::connect_failed, "send failed: " + err.message());
  }
  nlohmann::json response;
  if(auto err = read_response(client, response); err.code) return err;
  BlobInfo info;
  if(!parse_blob_info_response(response, info)) {
    return make_engine_error(transfer_errc::protocol_error, "unexpected reply to blob info request");
  }
  if(!info.error.empty()) {
    return make_engine_error(transfer_errc::unknown_blob, info.error);
  }
  if(info.hash != ticket.hash || info.size != ticket.size) {
    return make_engine_error(transfer_errc::protocol_error, "provider describes a different blob");
  }

  emit(progress, DeclaredSize{0, ticket.size}, logger_.get());

  PartFile part;
  part.path = destination / ("." + ticket.name + ".part");
  std::ofstream file(part.path, std::ios::binary | std::ios::trunc);
  if(!file) {
    return make_engine_error(transfer_errc::write_failed, "cannot write " + part.path.string());
  }

  Sha256Stream hasher;
  uint64_t offset = 0;
  uint64_t request_counter = 0;
  while(offset < ticket.size) {
    if(cancel.cancelled()) {
      return make_engine_error(transfer_errc::cancelled, "download cancelled");
    }
    auto length = static_cast<std::size_t>(
      std::min<uint64_t>(options_.chunk_size, ticket.size - offset));
    auto request_id = std::to_string(++request_counter);
    if(auto err = client.write_line(make_chunk_request(request_id, ticket.hash, offset, length))) {
      return make_engine_error(transfer_errc::connect_failed, "send failed: " + err.message());
    }
    if(auto err = read_response(client, response); err.code) return err;

    ChunkResponse chunk;
    if(!parse_chunk_response(response, chunk)) {
      return make_engine_error(transfer_errc::protocol_error, "unexpected reply to chunk request");
    }
    if(!chunk.success) {
      return make_engine_error(transfer_errc::unknown_blob, chunk.error);
    }
    if(chunk.request_id != request_id || chunk.offset != offset || chunk.data.empty() ||
       chunk.data.size() > length) {
      return make_engine_error(transfer_errc::protocol_error,
                               "chunk at offset " + std::to_string(offset) + " does not match the request");
    }
    if(sha256_hex(chunk.data) != chunk.chunk_sha) {
      return make_engine_error(transfer_errc::hash_mismatch,
                               "chunk at offset " + std::to_string(offset) + " failed verification");
    }
    file.write(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
    if(!file) {
      return make_engine_error(transfer_errc::write_failed, "write to " + part.path.string() + " failed");
    }
    hasher.update(chunk.data.data(), chunk.data.size());
    offset += chunk.data.size();
    emit(progress, Processed{0, static_cast<uint64_t>(chunk.data.size())}, logger_.get());
  }
  client.close();
  file.close();
  if(!file) {
    return make_engine_error(transfer_errc::write_failed, "closing " + part.path.string() + " failed");
  }

  auto digest = hasher.finish_hex();
  if(digest != ticket.hash) {
    return make_engine_error(transfer_errc::hash_mismatch, "content hash does not match the ticket");
  }

  auto final_path = destination / ticket.name;
  std::filesystem::rename(part.path, final_path, ec);
  if(ec) {
    return make_engine_error(transfer_errc::write_failed,
                             "cannot move download into " + final_path.string() + ": " + ec.message());
  }
  part.keep = true;
  emit(progress, Completed{}, logger_.get());
  logger_->debug("fetched {} bytes into {}", ticket.size, final_path.string());
  return {};
}
