#include "worker.hpp"

#include <exception>
#include <utility>

void RequestQueue::push(OperationRequest request) {
  {
    std::lock_guard<std::mutex> lock(m_);
    if(closed_) return;
    queue_.push_back(std::move(request));
  }
  cv_.notify_one();
}

std::optional<OperationRequest> RequestQueue::pop() {
  std::unique_lock<std::mutex> lock(m_);
  cv_.wait(lock, [&]{ return closed_ || !queue_.empty(); });
  if(closed_) return std::nullopt;
  auto request = std::move(queue_.front());
  queue_.pop_front();
  return request;
}

std::size_t RequestQueue::close() {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(m_);
    closed_ = true;
    dropped = queue_.size();
    queue_.clear();
  }
  cv_.notify_all();
  return dropped;
}

std::size_t RequestQueue::size() const {
  std::lock_guard<std::mutex> lock(m_);
  return queue_.size();
}

const char* to_string(OperationKind kind) {
  return kind == OperationKind::Share ? "share" : "get";
}

Worker::Worker(std::shared_ptr<TransferEngine> engine,
               std::shared_ptr<StateStore> state,
               Options options,
               std::shared_ptr<Logger> logger)
  : engine_(std::move(engine)),
    state_(state ? std::move(state) : std::make_shared<StateStore>()),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("worker")) {
  if(options_.progress_capacity == 0) {
    options_.progress_capacity = 32;
  }
}

Worker::~Worker() {
  stop();
}

void Worker::start() {
  if(thread_.joinable()) return;
  running_ = true;
  thread_ = std::thread([this](){ run_loop(); });
}

void Worker::send(OperationRequest request) {
  queue_.push(std::move(request));
}

void Worker::share(const std::filesystem::path& source) {
  send(ShareRequest{source});
}

void Worker::get(const std::string& ticket_text, const std::filesystem::path& destination) {
  send(GetRequest{ticket_text, destination});
}

bool Worker::cancel_current() {
  std::lock_guard<std::mutex> lock(op_mutex_);
  if(!current_) return false;
  current_->token.cancel();
  return true;
}

bool Worker::cancel_current(OperationKind kind) {
  std::lock_guard<std::mutex> lock(op_mutex_);
  if(!current_ || current_->kind != kind) return false;
  current_->token.cancel();
  return true;
}

std::optional<OperationHandle> Worker::current_operation() const {
  std::lock_guard<std::mutex> lock(op_mutex_);
  return current_;
}

void Worker::stop() {
  {
    std::lock_guard<std::mutex> lock(op_mutex_);
    stopping_ = true;
    if(current_) current_->token.cancel();
  }
  auto dropped = queue_.close();
  if(dropped > 0) {
    logger_->info("discarding {} queued request(s)", dropped);
  }
  if(thread_.joinable()) thread_.join();
  running_ = false;
}

void Worker::run_loop() {
  while(auto request = queue_.pop()) {
    if(!dispatch(*request)) break;
    ++completed_requests_;
  }
  running_ = false;
  logger_->debug("dispatch loop finished");
}

bool Worker::dispatch(OperationRequest& request) {
  if(std::holds_alternative<ShutdownRequest>(request)) {
    logger_->info("shutdown requested");
    return false;
  }
  if(auto* share = std::get_if<ShareRequest>(&request)) {
    handle_share(*share);
  } else if(auto* get = std::get_if<GetRequest>(&request)) {
    handle_get(*get);
  }
  return true;
}

OperationHandle Worker::begin_operation(OperationKind kind) {
  std::lock_guard<std::mutex> lock(op_mutex_);
  OperationHandle handle;
  handle.id = next_operation_id_++;
  handle.kind = kind;
  // A request popped just before stop() starts out cancelled.
  if(stopping_) handle.token.cancel();
  current_ = handle;
  return handle;
}

void Worker::end_operation() {
  std::lock_guard<std::mutex> lock(op_mutex_);
  current_.reset();
}

// Runs until the operation task and its relay have both finished. A throwing
// handler is logged and the remaining handlers still run.
void Worker::run_scheduler() {
  io_.restart();
  for(;;) {
    try {
      io_.run();
      return;
    } catch(const std::exception& e) {
      logger_->error("task failed: {}", e.what());
    }
  }
}

void Worker::handle_share(const ShareRequest& request) {
  uint64_t cycle = 0;
  if(!state_->begin_share(cycle)) {
    logger_->info("skipping share of {}: the current selection already has a ticket",
                  request.source.string());
    return;
  }
  logger_->info("sharing: {}", request.source.string());
  auto op = begin_operation(OperationKind::Share);

  auto channel = ProgressChannel::create(io_, options_.progress_capacity);
  auto state = state_;
  spawn_progress_relay(channel, [state, cycle](const Progress& progress){
    state->set_sharing_progress(cycle, progress);
  });

  bool finished = false;
  EngineError failure;
  Ticket ticket;
  try {
    engine_->async_provide(io_, request.source, ProgressSender(channel), op.token,
      [&, channel](EngineError error, Ticket result){
        channel->close();
        finished = true;
        failure = std::move(error);
        ticket = std::move(result);
      });
  } catch(const std::exception& e) {
    channel->close();
    failure = make_engine_error(transfer_errc::protocol_error, e.what());
  }
  run_scheduler();
  if(!finished && !failure.code) {
    failure = make_engine_error(transfer_errc::protocol_error, "engine never completed the share");
  }
  end_operation();

  if(!failure.code) {
    logger_->info("share ready: {} ({} bytes)", ticket.name, ticket.size);
    state_->complete_share(cycle, std::move(ticket));
    return;
  }
  state_->clear_sharing_progress(cycle);
  if(failure.cancelled()) {
    logger_->info("share of {} cancelled", request.source.string());
    return;
  }
  TransferError error = ShareError{request.source, failure};
  logger_->error("failed: {}", describe(error));
  state_->push_error(std::move(error));
}

void Worker::handle_get(const GetRequest& request) {
  Ticket ticket;
  TicketParseError parse_error;
  if(!Ticket::parse(request.ticket_text, ticket, parse_error)) {
    TransferError error = std::move(parse_error);
    logger_->error("invalid ticket: {}", describe(error));
    state_->push_error(std::move(error));
    return;
  }

  logger_->info("getting: {} -> {}", ticket.name, request.destination.string());
  auto op = begin_operation(OperationKind::Get);
  state_->set_download_progress(Progress::of(0.0f));

  auto channel = ProgressChannel::create(io_, options_.progress_capacity);
  auto state = state_;
  spawn_progress_relay(channel, [state](const Progress& progress){
    state->set_download_progress(progress);
  });

  bool finished = false;
  EngineError failure;
  try {
    engine_->async_fetch(io_, ticket, request.destination, ProgressSender(channel), op.token,
      [&, channel](EngineError error){
        channel->close();
        finished = true;
        failure = std::move(error);
      });
  } catch(const std::exception& e) {
    channel->close();
    failure = make_engine_error(transfer_errc::protocol_error, e.what());
  }
  run_scheduler();
  if(!finished && !failure.code) {
    failure = make_engine_error(transfer_errc::protocol_error, "engine never completed the download");
  }
  end_operation();
  state_->clear_download_progress();

  if(!failure.code) {
    logger_->info("download complete: {}", (request.destination / ticket.name).string());
    return;
  }
  if(failure.cancelled()) {
    logger_->info("download of {} cancelled", ticket.name);
    return;
  }
  TransferError error = GetError{request.ticket_text, request.destination, failure};
  logger_->error("failed: {}", describe(error));
  state_->push_error(std::move(error));
}
