#include "progress_channel.hpp"

#include <stdexcept>
#include <utility>

std::shared_ptr<ProgressChannel> ProgressChannel::create(asio::io_context& io, std::size_t capacity) {
  return std::shared_ptr<ProgressChannel>(new ProgressChannel(io, capacity));
}

ProgressChannel::ProgressChannel(asio::io_context& io, std::size_t capacity)
  : io_(io), capacity_(capacity == 0 ? 1 : capacity) {}

bool ProgressChannel::send(ProgressEvent event) {
  std::unique_lock<std::mutex> lock(m_);
  not_full_.wait(lock, [&]{ return closed_ || queue_.size() < capacity_; });
  if(closed_) return false;
  if(!pending_) {
    queue_.push_back(std::move(event));
    return true;
  }
  // A waiting receiver implies an empty queue, so handing over directly keeps
  // emission order.
  asio::post(io_, [handler = std::move(pending_), event = std::move(event)]() mutable {
    handler(std::move(event));
  });
  pending_ = nullptr;
  pending_guard_.reset();
  return true;
}

void ProgressChannel::async_receive(ReceiveHandler handler) {
  std::optional<ProgressEvent> ready;
  {
    std::lock_guard<std::mutex> lock(m_);
    if(pending_) {
      throw std::logic_error("ProgressChannel: receive already pending");
    }
    if(!queue_.empty()) {
      ready = std::move(queue_.front());
      queue_.pop_front();
    } else if(!closed_) {
      pending_ = std::move(handler);
      pending_guard_.emplace(asio::make_work_guard(io_));
      return;
    }
  }
  if(ready) not_full_.notify_one();
  asio::post(io_, [handler = std::move(handler), ready = std::move(ready)]() mutable {
    handler(std::move(ready));
  });
}

void ProgressChannel::close() {
  {
    std::lock_guard<std::mutex> lock(m_);
    if(closed_) return;
    closed_ = true;
    if(pending_) {
      asio::post(io_, [handler = std::move(pending_)]() {
        handler(std::nullopt);
      });
      pending_ = nullptr;
      pending_guard_.reset();
    }
  }
  not_full_.notify_all();
}

bool ProgressChannel::closed() const {
  std::lock_guard<std::mutex> lock(m_);
  return closed_;
}

std::size_t ProgressChannel::size() const {
  std::lock_guard<std::mutex> lock(m_);
  return queue_.size();
}

ProgressSender::ProgressSender(std::shared_ptr<ProgressChannel> channel)
  : channel_(std::move(channel)) {}

ProgressSender::~ProgressSender() {
  close();
}

ProgressSender::ProgressSender(ProgressSender&& other) noexcept
  : channel_(std::move(other.channel_)) {}

ProgressSender& ProgressSender::operator=(ProgressSender&& other) noexcept {
  if(this != &other) {
    close();
    channel_ = std::move(other.channel_);
  }
  return *this;
}

bool ProgressSender::send(ProgressEvent event) const {
  if(!channel_) return false;
  return channel_->send(std::move(event));
}

void ProgressSender::close() {
  if(channel_) {
    channel_->close();
    channel_.reset();
  }
}

namespace {

struct RelayState {
  std::shared_ptr<ProgressChannel> channel;
  ProgressAggregator aggregator;
  std::function<void(const Progress&)> sink;
};

void relay_next(const std::shared_ptr<RelayState>& state) {
  state->channel->async_receive([state](std::optional<ProgressEvent> event){
    if(!event) return;
    auto progress = state->aggregator.apply(*event);
    if(state->sink) state->sink(progress);
    relay_next(state);
  });
}

} // namespace

void spawn_progress_relay(const std::shared_ptr<ProgressChannel>& channel,
                          std::function<void(const Progress&)> sink) {
  auto state = std::make_shared<RelayState>();
  state->channel = channel;
  state->sink = std::move(sink);
  relay_next(state);
}
