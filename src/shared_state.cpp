#include "shared_state.hpp"

#include <utility>

StateStore::StateStore()
  : current_(std::make_shared<const StateSnapshot>()) {}

std::shared_ptr<const StateSnapshot> StateStore::snapshot() const {
  std::lock_guard<std::mutex> lock(m_);
  return current_;
}

void StateStore::set_repaint_callback(RepaintCallback callback) {
  RepaintCallback previous;
  std::unique_lock<std::mutex> lock(m_);
  previous.swap(repaint_);
  repaint_ = std::move(callback);
  repaint_idle_.wait(lock, [this]{ return repaints_running_ == 0; });
}

template<typename Fn>
bool StateStore::mutate(Fn&& fn) {
  RepaintCallback repaint;
  {
    std::lock_guard<std::mutex> lock(m_);
    auto next = std::make_shared<StateSnapshot>(*current_);
    if(!fn(*next)) return false;
    next->generation = current_->generation + 1;
    current_ = std::move(next);
    if(!repaint_) return true;
    repaint = repaint_;
    ++repaints_running_;
  }

  struct RepaintDone {
    StateStore& store;
    ~RepaintDone() {
      {
        std::lock_guard<std::mutex> lock(store.m_);
        --store.repaints_running_;
      }
      store.repaint_idle_.notify_all();
    }
  } done{*this};
  repaint();
  return true;
}

uint64_t StateStore::share_cycle() const {
  std::lock_guard<std::mutex> lock(m_);
  return current_->share_cycle;
}

bool StateStore::begin_share(uint64_t& cycle) {
  return mutate([&](StateSnapshot& s){
    cycle = s.share_cycle;
    if(s.ticket) return false;
    s.sharing_progress = Progress::indeterminate();
    return true;
  });
}

void StateStore::set_sharing_progress(uint64_t cycle, const Progress& progress) {
  mutate([&](StateSnapshot& s){
    if(s.share_cycle != cycle || s.ticket) return false;
    if(s.sharing_progress == progress) return false;
    s.sharing_progress = progress;
    return true;
  });
}

void StateStore::complete_share(uint64_t cycle, Ticket ticket) {
  mutate([&](StateSnapshot& s){
    if(s.share_cycle != cycle) return false;
    s.sharing_progress.reset();
    s.ticket = std::move(ticket);
    return true;
  });
}

void StateStore::clear_sharing_progress(uint64_t cycle) {
  mutate([&](StateSnapshot& s){
    if(s.share_cycle != cycle || !s.sharing_progress) return false;
    s.sharing_progress.reset();
    return true;
  });
}

void StateStore::set_download_progress(const Progress& progress) {
  mutate([&](StateSnapshot& s){
    if(s.download_progress == progress) return false;
    s.download_progress = progress;
    return true;
  });
}

void StateStore::clear_download_progress() {
  mutate([](StateSnapshot& s){
    if(!s.download_progress) return false;
    s.download_progress.reset();
    return true;
  });
}

void StateStore::push_error(TransferError error) {
  mutate([&](StateSnapshot& s){
    s.errors.push_back(std::move(error));
    return true;
  });
}

void StateStore::reset_share_cycle() {
  mutate([](StateSnapshot& s){
    ++s.share_cycle;
    s.sharing_progress.reset();
    s.ticket.reset();
    return true;
  });
}

bool StateStore::acknowledge_error() {
  return mutate([](StateSnapshot& s){
    if(s.errors.empty()) return false;
    s.errors.pop_back();
    return true;
  });
}
