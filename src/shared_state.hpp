#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "progress.hpp"
#include "ticket.hpp"
#include "transfer_error.hpp"

// Immutable view of the shared record, published after every mutation.
struct StateSnapshot {
  std::optional<Progress> sharing_progress;
  std::optional<Ticket> ticket;
  std::optional<Progress> download_progress;
  std::vector<TransferError> errors; // oldest first
  uint64_t share_cycle = 0;
  uint64_t generation = 0;

  // The error the front end shows: the most recent unacknowledged one.
  const TransferError* current_error() const {
    return errors.empty() ? nullptr : &errors.back();
  }
};

// Owner of the state observed by the front end and mutated by the worker.
// Each call is one short critical section that swaps in a new snapshot; the
// repaint callback runs afterwards, outside the lock.
//
// Share updates carry the share cycle they were started under. Selecting a new
// file bumps the cycle, so a stale share can no longer set progress or a
// ticket, though its errors are still recorded. Sharing progress and the
// ticket are never both set.
class StateStore {
public:
  using RepaintCallback = std::function<void()>;

  StateStore();

  std::shared_ptr<const StateSnapshot> snapshot() const;

  // Returns once no call to the previous callback is still running, so the
  // owner of that callback may be destroyed afterwards. Must not be called
  // from inside a repaint callback.
  void set_repaint_callback(RepaintCallback callback);

  uint64_t share_cycle() const;

  // Marks a share as running in the current cycle (indeterminate progress)
  // and reports the cycle it belongs to. False when the cycle already holds a
  // ticket; a new selection has to reset the cycle first.
  bool begin_share(uint64_t& cycle);
  void set_sharing_progress(uint64_t cycle, const Progress& progress);
  void complete_share(uint64_t cycle, Ticket ticket);
  void clear_sharing_progress(uint64_t cycle);

  void set_download_progress(const Progress& progress);
  void clear_download_progress();

  void push_error(TransferError error);

  // Starts a new share cycle: clears sharing progress and the ticket.
  void reset_share_cycle();

  // Removes the most recently pushed error. False when there is none.
  bool acknowledge_error();

private:
  template<typename Fn>
  bool mutate(Fn&& fn);

  mutable std::mutex m_;
  std::shared_ptr<const StateSnapshot> current_;
  RepaintCallback repaint_;
  std::condition_variable repaint_idle_;
  std::size_t repaints_running_ = 0;
};
