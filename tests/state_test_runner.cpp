#include "shared_state.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

using sendme::test::TestCase;
using sendme::test::TestContext;

namespace {

Ticket make_ticket(const std::string& name) {
  Ticket t;
  t.hash = std::string(Ticket::kHashHexLength, 'b');
  t.size = 42;
  t.name = name;
  t.node.peer_id = "peer";
  t.node.addrs = {"127.0.0.1:1"};
  return t;
}

TransferError make_share_error(const std::string& file) {
  return ShareError{file, make_engine_error(transfer_errc::file_not_found, file + " does not exist")};
}

bool test_error_stack_discipline(TestContext&) {
  StateStore store;
  const int k = 5;
  for(int i = 0; i < k; ++i) {
    store.push_error(make_share_error("f" + std::to_string(i)));
  }
  SENDME_CHECK(store.snapshot()->errors.size() == static_cast<std::size_t>(k));
  for(int remaining = k; remaining > 0; --remaining) {
    auto snap = store.snapshot();
    const auto* top = snap->current_error();
    SENDME_CHECK(top != nullptr);
    const auto& share = std::get<ShareError>(*top);
    SENDME_CHECK(share.source == "f" + std::to_string(remaining - 1));
    SENDME_CHECK(store.acknowledge_error());
  }
  SENDME_CHECK(store.snapshot()->errors.empty());
  SENDME_CHECK(store.snapshot()->current_error() == nullptr);
  SENDME_CHECK(!store.acknowledge_error());
  return true;
}

bool test_older_error_resurfaces(TestContext&) {
  StateStore store;
  TicketParseError parse{"junk", "ticket must start with 'blob'"};
  store.push_error(parse);
  store.push_error(make_share_error("a.txt"));
  SENDME_CHECK(std::holds_alternative<ShareError>(*store.snapshot()->current_error()));
  SENDME_CHECK(store.acknowledge_error());
  auto snap = store.snapshot();
  SENDME_CHECK(std::holds_alternative<TicketParseError>(*snap->current_error()));
  SENDME_CHECK(describe(*snap->current_error()) == "parsing ticket: ticket must start with 'blob'");
  return true;
}

bool test_context_labels(TestContext&) {
  TransferError parse = TicketParseError{"x", "bad"};
  TransferError share = make_share_error("/tmp/a.bin");
  TransferError get = GetError{"blobxyz", "/tmp/out",
                               make_engine_error(transfer_errc::connect_failed, "no route")};
  SENDME_CHECK(std::string(context_label(parse)) == "parsing ticket");
  SENDME_CHECK(std::string(context_label(share)) == "sharing");
  SENDME_CHECK(std::string(context_label(get)) == "get");
  SENDME_CHECK(describe(share).rfind("sharing: a.bin: file not found", 0) == 0);
  SENDME_CHECK(describe(get) == "get: unable to reach provider: no route");
  return true;
}

bool test_snapshot_is_immutable(TestContext&) {
  StateStore store;
  auto before = store.snapshot();
  store.set_download_progress(Progress::of(0.5f));
  store.push_error(make_share_error("x"));
  SENDME_CHECK(!before->download_progress);
  SENDME_CHECK(before->errors.empty());
  auto after = store.snapshot();
  SENDME_CHECK(after->download_progress && *after->download_progress == Progress::of(0.5f));
  SENDME_CHECK(after->generation > before->generation);
  return true;
}

bool test_complete_share_sets_ticket(TestContext&) {
  StateStore store;
  auto cycle = store.share_cycle();
  store.set_sharing_progress(cycle, Progress::indeterminate());
  store.set_sharing_progress(cycle, Progress::of(0.7f));
  SENDME_CHECK(store.snapshot()->sharing_progress == Progress::of(0.7f));
  store.complete_share(cycle, make_ticket("a.txt"));
  auto snap = store.snapshot();
  SENDME_CHECK(!snap->sharing_progress);
  SENDME_CHECK(snap->ticket && snap->ticket->name == "a.txt");
  return true;
}

bool test_new_selection_clears_share(TestContext&) {
  StateStore store;
  auto cycle = store.share_cycle();
  store.complete_share(cycle, make_ticket("a.txt"));
  store.reset_share_cycle();
  auto snap = store.snapshot();
  SENDME_CHECK(!snap->ticket);
  SENDME_CHECK(!snap->sharing_progress);
  SENDME_CHECK(snap->share_cycle == cycle + 1);
  return true;
}

bool test_stale_share_is_ignored(TestContext&) {
  StateStore store;
  auto old_cycle = store.share_cycle();
  store.set_sharing_progress(old_cycle, Progress::of(0.2f));
  store.reset_share_cycle();
  store.set_sharing_progress(old_cycle, Progress::of(0.9f));
  store.complete_share(old_cycle, make_ticket("old.txt"));
  store.clear_sharing_progress(old_cycle);
  auto snap = store.snapshot();
  SENDME_CHECK(!snap->sharing_progress);
  SENDME_CHECK(!snap->ticket);

  store.set_sharing_progress(store.share_cycle(), Progress::of(0.3f));
  SENDME_CHECK(store.snapshot()->sharing_progress == Progress::of(0.3f));
  return true;
}

bool test_ticket_blocks_another_share(TestContext&) {
  StateStore store;
  uint64_t cycle = 99;
  SENDME_CHECK(store.begin_share(cycle));
  SENDME_CHECK(cycle == store.share_cycle());
  SENDME_CHECK(store.snapshot()->sharing_progress == Progress::indeterminate());
  store.complete_share(cycle, make_ticket("a.txt"));

  const auto generation = store.snapshot()->generation;
  uint64_t again = 0;
  SENDME_CHECK(!store.begin_share(again));
  store.set_sharing_progress(cycle, Progress::of(0.5f));
  auto snap = store.snapshot();
  SENDME_CHECK(snap->generation == generation);
  SENDME_CHECK(snap->ticket && !snap->sharing_progress);

  store.reset_share_cycle();
  SENDME_CHECK(store.begin_share(again));
  SENDME_CHECK(again == cycle + 1);
  return true;
}

bool test_download_progress_lifecycle(TestContext&) {
  StateStore store;
  store.set_download_progress(Progress::of(0.0f));
  store.set_download_progress(Progress::of(0.4f));
  SENDME_CHECK(store.snapshot()->download_progress == Progress::of(0.4f));
  store.clear_download_progress();
  SENDME_CHECK(!store.snapshot()->download_progress);
  return true;
}

bool test_repaint_only_on_change(TestContext&) {
  StateStore store;
  std::atomic<int> repaints{0};
  store.set_repaint_callback([&]{
    // The store must not be locked while the callback runs.
    auto snap = store.snapshot();
    (void)snap;
    ++repaints;
  });
  store.set_download_progress(Progress::of(0.1f));
  store.set_download_progress(Progress::of(0.1f));
  store.clear_download_progress();
  store.clear_download_progress();
  SENDME_CHECK(!store.acknowledge_error());
  SENDME_CHECK(repaints.load() == 2);
  store.set_repaint_callback(nullptr);
  store.push_error(make_share_error("z"));
  SENDME_CHECK(repaints.load() == 2);
  return true;
}

// Replacing the callback waits for a repaint already in progress on another
// thread, so the old callback's owner can go away right after.
bool test_clearing_callback_waits_for_running_repaint(TestContext&) {
  StateStore store;
  std::mutex m;
  std::condition_variable cv;
  bool entered = false;
  bool release = false;
  std::atomic<bool> repaint_finished{false};
  store.set_repaint_callback([&]{
    std::unique_lock<std::mutex> lock(m);
    entered = true;
    cv.notify_all();
    cv.wait_for(lock, 5s, [&]{ return release; });
    repaint_finished = true;
  });

  std::thread mutator([&]{ store.set_download_progress(Progress::of(0.5f)); });
  bool repaint_started = false;
  {
    std::unique_lock<std::mutex> lock(m);
    repaint_started = cv.wait_for(lock, 2s, [&]{ return entered; });
  }

  std::atomic<bool> cleared{false};
  std::thread clearer([&]{
    store.set_repaint_callback(nullptr);
    cleared = true;
  });
  std::this_thread::sleep_for(50ms);
  const bool returned_early = cleared.load();
  {
    std::lock_guard<std::mutex> lock(m);
    release = true;
  }
  cv.notify_all();
  clearer.join();
  mutator.join();

  SENDME_CHECK(repaint_started);
  SENDME_CHECK(!returned_early);
  SENDME_CHECK(repaint_finished.load());
  SENDME_CHECK(cleared.load());
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"error_stack_discipline", test_error_stack_discipline},
    {"older_error_resurfaces", test_older_error_resurfaces},
    {"context_labels", test_context_labels},
    {"snapshot_is_immutable", test_snapshot_is_immutable},
    {"complete_share_sets_ticket", test_complete_share_sets_ticket},
    {"new_selection_clears_share", test_new_selection_clears_share},
    {"stale_share_is_ignored", test_stale_share_is_ignored},
    {"ticket_blocks_another_share", test_ticket_blocks_another_share},
    {"download_progress_lifecycle", test_download_progress_lifecycle},
    {"repaint_only_on_change", test_repaint_only_on_change},
    {"clearing_callback_waits_for_running_repaint", test_clearing_callback_waits_for_running_repaint}
  };
  return sendme::test::run_test_cases("state", tests, argc, argv);
}
