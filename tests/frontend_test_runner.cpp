#include "console_frontend.hpp"
#include "fake_transfer_engine.hpp"
#include "test_runner_utils.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace std::chrono_literals;
using sendme::test::FakeTransferEngine;
using sendme::test::TestCase;
using sendme::test::TestContext;
using sendme::test::wait_for_condition;

namespace {

struct Fixture {
  explicit Fixture(TestContext& ctx, bool cancel_superseded = false)
    : engine(std::make_shared<FakeTransferEngine>()),
      state(std::make_shared<StateStore>()),
      ui_logger(std::make_shared<Logger>("sendme")) {
    ctx.logs.attach(ui_logger);
    worker = std::make_shared<Worker>(engine, state, Worker::Options{}, std::make_shared<Logger>("worker"));
    ConsoleFrontend::Options options;
    options.download_dir = "/downloads";
    options.meter_size = 10;
    options.cancel_superseded = cancel_superseded;
    frontend = std::make_unique<ConsoleFrontend>(worker, state, options, ui_logger);
    worker->start();
  }

  ~Fixture() {
    worker->stop();
  }

  bool wait_completed(uint64_t n) {
    return wait_for_condition([&]{ return worker->completed_requests() >= n; }, 5s);
  }

  std::shared_ptr<FakeTransferEngine> engine;
  std::shared_ptr<StateStore> state;
  std::shared_ptr<Logger> ui_logger;
  std::shared_ptr<Worker> worker;
  std::unique_ptr<ConsoleFrontend> frontend;
};

bool test_meter_shapes(TestContext&) {
  SENDME_CHECK(format_progress_meter(Progress::of(0.0f), 4, 0) == "[    ]");
  SENDME_CHECK(format_progress_meter(Progress::of(1.0f), 4, 0) == "[####]");
  SENDME_CHECK(format_progress_meter(Progress::of(0.5f), 4, 0) == "[##  ]");
  SENDME_CHECK(format_progress_meter(Progress::of(2.0f), 3, 0) == "[###]");
  auto partial = format_progress_meter(Progress::of(0.35f), 10, 0);
  SENDME_CHECK(partial.size() == 12);
  SENDME_CHECK(partial.substr(0, 4) == "[###");
  SENDME_CHECK(partial[4] != ' ' && partial[4] != '#');
  return true;
}

bool test_spinner_cycles(TestContext&) {
  auto p = Progress::indeterminate();
  SENDME_CHECK(format_progress_meter(p, 40, 0) == "[    ]");
  SENDME_CHECK(format_progress_meter(p, 40, 2) == "[..  ]");
  SENDME_CHECK(format_progress_meter(p, 40, 4) == "[....]");
  SENDME_CHECK(format_progress_meter(p, 40, 5) == "[    ]");
  return true;
}

bool test_share_requires_selection(TestContext& ctx) {
  Fixture f(ctx);
  SENDME_CHECK(f.frontend->execute_command("share"));
  SENDME_CHECK(ctx.logs.contains("select a file first"));
  SENDME_CHECK(f.engine->provide_calls.load() == 0);
  return true;
}

bool test_select_then_share_shows_ticket(TestContext& ctx) {
  Fixture f(ctx);
  SENDME_CHECK(f.frontend->execute_command("select /data/photo.jpg"));
  SENDME_CHECK(f.frontend->selected_file() == std::filesystem::path("/data/photo.jpg"));
  SENDME_CHECK(f.frontend->execute_command("share"));
  SENDME_CHECK(f.wait_completed(1));

  auto snap = f.state->snapshot();
  SENDME_CHECK(snap->ticket && snap->ticket->name == "photo.jpg");
  auto status = f.frontend->describe_state(*snap);
  SENDME_CHECK(status.find(snap->ticket->to_string()) != std::string::npos);

  SENDME_CHECK(f.frontend->execute_command("share"));
  SENDME_CHECK(ctx.logs.contains("already shared"));
  SENDME_CHECK(f.engine->provide_calls.load() == 1);

  SENDME_CHECK(f.frontend->execute_command("drop /data/other.jpg"));
  SENDME_CHECK(!f.state->snapshot()->ticket);
  return true;
}

bool test_paste_and_download(TestContext& ctx) {
  Fixture f(ctx);
  SENDME_CHECK(f.frontend->execute_command("download"));
  SENDME_CHECK(ctx.logs.contains("paste a ticket first"));

  auto text = FakeTransferEngine::make_ticket("movie.mkv", 500).to_string();
  SENDME_CHECK(f.frontend->execute_command("paste   " + text + "  "));
  SENDME_CHECK(f.frontend->ticket_text() == text);
  SENDME_CHECK(f.frontend->execute_command("target /tmp/films"));
  SENDME_CHECK(f.frontend->download_target() == std::filesystem::path("/tmp/films"));
  SENDME_CHECK(f.frontend->execute_command("download"));
  SENDME_CHECK(f.wait_completed(1));
  SENDME_CHECK(f.engine->fetch_calls.load() == 1);
  SENDME_CHECK(f.engine->last_destination() == std::filesystem::path("/tmp/films"));
  return true;
}

bool test_default_target_from_options(TestContext& ctx) {
  Fixture f(ctx);
  SENDME_CHECK(f.frontend->download_target() == std::filesystem::path("/downloads"));
  return true;
}

bool test_error_shown_and_acknowledged(TestContext& ctx) {
  Fixture f(ctx);
  SENDME_CHECK(f.frontend->execute_command("paste not-a-ticket"));
  SENDME_CHECK(f.frontend->execute_command("download"));
  SENDME_CHECK(f.wait_completed(1));

  auto status = f.frontend->describe_state(*f.state->snapshot());
  SENDME_CHECK(status.find("error:    parsing ticket:") != std::string::npos);
  SENDME_CHECK(status.find("(ok to dismiss)") != std::string::npos);

  SENDME_CHECK(f.frontend->execute_command("ok"));
  SENDME_CHECK(f.state->snapshot()->errors.empty());
  SENDME_CHECK(f.frontend->execute_command("ok"));
  SENDME_CHECK(ctx.logs.contains("no errors"));
  return true;
}

bool test_reset_clears_selection(TestContext& ctx) {
  Fixture f(ctx);
  SENDME_CHECK(f.frontend->execute_command("select /data/a.txt"));
  auto cycle = f.state->share_cycle();
  SENDME_CHECK(f.frontend->execute_command("reset"));
  SENDME_CHECK(!f.frontend->selected_file());
  SENDME_CHECK(f.state->share_cycle() == cycle + 1);
  return true;
}

bool test_quit_and_unknown_commands(TestContext& ctx) {
  Fixture f(ctx);
  SENDME_CHECK(f.frontend->execute_command(""));
  SENDME_CHECK(f.frontend->execute_command("frobnicate"));
  SENDME_CHECK(ctx.logs.contains("unknown command 'frobnicate'"));
  SENDME_CHECK(!f.frontend->execute_command("quit"));
  return true;
}

bool test_reselect_cancels_running_share(TestContext& ctx) {
  Fixture f(ctx, true);
  f.engine->provide_script = [](const std::filesystem::path&,
                                const ProgressSender&,
                                const CancellationToken& cancel,
                                Ticket&) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while(!cancel.cancelled() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(5ms);
    }
    return make_engine_error(transfer_errc::cancelled, "share cancelled");
  };
  SENDME_CHECK(f.frontend->execute_command("select /data/slow.bin"));
  SENDME_CHECK(f.frontend->execute_command("share"));
  SENDME_CHECK(wait_for_condition([&]{ return f.worker->current_operation().has_value(); }, 2s));
  auto started = std::chrono::steady_clock::now();
  SENDME_CHECK(f.frontend->execute_command("select /data/fast.bin"));
  SENDME_CHECK(f.wait_completed(1));
  SENDME_CHECK(std::chrono::steady_clock::now() - started < 4s);
  SENDME_CHECK(f.state->snapshot()->errors.empty());
  return true;
}

bool test_render_thread_starts_and_stops(TestContext& ctx) {
  Fixture f(ctx);
  f.frontend->start_render();
  f.state->set_download_progress(Progress::of(0.5f));
  std::this_thread::sleep_for(30ms);
  f.state->clear_download_progress();
  f.frontend->stop_render();
  f.frontend->stop_render();
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"meter_shapes", test_meter_shapes},
    {"spinner_cycles", test_spinner_cycles},
    {"share_requires_selection", test_share_requires_selection},
    {"select_then_share_shows_ticket", test_select_then_share_shows_ticket},
    {"paste_and_download", test_paste_and_download},
    {"default_target_from_options", test_default_target_from_options},
    {"error_shown_and_acknowledged", test_error_shown_and_acknowledged},
    {"reset_clears_selection", test_reset_clears_selection},
    {"quit_and_unknown_commands", test_quit_and_unknown_commands},
    {"reselect_cancels_running_share", test_reselect_cancels_running_share},
    {"render_thread_starts_and_stops", test_render_thread_starts_and_stops}
  };
  return sendme::test::run_test_cases("frontend", tests, argc, argv);
}
