#include "test_framework.hpp"

#include "carryover/common/fs.hpp"
#include "carryover/restore/orchestrator.hpp"
#include "carryover/rollout/reader.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace restore = carryover::restore;
namespace rollout = carryover::rollout;
namespace t = carryover::testing;
using rollout::Item;

struct Fixture {
  t::TempWorkspace ws;
  std::filesystem::path project;
  std::shared_ptr<t::MockExecutionService> resume_service =
      std::make_shared<t::MockExecutionService>();
  std::shared_ptr<t::MockExecutionService> replay_service =
      std::make_shared<t::MockExecutionService>();
  std::shared_ptr<t::MockServiceFactory> factory =
      std::make_shared<t::MockServiceFactory>(replay_service);
  restore::OrchestratorOptions options;

  Fixture() {
    ws.create_file("proj/AGENTS.md", "# agents");
    project = carryover::common::normalize_path(ws.path() / "proj");
    options.sessions_dir = ws.path() / "sessions";
    options.restore.max_tokens_per_segment = 250;
    options.restore.handshake_timeout_ms = 1000;
    options.current_execution = rollout::ExecutionConfigSnapshot{
        .model = "model-a", .reasoning_effort = "medium", .sandbox_policy = "workspace-write"};
  }

  // A session in this project that was cut off while a tool call was running.
  std::filesystem::path write_session(const std::optional<std::string> &token,
                                      const std::optional<std::string> &root = std::nullopt) {
    auto header = t::make_header("orig");
    header.recorded_project_root = root.has_value() ? root : project.string();
    header.recorded_cwd = project.string();
    header.execution_config = options.current_execution;
    std::vector<rollout::Record> records = {
        rollout::Record{t::sized_message("user", 400)},
        rollout::Record{t::sized_message("assistant", 400)},
        rollout::Record{Item::function_call("shell", "{}", "c1")},
    };
    if (token.has_value()) {
      rollout::StateSnapshot state;
      state.provider_resume_token = token;
      records.insert(records.begin() + 2, rollout::Record{state});
    }
    return t::write_rollout(rollout::rollout_path_for(options.sessions_dir, header), header,
                            records);
  }

  restore::RestoreOrchestrator orchestrator(restore::DriftHook hook = {}) const {
    return restore::RestoreOrchestrator(resume_service, factory, options, std::move(hook));
  }

  restore::RestoreRequest request(const std::filesystem::path &path,
                                  const restore::RestoreMode mode = restore::RestoreMode::Auto) const {
    return restore::RestoreRequest{.rollout_path = path, .mode = mode, .cwd = project};
  }
};

bool has_notice(const restore::RestoreOutcome &outcome, const std::string &prefix) {
  for (const auto &notice : outcome.notices) {
    if (notice.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_orchestrator_tests(std::vector<carryover::tests::TestCase> &tests) {
  using carryover::tests::require;

  tests.push_back({"confirmed_handshake_resumes_in_place", [] {
                     Fixture fx;
                     const auto path = fx.write_session("tok-1");
                     const auto lines_before = t::read_lines(path).size();
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(fx.request(path), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().kind == restore::RestoreKind::ServerResumed,
                             "server resume expected");
                     require(outcome.value().replay == nullptr, "no replay on server resume");
                     require(fx.factory->contexts_created() == 0, "no new context expected");
                     require(fx.resume_service->calls() ==
                                 std::vector<std::string>{"handshake:tok-1"},
                             "only the handshake should reach the service");
                     require(context.rollout_path == path, "context should keep the same rollout");
                     require(context.session_id == "orig", "session id should be kept");
                     require(context.writer.has_value() && context.writer->is_open(),
                             "context should own a writer");
                     require(context.service == fx.resume_service, "resume service should be bound");
                     require(outcome.value().synthesized_results == 1, "one aborted result expected");

                     context.writer->close();
                     const auto lines_after = t::read_lines(path);
                     require(lines_after.size() == lines_before + 1,
                             "aborted result should be appended to the same log");
                     const auto loaded = rollout::read_rollout(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().items().back() ==
                                 Item::function_output("c1", "aborted", false),
                             "appended record should close the interrupted call");
                   }});

  tests.push_back({"rejected_handshake_offers_replay", [] {
                     Fixture fx;
                     fx.resume_service->set_handshake_reply(false, "expired");
                     const auto path = fx.write_session("tok-1");
                     const auto original = t::read_file(path);
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(fx.request(path), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().kind == restore::RestoreKind::ReplayPending,
                             "replay should be offered");
                     require(outcome.value().handshake.reason == "expired", "reason mismatch");
                     require(has_notice(outcome.value(), "Server resume rejected (expired)"),
                             "rejection notice expected");
                     require(outcome.value().replay != nullptr, "controller expected");
                     require(fx.replay_service->calls().empty(), "nothing sent before proceed");
                     require(fx.factory->contexts_created() == 0, "no context before proceed");
                     require(!context.writer.has_value(), "context must stay untouched");

                     auto &replay = *outcome.value().replay;
                     require(replay.plan().items.size() == 4, "reconciled items expected");
                     require(replay.plan().items.back() == Item::function_output("c1", "aborted", false),
                             "replay should include the aborted result");
                     require(replay.run_to_completion().ok(), "replay failed");
                     require(fx.orchestrator().adopt_replay(replay, context).ok(), "adopt failed");
                     require(context.rollout_path != path, "context should move to the new rollout");
                     require(context.service == fx.replay_service, "replay context should be bound");
                     require(t::read_file(path) == original, "source rollout must be unchanged");
                   }});

  tests.push_back({"completed_turns_checkpoint_the_resumed_rollout", [] {
                     Fixture fx;
                     const auto path = fx.write_session("tok-1");
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(fx.request(path), context);
                     require(outcome.ok(), outcome.error());
                     const auto lines_after_resume = t::read_lines(path).size();

                     require(restore::sync_checkpoint(context).ok(), "sync failed");
                     require(t::read_lines(path).size() == lines_after_resume,
                             "no completed turn yet, nothing to write");

                     fx.resume_service->set_completed_token("tok-1");
                     require(restore::sync_checkpoint(context).ok(), "sync failed");
                     require(t::read_lines(path).size() == lines_after_resume,
                             "the token used to resume is already recorded");

                     fx.resume_service->set_completed_token("tok-2");
                     require(restore::sync_checkpoint(context).ok(), "sync failed");
                     require(restore::sync_checkpoint(context).ok(), "second sync failed");
                     require(t::read_lines(path).size() == lines_after_resume + 1,
                             "one snapshot per new token");
                     require(context.checkpointed_token == std::optional<std::string>("tok-2"),
                             "context should track the checkpoint");

                     context.writer->close();
                     const auto loaded = rollout::read_rollout(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().state.provider_resume_token ==
                                 std::optional<std::string>("tok-2"),
                             "latest token should win");
                   }});

  tests.push_back({"turn_completed_after_replay_writes_the_new_rollout", [] {
                     Fixture fx;
                     const auto path = fx.write_session(std::nullopt);
                     restore::SessionContext context;
                     require(!restore::on_turn_completed(context, "tok-9").ok(),
                             "no writer means nothing to checkpoint");

                     auto outcome = fx.orchestrator().restore(
                         fx.request(path, restore::RestoreMode::Replay), context);
                     require(outcome.ok(), outcome.error());
                     auto &replay = *outcome.value().replay;
                     require(replay.run_to_completion().ok(), "replay failed");
                     require(fx.orchestrator().adopt_replay(replay, context).ok(), "adopt failed");

                     require(!restore::on_turn_completed(context, "").ok(),
                             "empty token should be rejected");
                     require(restore::on_turn_completed(context, "tok-9").ok(), "checkpoint failed");
                     const auto new_path = context.rollout_path;
                     context.writer->close();
                     const auto fresh = rollout::read_rollout(new_path);
                     require(fresh.ok(), fresh.error());
                     require(fresh.value().state.provider_resume_token ==
                                 std::optional<std::string>("tok-9"),
                             "replayed session should become resumable");
                     const auto source = rollout::read_rollout(path);
                     require(source.ok() && !source.value().state.provider_resume_token.has_value(),
                             "source rollout must not receive the checkpoint");
                   }});

  tests.push_back({"handshake_timeout_is_treated_as_rejection", [] {
                     Fixture fx;
                     fx.options.restore.handshake_timeout_ms = 20;
                     fx.resume_service->set_handshake_delay(std::chrono::milliseconds(400));
                     const auto path = fx.write_session("tok-1");
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(fx.request(path), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().kind == restore::RestoreKind::ReplayPending,
                             "timeout should lead to replay");
                     require(outcome.value().handshake.reason == "timeout", "timeout reason expected");
                     require(outcome.value().handshake.status().code() ==
                                 carryover::common::ErrorCode::HandshakeTimeout,
                             "timeout status expected");
                     require(outcome.value().status.ok(), "a pending replay is not a failure");
                     require(!context.writer.has_value(), "late confirmation must not bind");
                   }});

  tests.push_back({"missing_token_skips_the_service", [] {
                     Fixture fx;
                     const auto path = fx.write_session(std::nullopt);
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(fx.request(path), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().handshake.outcome == restore::HandshakeOutcome::Missing,
                             "Missing expected");
                     require(fx.resume_service->handshake_count() == 0, "service must not be asked");
                     require(outcome.value().kind == restore::RestoreKind::ReplayPending,
                             "replay should be offered");
                   }});

  tests.push_back({"server_mode_does_not_fall_back", [] {
                     Fixture fx;
                     fx.resume_service->set_handshake_reply(false, "gone");
                     const auto path = fx.write_session("tok-1");
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(
                         fx.request(path, restore::RestoreMode::ServerResume), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().kind == restore::RestoreKind::ResumeUnavailable,
                             "ResumeUnavailable expected");
                     require(outcome.value().status.code() ==
                                 carryover::common::ErrorCode::HandshakeRejected,
                             "outcome should carry the rejection");
                     require(outcome.value().replay == nullptr, "no replay expected");
                   }});

  tests.push_back({"replay_mode_skips_the_handshake", [] {
                     Fixture fx;
                     const auto path = fx.write_session("tok-1");
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(
                         fx.request(path, restore::RestoreMode::Replay), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().kind == restore::RestoreKind::ReplayPending,
                             "replay expected");
                     require(fx.resume_service->handshake_count() == 0, "no handshake expected");
                   }});

  tests.push_back({"manual_mode_returns_seed_only", [] {
                     Fixture fx;
                     const auto path = fx.write_session("tok-1");
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(
                         fx.request(path, restore::RestoreMode::Manual), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().kind == restore::RestoreKind::Manual, "Manual expected");
                     require(outcome.value().seed ==
                                 std::optional<std::string>("Restore this session: " + path.string()),
                             "seed mismatch");
                     require(fx.resume_service->calls().empty(), "service must not be contacted");
                   }});

  tests.push_back({"foreign_project_is_flagged", [] {
                     Fixture fx;
                     const auto path = fx.write_session(std::nullopt, std::string("/some/other/project"));
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(fx.request(path), context);
                     require(outcome.ok(), outcome.error());
                     require(has_notice(outcome.value(),
                                        "Session belongs to another project: /some/other/project"),
                             "cross-project notice expected");
                   }});

  tests.push_back({"drift_hook_runs_only_when_not_interactive", [] {
                     Fixture fx;
                     const auto path = fx.write_session(std::nullopt);
                     fx.options.current_execution.model = "model-z";
                     int calls = 0;
                     auto hook = [&calls](const rollout::ExecutionConfigSnapshot &recorded,
                                          const rollout::ExecutionConfigSnapshot &current) {
                       ++calls;
                       return recorded.model == "model-a" && current.model == "model-z"
                                  ? restore::DriftDecision::ApplyRecorded
                                  : restore::DriftDecision::KeepCurrent;
                     };

                     restore::SessionContext context;
                     auto interactive = fx.orchestrator(hook).restore(fx.request(path), context);
                     require(interactive.ok(), interactive.error());
                     require(calls == 0, "hook must not run in interactive mode");
                     require(interactive.value().execution_config.model == "model-z",
                             "current config stays in interactive mode");

                     fx.options.restore.interactive = false;
                     auto headless = fx.orchestrator(hook).restore(fx.request(path), context);
                     require(headless.ok(), headless.error());
                     require(calls == 1, "hook should run once");
                     require(headless.value().drift_decision ==
                                 std::optional<restore::DriftDecision>(
                                     restore::DriftDecision::ApplyRecorded),
                             "decision should be recorded");
                     require(headless.value().execution_config.model == "model-a",
                             "recorded config should apply");
                   }});

  tests.push_back({"unattended_replay_runs_and_rebinds", [] {
                     Fixture fx;
                     fx.options.restore.unattended_replay = true;
                     const auto path = fx.write_session(std::nullopt);
                     restore::SessionContext context;
                     auto outcome = fx.orchestrator().restore(fx.request(path), context);
                     require(outcome.ok(), outcome.error());
                     require(outcome.value().kind == restore::RestoreKind::ReplayCompleted,
                             "replay should complete unattended");
                     require(context.writer.has_value(), "context should own the new writer");
                     require(context.rollout_path != path, "new rollout expected");
                     require(context.session_id != "orig", "new session id expected");
                     require(fx.replay_service->sends().back().text == restore::RESTORE_END_MARKER,
                             "end marker should be the last send");
                   }});

  tests.push_back({"token_lost_respects_auto_fallback", [] {
                     Fixture fx;
                     const auto path = fx.write_session("tok-1");
                     restore::SessionContext context;
                     context.rollout_path = path;
                     context.session_id = "orig";

                     auto skipped = fx.orchestrator().on_token_lost(context);
                     require(skipped.ok(), skipped.error());
                     require(skipped.value().kind == restore::RestoreKind::Skipped,
                             "fallback disabled should skip");

                     fx.options.restore.auto_fallback = true;
                     auto planned = fx.orchestrator().on_token_lost(context);
                     require(planned.ok(), planned.error());
                     require(planned.value().kind == restore::RestoreKind::ReplayPending,
                             "replay should be prepared");
                     require(planned.value().handshake.reason == "token lost", "reason mismatch");
                     require(fx.replay_service->calls().empty(),
                             "nothing is sent without the user");
                     require(context.rollout_path == path, "context unchanged until adoption");
                   }});

  tests.push_back({"corrupt_rollout_reports_error", [] {
                     Fixture fx;
                     fx.ws.create_file("broken.jsonl", "garbage\n");
                     restore::SessionContext context;
                     auto outcome =
                         fx.orchestrator().restore(fx.request(fx.ws.path() / "broken.jsonl"), context);
                     require(!outcome.ok(), "corrupt header should fail");
                     require(outcome.code() == carryover::common::ErrorCode::CorruptHeader,
                             "CorruptHeader expected");
                     require(fx.resume_service->calls().empty(), "service must not be contacted");
                   }});

  tests.push_back({"restore_mode_names_parse", [] {
                     require(restore::parse_restore_mode("Server") ==
                                 std::optional<restore::RestoreMode>(restore::RestoreMode::ServerResume),
                             "server should parse");
                     require(restore::parse_restore_mode("resume") ==
                                 std::optional<restore::RestoreMode>(restore::RestoreMode::ServerResume),
                             "resume alias should parse");
                     require(!restore::parse_restore_mode("bogus").has_value(), "bogus should fail");
                     require(restore::restore_mode_name(restore::RestoreMode::Replay) == "replay",
                             "name mismatch");
                   }});
}
