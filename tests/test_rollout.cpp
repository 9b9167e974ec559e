#include "test_framework.hpp"

#include "carryover/rollout/reader.hpp"
#include "carryover/rollout/record.hpp"
#include "carryover/rollout/transcript.hpp"
#include "carryover/rollout/writer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <fstream>

void register_rollout_tests(std::vector<carryover::tests::TestCase> &tests) {
  using carryover::tests::require;
  namespace rollout = carryover::rollout;
  namespace t = carryover::testing;

  tests.push_back({"header_round_trips_all_fields", [] {
                     rollout::SessionHeader header = t::make_header("s-1");
                     header.seed_instructions = "be terse";
                     header.execution_config = rollout::ExecutionConfigSnapshot{
                         .model = "m", .reasoning_effort = "low", .sandbox_policy = "read-only"};
                     header.recorded_project_root = "/work/proj";
                     header.recorded_cwd = "/work/proj/src";
                     const auto parsed =
                         rollout::parse_header_jsonl(rollout::encode_header_jsonl(header));
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().session_id == "s-1", "session id mismatch");
                     require(parsed.value().seed_instructions == header.seed_instructions,
                             "seed mismatch");
                     require(parsed.value().execution_config == header.execution_config,
                             "execution config mismatch");
                     require(parsed.value().recorded_project_root == header.recorded_project_root,
                             "project root mismatch");
                     require(parsed.value().recorded_cwd == header.recorded_cwd, "cwd mismatch");
                     require(!parsed.value().provider_resume_token.has_value(),
                             "no token expected");
                   }});

  tests.push_back({"header_rejects_records_and_garbage", [] {
                     const auto record_line = rollout::parse_header_jsonl(
                         R"({"type":"message","role":"user","content":"hi"})");
                     require(!record_line.ok(), "record line is not a header");
                     require(record_line.code() == carryover::common::ErrorCode::CorruptHeader,
                             "CorruptHeader expected");
                     require(!rollout::parse_header_jsonl("{{{").ok(), "garbage is not a header");
                     require(!rollout::parse_header_jsonl(R"({"session_id":"x"})").ok(),
                             "header without timestamp should fail");
                   }});

  tests.push_back({"header_ignores_unknown_fields_including_type", [] {
                     const auto parsed = rollout::parse_header_jsonl(
                         R"({"timestamp":"2025-01-01T00:00:00.000Z","session_id":"s",)"
                         R"("type":"session_meta","record_type":"meta","cli_version":"9.9",)"
                         R"("git":{"branch":"main"},"recorded_cwd":"/w"})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().session_id == "s", "session id mismatch");
                     require(parsed.value().recorded_cwd == std::optional<std::string>("/w"),
                             "known fields should still be read");
                   }});

  tests.push_back({"rollout_with_typed_header_is_readable", [] {
                     const t::TempWorkspace ws;
                     ws.create_file("r.jsonl",
                                    R"({"timestamp":"2025-01-01T00:00:00.000Z",)"
                                    R"("session_id":"s","type":"session_meta"})"
                                    "\n" +
                                        rollout::encode_record_jsonl(rollout::Record{
                                            rollout::Item::message("user", "hello")}) +
                                        "\n");
                     const auto loaded = rollout::read_rollout(ws.path() / "r.jsonl");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().items().size() == 1, "one item expected");
                   }});

  tests.push_back({"items_round_trip_through_jsonl", [] {
                     const std::vector<rollout::Item> items = {
                         rollout::Item::message("user", "list files"),
                         rollout::Item::message("assistant", "running ls"),
                         rollout::Item::function_call("shell", R"({"cmd":["ls"]})", "c1"),
                         rollout::Item::function_output("c1", "a.txt\nb.txt", true),
                         rollout::Item::function_output("c2", "boom", false),
                         rollout::Item::reasoning("thinking about it"),
                     };
                     for (const auto &item : items) {
                       const auto parsed = rollout::parse_record_jsonl(
                           rollout::encode_record_jsonl(rollout::Record{item}));
                       require(parsed.ok(), parsed.error());
                       const auto *decoded = std::get_if<rollout::Item>(&parsed.value());
                       require(decoded != nullptr, "item expected");
                       require(*decoded == item,
                               std::string("round trip mismatch for ") +
                                   std::string(rollout::item_kind_name(item.kind)));
                     }
                   }});

  tests.push_back({"record_parses_external_output_shapes", [] {
                     const auto bare = rollout::parse_record_jsonl(
                         R"({"type":"function_call_output","call_id":"c","output":"plain"})");
                     require(bare.ok(), bare.error());
                     require(std::get<rollout::Item>(bare.value()).output == "plain",
                             "bare string output mismatch");

                     const auto parts = rollout::parse_record_jsonl(
                         R"({"type":"function_call_output","call_id":"c","output":[{"text":"a"},{"text":"b"}]})");
                     require(parts.ok(), parts.error());
                     require(std::get<rollout::Item>(parts.value()).output == "ab",
                             "array output should concatenate");

                     const auto args = rollout::parse_record_jsonl(
                         R"({"type":"function_call","name":"shell","arguments":{"cmd":"ls"},"call_id":"c"})");
                     require(args.ok(), args.error());
                     require(std::get<rollout::Item>(args.value()).arguments == R"({"cmd":"ls"})",
                             "object arguments should be kept raw");
                   }});

  tests.push_back({"unknown_records_are_preserved_verbatim", [] {
                     const std::string line = R"({"type":"web_search_call","query":"x"})";
                     const auto parsed = rollout::parse_record_jsonl(line);
                     require(parsed.ok(), parsed.error());
                     const auto *unknown = std::get_if<rollout::UnknownRecord>(&parsed.value());
                     require(unknown != nullptr, "unknown record expected");
                     require(rollout::encode_record_jsonl(parsed.value()) == line,
                             "unknown record should re-encode byte for byte");

                     const auto no_call_id = rollout::parse_record_jsonl(
                         R"({"type":"function_call","name":"shell"})");
                     require(no_call_id.ok() &&
                                 std::holds_alternative<rollout::UnknownRecord>(no_call_id.value()),
                             "call without call_id should be kept as unknown");
                   }});

  tests.push_back({"record_rejects_non_object", [] {
                     const auto parsed = rollout::parse_record_jsonl("[1,2]");
                     require(!parsed.ok(), "array line should fail");
                     require(parsed.code() == carryover::common::ErrorCode::CorruptRecord,
                             "CorruptRecord expected");
                   }});

  tests.push_back({"latest_state_folds_snapshots_in_order", [] {
                     auto header = t::make_header("s");
                     header.provider_resume_token = "from-header";
                     rollout::StateSnapshot first;
                     first.provider_resume_token = "tok-1";
                     first.approved_commands = std::vector<std::string>{"ls"};
                     rollout::StateSnapshot second;
                     second.available_tools = std::vector<std::string>{"shell", "apply_patch"};
                     const std::vector<rollout::Record> records = {
                         rollout::Record{first}, rollout::Record{rollout::Item::message("user", "x")},
                         rollout::Record{second}};
                     const auto state = rollout::latest_state(header, records);
                     require(state.provider_resume_token == std::optional<std::string>("tok-1"),
                             "later token should win");
                     require(state.approved_commands == std::vector<std::string>{"ls"},
                             "approved commands should survive a sparse snapshot");
                     require(state.available_tools.size() == 2, "tools mismatch");

                     const auto header_only = rollout::latest_state(header, {});
                     require(header_only.provider_resume_token ==
                                 std::optional<std::string>("from-header"),
                             "header token should seed the state");
                   }});

  tests.push_back({"writer_and_reader_round_trip", [] {
                     t::TempWorkspace ws;
                     const auto path = ws.path() / "nested" / "r.jsonl";
                     auto writer = rollout::RolloutWriter::create(path, t::make_header("s-2"));
                     require(writer.ok(), writer.error());
                     require(writer.value().append(rollout::Record{
                                                       rollout::Item::message("user", "hello")})
                                 .ok(),
                             "append failed");
                     require(writer.value().append_checkpoint("tok-9").ok(), "checkpoint failed");
                     require(writer.value()
                                 .append(rollout::Record{rollout::Notice{.text = "note"}})
                                 .ok(),
                             "notice append failed");
                     writer.value().close();

                     const auto loaded = rollout::read_rollout(path);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().header.session_id == "s-2", "session id mismatch");
                     require(loaded.value().records.size() == 3, "three records expected");
                     require(loaded.value().items().size() == 1, "one item expected");
                     require(loaded.value().state.provider_resume_token ==
                                 std::optional<std::string>("tok-9"),
                             "checkpoint token should be effective");
                     require(loaded.value().skipped_lines == 0, "no skipped lines expected");
                   }});

  tests.push_back({"writer_refuses_to_overwrite", [] {
                     t::TempWorkspace ws;
                     ws.create_file("r.jsonl", "existing\n");
                     const auto writer =
                         rollout::RolloutWriter::create(ws.path() / "r.jsonl", t::make_header("s"));
                     require(!writer.ok(), "existing file should not be overwritten");
                     require(writer.code() == carryover::common::ErrorCode::Io, "Io expected");
                     require(t::read_file(ws.path() / "r.jsonl") == "existing\n",
                             "existing content should be untouched");
                   }});

  tests.push_back({"writer_after_close_reports_io", [] {
                     t::TempWorkspace ws;
                     auto writer =
                         rollout::RolloutWriter::create(ws.path() / "r.jsonl", t::make_header("s"));
                     require(writer.ok(), writer.error());
                     writer.value().close();
                     const auto status = writer.value().append(
                         rollout::Record{rollout::Item::message("user", "late")});
                     require(!status.ok(), "append after close should fail");
                     require(status.code() == carryover::common::ErrorCode::Io, "Io expected");
                   }});

  tests.push_back({"reader_skips_corrupt_lines_and_torn_tail", [] {
                     t::TempWorkspace ws;
                     const std::string header =
                         rollout::encode_header_jsonl(t::make_header("s-3"));
                     const std::string good = rollout::encode_record_jsonl(
                         rollout::Record{rollout::Item::message("user", "hi")});
                     ws.create_file("r.jsonl", header + "\n" + good + "\nnot json\n\n" + good +
                                                   "\n{\"type\":\"message\",\"ro");
                     const auto loaded = rollout::read_rollout(ws.path() / "r.jsonl");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().items().size() == 2, "two good items expected");
                     require(loaded.value().skipped_lines == 2,
                             "corrupt line and torn tail should be counted, got " +
                                 std::to_string(loaded.value().skipped_lines));
                   }});

  tests.push_back({"reader_rejects_bad_header", [] {
                     t::TempWorkspace ws;
                     ws.create_file("empty.jsonl", "");
                     ws.create_file("bad.jsonl", "oops\n");
                     const auto empty = rollout::read_rollout(ws.path() / "empty.jsonl");
                     require(!empty.ok() &&
                                 empty.code() == carryover::common::ErrorCode::CorruptHeader,
                             "empty file should be CorruptHeader");
                     const auto bad = rollout::read_rollout(ws.path() / "bad.jsonl");
                     require(!bad.ok() && bad.code() == carryover::common::ErrorCode::CorruptHeader,
                             "garbage header should be CorruptHeader");
                     const auto missing = rollout::read_rollout(ws.path() / "missing.jsonl");
                     require(!missing.ok() && missing.code() == carryover::common::ErrorCode::Io,
                             "missing file should be Io");
                   }});

  tests.push_back({"open_existing_terminates_torn_tail", [] {
                     t::TempWorkspace ws;
                     const std::string header =
                         rollout::encode_header_jsonl(t::make_header("s-4"));
                     ws.create_file("r.jsonl", header + "\n{\"type\":\"mess");
                     auto writer = rollout::RolloutWriter::open_existing(ws.path() / "r.jsonl");
                     require(writer.ok(), writer.error());
                     require(writer.value().header().session_id == "s-4", "header mismatch");
                     require(writer.value()
                                 .append(rollout::Record{rollout::Item::message("user", "next")})
                                 .ok(),
                             "append failed");
                     writer.value().close();

                     const auto loaded = rollout::read_rollout(ws.path() / "r.jsonl");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().items().size() == 1, "appended item should be readable");
                     require(loaded.value().skipped_lines == 1, "torn line should be skipped");
                   }});

  tests.push_back({"rollout_path_partitions_by_date", [] {
                     const auto header = t::make_header("abc", "2025-08-12T10:20:30.123Z");
                     const auto path = rollout::rollout_path_for("/sessions", header);
                     require(path == std::filesystem::path(
                                         "/sessions/2025/08/12/rollout-2025-08-12T10-20-30-123-abc.jsonl"),
                             "unexpected path: " + path.string());
                   }});

  tests.push_back({"transcript_renders_visible_items", [] {
                     const std::vector<rollout::Item> items = {
                         rollout::Item::message("user", "<user_instructions>seed</user_instructions>"),
                         rollout::Item::message("user", "fix the bug"),
                         rollout::Item::message("system", "hidden"),
                         rollout::Item::reasoning("secret"),
                         rollout::Item::function_call("shell", "", "c1"),
                         rollout::Item::function_output("c1", "", true),
                         rollout::Item::function_output("c1", "done", true),
                         rollout::Item::message("assistant", "fixed"),
                     };
                     const auto lines = rollout::render_item_lines(items);
                     const std::vector<std::string> expected = {
                         "user: fix the bug", "tool: shell args: {}", "tool.out: done",
                         "assistant: fixed"};
                     require(lines == expected, "transcript lines mismatch");
                   }});

  tests.push_back({"seed_detection_ignores_leading_whitespace", [] {
                     require(rollout::is_seed_message(rollout::Item::message(
                                 "user", "\n  <environment_context>cwd</environment_context>")),
                             "environment context should be a seed");
                     require(!rollout::is_seed_message(
                                 rollout::Item::message("assistant", "<user_instructions>")),
                             "assistant messages are never seeds");
                   }});
}
