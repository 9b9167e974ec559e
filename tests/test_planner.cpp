#include "test_framework.hpp"

#include "carryover/restore/planner.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_planner_tests(std::vector<carryover::tests::TestCase> &tests) {
  using carryover::tests::require;
  namespace restore = carryover::restore;
  namespace t = carryover::testing;
  using carryover::rollout::Item;

  tests.push_back({"approximate_tokens_rounds_up_bytes_over_four", [] {
                     require(restore::approximate_tokens(Item::message("user", "")) == 0,
                             "empty message is free");
                     require(restore::approximate_tokens(Item::message("user", "abcde")) == 2,
                             "five bytes round up to two tokens");
                     require(restore::approximate_tokens(Item::function_call("ab", "cd", "c")) == 1,
                             "name and arguments are both counted");
                     require(restore::approximate_tokens(Item::function_output("c", "12345678", true)) ==
                                 2,
                             "output text is counted");
                     require(restore::approximate_tokens(Item::reasoning("abcd")) == 1,
                             "reasoning summary is counted");
                   }});

  tests.push_back({"uniform_items_pack_greedily", [] {
                     std::vector<Item> items;
                     for (int i = 0; i < 37; ++i) {
                       items.push_back(t::sized_message(i % 2 == 0 ? "user" : "assistant", 400));
                     }
                     const auto segments = restore::plan_segments(items, 250);
                     require(segments.ok(), segments.error());
                     require(segments.value().size() == 19,
                             "19 segments expected, got " + std::to_string(segments.value().size()));
                     for (std::size_t i = 0; i + 1 < segments.value().size(); ++i) {
                       require(segments.value()[i].size() == 2, "full segments hold two items");
                       require(segments.value()[i].estimated_tokens == 200, "segment estimate mismatch");
                     }
                     require(segments.value().back().size() == 1, "last segment holds one item");
                     require(segments.value().back().begin == 36 && segments.value().back().end == 37,
                             "last segment bounds mismatch");
                   }});

  tests.push_back({"oversized_item_gets_its_own_segment", [] {
                     const std::vector<Item> single = {t::sized_message("user", 2000)};
                     const auto one = restore::plan_segments(single, 250);
                     require(one.ok(), one.error());
                     require(one.value().size() == 1, "single oversized item is one segment");
                     require(one.value()[0].estimated_tokens == 500, "estimate mismatch");

                     const std::vector<Item> mixed = {t::sized_message("user", 400),
                                                      t::sized_message("user", 2000),
                                                      t::sized_message("user", 400)};
                     const auto three = restore::plan_segments(mixed, 250);
                     require(three.ok(), three.error());
                     require(three.value().size() == 3, "oversized item should stand alone");
                     require(three.value()[1].begin == 1 && three.value()[1].end == 2,
                             "oversized segment bounds mismatch");
                   }});

  tests.push_back({"segments_cover_items_in_order", [] {
                     std::vector<Item> items;
                     const std::size_t sizes[] = {10, 900, 40, 40, 40, 1200, 4, 4, 700};
                     for (const auto size : sizes) {
                       items.push_back(t::sized_message("user", size));
                     }
                     const auto segments = restore::plan_segments(items, 300);
                     require(segments.ok(), segments.error());
                     std::size_t expected_begin = 0;
                     for (const auto &segment : segments.value()) {
                       require(segment.begin == expected_begin, "segments must be contiguous");
                       require(segment.size() > 0, "segments must not be empty");
                       require(segment.estimated_tokens <= 300 || segment.size() == 1,
                               "only single-item segments may exceed the threshold");
                       expected_begin = segment.end;
                     }
                     require(expected_begin == items.size(), "every item must be covered");
                   }});

  tests.push_back({"custom_estimator_is_used", [] {
                     const std::vector<Item> items(5, Item::message("user", "x"));
                     const auto segments = restore::plan_segments(
                         items, 10, [](const Item &) { return std::size_t{5}; });
                     require(segments.ok(), segments.error());
                     require(segments.value().size() == 3, "5x5 tokens at threshold 10 is 2+2+1");
                   }});

  tests.push_back({"empty_input_and_invalid_threshold", [] {
                     const auto empty = restore::plan_segments({}, 100);
                     require(empty.ok() && empty.value().empty(), "empty input plans nothing");
                     const auto zero = restore::plan_segments({Item::message("user", "x")}, 0);
                     require(!zero.ok(), "zero threshold should fail");
                     require(zero.code() == carryover::common::ErrorCode::InvalidConfig,
                             "InvalidConfig expected");
                   }});
}
