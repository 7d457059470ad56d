/**
 * @file test_aggregator.cpp
 * @brief Global reduce: partition independence, file failure accounting,
 *        reason summary and the end-to-end pipeline over a directory.
 */

#include <gtest/gtest.h>
#include <aggregate/aggregator.hpp>
#include <core/pipeline.hpp>

#include "test_support.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using aggregate::Aggregator;
using aggregate::DistributionSet;
using ingest::FileError;
using ingest::FileErrorKind;
using ingest::FileResult;
using testing_support::TempDir;
using testing_support::valid_record;
using testing_support::wrap;

namespace {

DistributionSet partial(const std::string &card, int64_t n, const std::string &file) {
  DistributionSet d;
  d.master_deck[card] = n;
  d.floors_visited.insert("M");
  d.run_index.insert({file, "p", "IRONCLAD", "true"});
  d.meta.processed_logs = n;
  return d;
}

} // namespace

// ============================================================================
// Reduce
// ============================================================================

TEST(AggregatorTest, PartitionDoesNotChangeResult) {
  FileResult a = partial("Bash", 2, "a.json");
  FileResult b = partial("Strike_R", 1, "b.json");
  FileResult c = partial("Bash", 5, "c.json");

  auto all = Aggregator::reduce({a, b, c});
  auto split = Aggregator::merge(Aggregator::reduce({a, b}), Aggregator::reduce({c}));
  auto reordered = Aggregator::reduce({c, a, b});

  EXPECT_EQ(all, split);
  EXPECT_EQ(all, reordered);
  EXPECT_EQ(all.master_deck.at("Bash"), 7);
  EXPECT_EQ(all.meta.files_ok, 3);
}

TEST(AggregatorTest, FileErrorOnlyCountsFailure) {
  FileResult ok = partial("Bash", 1, "a.json");
  FileResult err = FileError{"b.json", FileErrorKind::PARSE, "bad"};

  auto with_error = Aggregator::reduce({ok, err});
  auto without = Aggregator::reduce({ok});

  EXPECT_EQ(with_error.meta.files_failed, 1);
  EXPECT_EQ(with_error.meta.files_ok, 1);
  with_error.meta.files_failed = 0;
  EXPECT_EQ(with_error, without);
}

TEST(AggregatorTest, MoveAddKeepsFailuresSeenBeforeFirstSuccess) {
  Aggregator agg;
  agg.add(FileResult{FileError{"x.json", FileErrorKind::READ, "gone"}});
  agg.add(FileResult{partial("Bash", 1, "a.json")});
  agg.add(FileResult{partial("Bash", 2, "b.json")});

  const auto &d = agg.result();
  EXPECT_EQ(d.meta.files_failed, 1);
  EXPECT_EQ(d.meta.files_ok, 2);
  EXPECT_EQ(d.master_deck.at("Bash"), 3);

  auto taken = agg.take();
  EXPECT_EQ(taken.meta.files_ok, 2);
  EXPECT_EQ(agg.result(), DistributionSet{});
}

TEST(AggregatorTest, EmptyReduce) {
  EXPECT_EQ(Aggregator::reduce({}), DistributionSet{});
}

// ============================================================================
// Reason summary
// ============================================================================

TEST(AggregatorTest, ReasonsSortedByCountThenCode) {
  DistributionSet d;
  d.meta.modded_reasons = {{"modded_card_found", 3}, {"chose_seed_true", 5},
                           {"is_beta_true", 3}, {"modded_event_found", 1}};
  auto sorted = Aggregator::sorted_reasons(d);
  ASSERT_EQ(sorted.size(), 4u);
  EXPECT_EQ(sorted[0].first, "chose_seed_true");
  EXPECT_EQ(sorted[1].first, "is_beta_true");
  EXPECT_EQ(sorted[2].first, "modded_card_found");
  EXPECT_EQ(sorted[3].first, "modded_event_found");
}

TEST(AggregatorTest, SummaryMentionsReasons) {
  DistributionSet d;
  d.meta.processed_logs = 4;
  d.meta.modded_reasons["modded_card_found"] = 2;
  std::ostringstream out;
  Aggregator::log_summary(d, out);
  auto text = out.str();
  EXPECT_NE(text.find("accepted logs: 4"), std::string::npos);
  EXPECT_NE(text.find("modded_card_found: 2"), std::string::npos);

  std::ostringstream clean;
  Aggregator::log_summary(DistributionSet{}, clean);
  EXPECT_NE(clean.str().find("no logs skipped"), std::string::npos);
}

// ============================================================================
// Pipeline over a directory
// ============================================================================

TEST(PipelineTest, MissingDirectoryIsFatal) {
  TempDir dir;
  EXPECT_THROW(pipeline::list_files(dir.file("absent")), std::runtime_error);
}

TEST(PipelineTest, ListFilesSortedAndFiltered) {
  TempDir dir;
  dir.write("b.json", "[]");
  dir.write("a.json", "[]");
  dir.write("notes.txt", "x");

  auto all = pipeline::list_files(dir.path());
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0], dir.file("a.json"));

  auto json_only = pipeline::list_files(dir.path(), {".json"});
  EXPECT_EQ(json_only, (std::vector<std::string>{dir.file("a.json"), dir.file("b.json")}));
}

TEST(PipelineTest, EndToEndIsWorkerCountIndependent) {
  TempDir dir;
  json modded = valid_record();
  modded["master_deck"] = json::array({"Mod Card"});

  dir.write("one.json", json::array({wrap(valid_record()), wrap(modded)}).dump());
  dir.write("two.json", wrap(valid_record()).dump());
  dir.write("three.json", "");
  dir.write("broken.json", "{ nope");

  classify::Classifier classifier(testing_support::make_tables());
  auto files = pipeline::list_files(dir.path());

  auto single = pipeline::run(files, classifier, sched::Scheduler(1));
  auto parallel = pipeline::run(files, classifier, sched::Scheduler(4));

  EXPECT_EQ(single, parallel);
  EXPECT_EQ(single.meta.processed_logs, 2);
  EXPECT_EQ(single.meta.modded_logs_skipped, 1);
  EXPECT_EQ(single.meta.modded_reasons.at("modded_card_found"), 1);
  EXPECT_EQ(single.meta.files_ok, 3);
  EXPECT_EQ(single.meta.files_failed, 1);
  EXPECT_EQ(single.master_deck.at("Strike_R"), 4);
  EXPECT_EQ(single.run_index.size(), 2u);
}
