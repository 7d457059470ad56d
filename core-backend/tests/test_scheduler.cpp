/**
 * @file test_scheduler.cpp
 * @brief Worker pool: one result per path, fault isolation, caller-thread sink.
 */

#include <gtest/gtest.h>
#include <sched/scheduler.hpp>

#include <atomic>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using aggregate::DistributionSet;
using ingest::FileError;
using ingest::FileErrorKind;
using ingest::FileResult;

namespace {

std::vector<std::string> make_paths(size_t n) {
  std::vector<std::string> paths;
  for (size_t i = 0; i < n; ++i)
    paths.push_back("file_" + std::to_string(i) + ".json");
  return paths;
}

// Tags each result with its path through flagged_files
FileResult tagged(const std::string &path) {
  DistributionSet d;
  d.flagged_files.insert(path);
  d.meta.processed_logs = 1;
  return d;
}

} // namespace

TEST(SchedulerTest, WorkerCountResolution) {
  EXPECT_EQ(sched::Scheduler(3).workers(), 3u);
  EXPECT_GE(sched::Scheduler(0).workers(), 1u);
  EXPECT_EQ(sched::Scheduler(1000).workers(), static_cast<size_t>(SCHED_MAX_WORKERS));
}

TEST(SchedulerTest, CappedWorkerCountIsLogged) {
  testing::internal::CaptureStdout();
  sched::Scheduler capped(1000);
  auto out = testing::internal::GetCapturedStdout();
  EXPECT_NE(out.find("[Sched] workers 1000 capped to " + std::to_string(SCHED_MAX_WORKERS)), std::string::npos);

  testing::internal::CaptureStdout();
  sched::Scheduler fits(2);
  EXPECT_EQ(testing::internal::GetCapturedStdout().find("capped"), std::string::npos);
}

TEST(SchedulerTest, EmptyInputRunsNothing) {
  sched::Scheduler s(4);
  size_t calls = 0;
  auto stats = s.run({}, [&](const std::string &p) { ++calls; return tagged(p); },
                     [&](FileResult &&) { ++calls; });
  EXPECT_EQ(calls, 0u);
  EXPECT_EQ(stats.submitted, 0u);
  EXPECT_EQ(stats.completed, 0u);
}

TEST(SchedulerTest, ExactlyOneResultPerPath) {
  auto paths = make_paths(200);
  sched::Scheduler s(8, 50);

  std::map<std::string, int> seen;
  auto stats = s.run(paths, tagged, [&](FileResult &&r) {
    ASSERT_FALSE(ingest::is_error(r));
    for (const auto &f : std::get<DistributionSet>(r).flagged_files)
      ++seen[f];
  });

  EXPECT_EQ(stats.submitted, 200u);
  EXPECT_EQ(stats.completed, 200u);
  EXPECT_EQ(stats.succeeded, 200u);
  EXPECT_EQ(stats.failed, 0u);
  EXPECT_EQ(stats.workers, 8u);
  ASSERT_EQ(seen.size(), 200u);
  for (const auto &[path, n] : seen)
    EXPECT_EQ(n, 1) << path;
}

TEST(SchedulerTest, ThrowingTaskBecomesFault) {
  auto paths = make_paths(20);
  sched::Scheduler s(4);

  size_t ok = 0;
  std::vector<FileError> errors;
  auto stats = s.run(
      paths,
      [](const std::string &p) -> FileResult {
        if (p == "file_7.json")
          throw std::runtime_error("boom");
        if (p == "file_11.json")
          throw 42;
        return tagged(p);
      },
      [&](FileResult &&r) {
        if (auto *e = std::get_if<FileError>(&r))
          errors.push_back(*e);
        else
          ++ok;
      });

  EXPECT_EQ(stats.completed, 20u);
  EXPECT_EQ(stats.failed, 2u);
  EXPECT_EQ(ok, 18u);
  ASSERT_EQ(errors.size(), 2u);
  for (const auto &e : errors) {
    EXPECT_EQ(e.kind, FileErrorKind::FAULT);
    EXPECT_TRUE(e.path == "file_7.json" || e.path == "file_11.json") << e.path;
  }
}

TEST(SchedulerTest, SinkRunsOnCallingThread) {
  auto paths = make_paths(50);
  sched::Scheduler s(4);
  auto caller = std::this_thread::get_id();

  std::atomic<size_t> off_thread{0};
  s.run(paths, tagged, [&](FileResult &&) {
    if (std::this_thread::get_id() != caller)
      ++off_thread;
  });
  EXPECT_EQ(off_thread.load(), 0u);
}

TEST(SchedulerTest, ErrorResultsCountAsFailed) {
  auto paths = make_paths(10);
  sched::Scheduler s(2);
  auto stats = s.run(
      paths,
      [](const std::string &p) -> FileResult {
        if (p == "file_3.json")
          return FileError{p, FileErrorKind::PARSE, "bad"};
        return tagged(p);
      },
      [](FileResult &&) {});
  EXPECT_EQ(stats.failed, 1u);
  EXPECT_EQ(stats.succeeded, 9u);
}
