#pragma once

// ============================================================================
// Scheduler: fixed worker pool, one file per task
//
// Workers only compute; every result is handed back through a completion
// queue and delivered to the sink on the calling thread, which also owns the
// progress bookkeeping.
// ============================================================================

// ============================================================================
// 调优参数
// ============================================================================
#define SCHED_MAX_WORKERS 64        // upper bound for the pool size
#define SCHED_PROGRESS_EVERY 500    // default progress log cadence (completions)

#include "../ingest/file_result.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace asio = boost::asio;

namespace sched {

struct RunStats {
  size_t submitted = 0;
  size_t completed = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  size_t workers = 0;
  double elapsed_ms = 0;
};

class Scheduler {
public:
  using Task = std::function<ingest::FileResult(const std::string &path)>;
  using Sink = std::function<void(ingest::FileResult &&result)>;

  // workers == 0 -> hardware concurrency
  explicit Scheduler(size_t workers = 0, size_t progress_every = SCHED_PROGRESS_EVERY)
      : workers_(resolve_workers(workers)), progress_every_(progress_every) {}

  size_t workers() const { return workers_; }

  // Runs task once per path and feeds every result to sink in completion order.
  // Exactly one result per path, even when a task throws.
  RunStats run(const std::vector<std::string> &paths, const Task &task, const Sink &sink) const {
    RunStats stats;
    stats.submitted = paths.size();
    if (paths.empty())
      return stats;

    auto t0 = clock::now();
    size_t nw = std::min(workers_, paths.size());
    stats.workers = nw;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<ingest::FileResult> done;

    // declared after the queue: destroyed (joined) first
    asio::thread_pool pool(nw);

    for (const auto &path : paths) {
      asio::post(pool, [&task, &path, &mutex, &cv, &done]() {
        ingest::FileResult r = run_guarded(task, path);
        {
          std::lock_guard<std::mutex> lock(mutex);
          done.push_back(std::move(r));
        }
        cv.notify_one();
      });
    }

    std::cout << "[Sched] submitted " << paths.size() << " files to " << nw << " workers" << std::endl;

    std::deque<ingest::FileResult> batch;
    while (stats.completed < stats.submitted) {
      {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&done]() { return !done.empty(); });
        batch.swap(done);
      }
      for (auto &r : batch) {
        ++stats.completed;
        if (ingest::is_error(r))
          ++stats.failed;
        else
          ++stats.succeeded;
        sink(std::move(r));

        if ((progress_every_ > 0 && stats.completed % progress_every_ == 0) ||
            stats.completed == stats.submitted) {
          std::cout << "[Sched] progress: " << stats.completed << "/" << stats.submitted
                    << " (" << stats.succeeded << " ok, " << stats.failed << " failed)" << std::endl;
        }
      }
      batch.clear();
    }

    pool.join();
    stats.elapsed_ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
    return stats;
  }

private:
  using clock = std::chrono::steady_clock;

  static size_t resolve_workers(size_t requested) {
    size_t n = requested;
    if (n == 0)
      n = std::max(1u, std::thread::hardware_concurrency());
    if (n > SCHED_MAX_WORKERS) {
      std::cout << "[Sched] workers " << n << " capped to " << SCHED_MAX_WORKERS << std::endl;
      n = SCHED_MAX_WORKERS;
    }
    return n;
  }

  // A throwing task becomes a FileError; nothing escapes into the pool
  static ingest::FileResult run_guarded(const Task &task, const std::string &path) {
    try {
      return task(path);
    } catch (const std::exception &e) {
      std::cerr << "[Sched] task fault: " << path << " - " << e.what() << std::endl;
      return ingest::FileError{path, ingest::FileErrorKind::FAULT, e.what()};
    } catch (...) {
      std::cerr << "[Sched] task fault: " << path << " - unknown exception" << std::endl;
      return ingest::FileError{path, ingest::FileErrorKind::FAULT, "unknown exception"};
    }
  }

  size_t workers_;
  size_t progress_every_;
};

} // namespace sched
