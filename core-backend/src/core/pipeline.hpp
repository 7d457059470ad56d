#pragma once

// ============================================================================
// 流水线: 文件列表 + 调度器 + 汇总器
// ============================================================================

#include "../aggregate/aggregator.hpp"
#include "../classify/classifier.hpp"
#include "../ingest/file_worker.hpp"
#include "../sched/scheduler.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace pipeline {

// dir 下的普通文件 (排序). 目录不存在直接报错
inline std::vector<std::string> list_files(const std::string &dir, const std::vector<std::string> &extensions = {}) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec))
    throw std::runtime_error("log directory not found or not a directory: " + dir);

  std::vector<std::string> files;
  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file(ec))
      continue;
    if (!extensions.empty()) {
      auto ext = entry.path().extension().string();
      if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end())
        continue;
    }
    files.push_back(entry.path().string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

inline aggregate::DistributionSet run(const std::vector<std::string> &paths,
                                      const classify::Classifier &classifier,
                                      const sched::Scheduler &scheduler) {
  ingest::Worker worker(classifier);
  aggregate::Aggregator agg;

  auto stats = scheduler.run(
      paths,
      [&worker](const std::string &path) { return worker.process(path); },
      [&agg](ingest::FileResult &&r) { agg.add(std::move(r)); });

  std::cout << "[Pipeline] " << stats.completed << " files in " << static_cast<int>(stats.elapsed_ms)
            << "ms (" << stats.succeeded << " ok, " << stats.failed << " failed, "
            << stats.workers << " workers)" << std::endl;
  return agg.take();
}

} // namespace pipeline
