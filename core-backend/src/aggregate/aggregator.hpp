#pragma once

// ============================================================================
// 汇总器: 把每个文件的结果合并为一个全局 DistributionSet
// ============================================================================

#include "../ingest/file_result.hpp"
#include "distribution.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace aggregate {

class Aggregator {
public:
  void add(const ingest::FileResult &r) {
    if (ingest::is_error(r)) {
      ++global_.meta.files_failed;
      return;
    }
    global_.merge(std::get<DistributionSet>(r));
    empty_ = false;
    ++global_.meta.files_ok;
  }

  void add(ingest::FileResult &&r) {
    if (ingest::is_error(r)) {
      ++global_.meta.files_failed;
      return;
    }
    auto &dist = std::get<DistributionSet>(r);
    if (empty_) {
      // 第一个结果直接接管, 不拷贝
      int64_t failed = global_.meta.files_failed;
      global_ = std::move(dist);
      global_.meta.files_failed += failed;
    } else {
      global_.merge(dist);
    }
    empty_ = false;
    ++global_.meta.files_ok;
  }

  const DistributionSet &result() const { return global_; }

  DistributionSet take() {
    empty_ = true;
    return std::exchange(global_, DistributionSet{});
  }

  static DistributionSet reduce(const std::vector<ingest::FileResult> &results) {
    Aggregator agg;
    for (const auto &r : results)
      agg.add(r);
    return agg.take();
  }

  // 合并两个已汇总的结果 (文件分组互不相交)
  static DistributionSet merge(const DistributionSet &a, const DistributionSet &b) {
    DistributionSet out = a;
    out.merge(b);
    return out;
  }

  // 按数量降序, 同数量按 reason 升序
  static std::vector<std::pair<std::string, int64_t>> sorted_reasons(const DistributionSet &d) {
    std::vector<std::pair<std::string, int64_t>> out(d.meta.modded_reasons.begin(), d.meta.modded_reasons.end());
    std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
      if (a.second != b.second)
        return a.second > b.second;
      return a.first < b.first;
    });
    return out;
  }

  static void log_summary(const DistributionSet &d, std::ostream &out = std::cout) {
    const auto &m = d.meta;
    out << "[Reduce] accepted logs: " << m.processed_logs << std::endl;
    out << "[Reduce] modded logs skipped: " << m.modded_logs_skipped << std::endl;
    out << "[Reduce] files ok: " << m.files_ok << ", failed: " << m.files_failed << std::endl;
    if (m.data_errors > 0)
      out << "[Reduce] data errors within logs: " << m.data_errors << std::endl;
    if (m.filter_errors > 0)
      out << "[Reduce] filter check errors: " << m.filter_errors << std::endl;
    if (m.extraction_errors > 0)
      out << "[Reduce] field extraction errors: " << m.extraction_errors << std::endl;
    for (const auto &[marker, n] : m.content_markers)
      out << "[Reduce] content marker '" << marker << "' in " << n << " files" << std::endl;

    if (m.modded_reasons.empty()) {
      out << "[Reduce] no logs skipped for mod flags" << std::endl;
      return;
    }
    out << "[Reduce] skip reasons:" << std::endl;
    for (const auto &[reason, n] : sorted_reasons(d))
      out << "[Reduce]   - " << reason << ": " << n << std::endl;
  }

private:
  DistributionSet global_;
  bool empty_ = true;
};

} // namespace aggregate
