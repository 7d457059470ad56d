#pragma once

// ============================================================================
// 快照存储: 把全局 DistributionSet 写入 DuckDB
//
// 每次保存一个事务, 覆盖上一次的快照
// ============================================================================

#define STORE_INSERT_BATCH 1000 // 每条 INSERT 的行数

#include "../aggregate/distribution.hpp"

#include <algorithm>
#include <duckdb.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace persist {

inline std::string escape_sql(const std::string &s) {
  std::string r = "'";
  r.reserve(s.size() + 2);
  for (char c : s) {
    if (c == '\'')
      r += "''";
    else
      r += c;
  }
  r += '\'';
  return r;
}

inline const char *DIST_FLAT_DDL = R"(
CREATE TABLE IF NOT EXISTS dist_flat (
    field VARCHAR NOT NULL,
    value VARCHAR NOT NULL,
    count BIGINT NOT NULL
))";

inline const char *DIST_NESTED_DDL = R"(
CREATE TABLE IF NOT EXISTS dist_nested (
    field VARCHAR NOT NULL,
    outer_key VARCHAR NOT NULL,
    inner_key VARCHAR NOT NULL,
    count BIGINT NOT NULL
))";

inline const char *DIST_SET_DDL = R"(
CREATE TABLE IF NOT EXISTS dist_set (
    field VARCHAR NOT NULL,
    value VARCHAR NOT NULL
))";

inline const char *RUN_INDEX_DDL = R"(
CREATE TABLE IF NOT EXISTS run_index (
    file VARCHAR NOT NULL,
    play_id VARCHAR,
    character_chosen VARCHAR,
    victory VARCHAR
))";

inline const char *SNAPSHOT_META_DDL = R"(
CREATE TABLE IF NOT EXISTS snapshot_meta (
    name VARCHAR NOT NULL,
    value BIGINT NOT NULL
))";

class SnapshotStore {
public:
  explicit SnapshotStore(const std::string &path) {
    db_ = std::make_unique<duckdb::DuckDB>(path);
    conn_ = std::make_unique<duckdb::Connection>(*db_);
    for (const char *ddl : {DIST_FLAT_DDL, DIST_NESTED_DDL, DIST_SET_DDL, RUN_INDEX_DDL, SNAPSHOT_META_DDL})
      execute(ddl);
  }

  void save(const aggregate::DistributionSet &d) {
    std::lock_guard<std::mutex> lock(mutex_);

    query("BEGIN TRANSACTION");
    try {
      for (const char *table : {"dist_flat", "dist_nested", "dist_set", "run_index", "snapshot_meta"})
        query(std::string("DELETE FROM ") + table);

      std::vector<std::string> rows;

      for (const auto &f : aggregate::FLAT_FIELDS) {
        for (const auto &[value, n] : d.*f.table)
          rows.push_back(escape_sql(f.name) + ", " + escape_sql(value) + ", " + std::to_string(n));
      }
      insert_rows("dist_flat", "field, value, count", rows);

      for (const auto &f : aggregate::NESTED_FIELDS) {
        for (const auto &[outer, inner] : d.*f.table) {
          for (const auto &[value, n] : inner) {
            rows.push_back(escape_sql(f.name) + ", " + escape_sql(outer) + ", " +
                           escape_sql(value) + ", " + std::to_string(n));
          }
        }
      }
      insert_rows("dist_nested", "field, outer_key, inner_key, count", rows);

      for (const auto &f : aggregate::SET_FIELDS) {
        for (const auto &value : d.*f.set)
          rows.push_back(escape_sql(f.name) + ", " + escape_sql(value));
      }
      insert_rows("dist_set", "field, value", rows);

      for (const auto &r : d.run_index) {
        rows.push_back(escape_sql(r.file) + ", " + escape_sql(r.play_id) + ", " +
                       escape_sql(r.character_chosen) + ", " + escape_sql(r.victory));
      }
      insert_rows("run_index", "file, play_id, character_chosen, victory", rows);

      for (const auto &[key, value] : meta_rows(d.meta))
        rows.push_back(escape_sql(key) + ", " + std::to_string(value));
      insert_rows("snapshot_meta", "name, value", rows);

      query("COMMIT");
    } catch (const std::exception &) {
      auto rb = conn_->Query("ROLLBACK");
      if (rb->HasError())
        std::cerr << "[Store] rollback failed: " << rb->GetError() << std::endl;
      throw;
    }
  }

  int64_t table_count(const std::string &table) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = query("SELECT COUNT(*) FROM " + table);
    if (result->RowCount() == 0)
      return 0;
    return result->GetValue(0, 0).GetValue<int64_t>();
  }

  static std::vector<std::pair<std::string, int64_t>> meta_rows(const aggregate::Counters &m) {
    std::vector<std::pair<std::string, int64_t>> rows = {
        {"processed_logs", m.processed_logs},
        {"modded_logs_skipped", m.modded_logs_skipped},
        {"data_errors", m.data_errors},
        {"filter_errors", m.filter_errors},
        {"extraction_errors", m.extraction_errors},
        {"files_ok", m.files_ok},
        {"files_failed", m.files_failed},
    };
    for (const auto &[reason, n] : m.modded_reasons)
      rows.emplace_back("reason:" + reason, n);
    for (const auto &[marker, n] : m.content_markers)
      rows.emplace_back("marker:" + marker, n);
    return rows;
  }

private:
  void execute(const std::string &sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    query(sql);
  }

  std::unique_ptr<duckdb::MaterializedQueryResult> query(const std::string &sql) {
    auto result = conn_->Query(sql);
    if (result->HasError())
      throw std::runtime_error("[Store] query failed: " + result->GetError());
    return result;
  }

  // 批量多行 INSERT, 完成后清空 rows
  void insert_rows(const char *table, const char *columns, std::vector<std::string> &rows) {
    for (size_t begin = 0; begin < rows.size(); begin += STORE_INSERT_BATCH) {
      size_t end = std::min(rows.size(), begin + STORE_INSERT_BATCH);
      std::string sql = std::string("INSERT INTO ") + table + " (" + columns + ") VALUES ";
      for (size_t i = begin; i < end; ++i) {
        if (i > begin)
          sql += ", ";
        sql += "(" + rows[i] + ")";
      }
      query(sql);
    }
    rows.clear();
  }

  std::unique_ptr<duckdb::DuckDB> db_;
  std::unique_ptr<duckdb::Connection> conn_;
  std::mutex mutex_;
};

} // namespace persist
