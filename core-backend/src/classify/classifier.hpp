#pragma once

// ============================================================================
// Run validity classifier
//
// classify(record) walks an ordered predicate list and returns the reason of
// the first predicate that fails. Pure: no I/O, no mutable state.
// ============================================================================

#include "../core/reference_tables.hpp"

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace classify {

// ============================================================================
// Reason codes
// ============================================================================
namespace reason {
inline constexpr const char *INVALID_INPUT_TYPE = "invalid_input_type";
inline constexpr const char *DAILY_MODS = "daily_mods_or_neow_cos3_present";
inline constexpr const char *CHOSE_SEED = "chose_seed_true";
inline constexpr const char *CIRCLET_COUNT = "nonzero_circlet_count";
inline constexpr const char *IS_BETA = "is_beta_true";
inline constexpr const char *SPECIAL_SEED = "special_seed_used";
inline constexpr const char *CHARACTER = "modded_character";
inline constexpr const char *NEOW_COST = "modded_neow_cost";
inline constexpr const char *NEOW_BONUS = "modded_neow_bonus";
inline constexpr const char *EVENT = "modded_event_found";
inline constexpr const char *EVENT_CHOICE_PREFIX = "modded_event_choice:";
inline constexpr const char *CARD = "modded_card_found";
inline constexpr const char *ENEMY = "modded_enemy_found";
inline constexpr const char *FLOOR = "invalid_floor_value";
inline constexpr const char *CHECK_ERROR = "filter_check_error";

inline std::string event_choice(const std::string &event_name, const std::string &choice) {
  return std::string(EVENT_CHOICE_PREFIX) + event_name + ":" + choice;
}
} // namespace reason

// A predicate could not be evaluated (e.g. circlet_count is a string)
class CheckError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// What an absent key means for the flag predicates
enum class MissingKeyPolicy {
  LENIENT, // absent = safe value
  STRICT,  // absent = value that already fails the predicate
};

inline MissingKeyPolicy parse_policy(const std::string &s) {
  if (s == "lenient")
    return MissingKeyPolicy::LENIENT;
  if (s == "strict")
    return MissingKeyPolicy::STRICT;
  throw std::invalid_argument("unknown missing_key_policy: " + s);
}

inline const char *policy_name(MissingKeyPolicy p) {
  return p == MissingKeyPolicy::STRICT ? "strict" : "lenient";
}

struct Verdict {
  bool accepted = true;
  std::string reason; // empty when accepted

  static Verdict accept() { return {}; }
  static Verdict reject(std::string r) { return {false, std::move(r)}; }

  bool operator==(const Verdict &o) const { return accepted == o.accepted && reason == o.reason; }
};

// ============================================================================
// JSON value helpers
// ============================================================================

// Truthiness of a JSON value: null, false, zero and empty are false
inline bool truthy(const json &v) {
  switch (v.type()) {
  case json::value_t::null:
    return false;
  case json::value_t::boolean:
    return v.get<bool>();
  case json::value_t::number_integer:
    return v.get<int64_t>() != 0;
  case json::value_t::number_unsigned:
    return v.get<uint64_t>() != 0;
  case json::value_t::number_float:
    return v.get<double>() != 0.0;
  case json::value_t::string:
    return !v.get_ref<const std::string &>().empty();
  case json::value_t::array:
  case json::value_t::object:
    return !v.empty();
  default:
    return true;
  }
}

// v > 0, defined for numbers and booleans only
inline bool greater_than_zero(const json &v, const char *field) {
  switch (v.type()) {
  case json::value_t::boolean:
    return v.get<bool>();
  case json::value_t::number_integer:
    return v.get<int64_t>() > 0;
  case json::value_t::number_unsigned:
    return v.get<uint64_t>() > 0;
  case json::value_t::number_float:
    return v.get<double>() > 0.0;
  default:
    throw CheckError(std::string(field) + ": cannot compare " + v.type_name() + " with 0");
  }
}

// int() conversion used by the floor check; nullopt when not convertible
inline std::optional<int64_t> to_integer(const json &v) {
  switch (v.type()) {
  case json::value_t::boolean:
    return v.get<bool>() ? 1 : 0;
  case json::value_t::number_integer:
    return v.get<int64_t>();
  case json::value_t::number_unsigned: {
    auto u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(INT64_MAX))
      return INT64_MAX;
    return static_cast<int64_t>(u);
  }
  case json::value_t::number_float: {
    double d = v.get<double>();
    if (!std::isfinite(d))
      return std::nullopt;
    if (d >= 9.2e18 || d <= -9.2e18)
      return d > 0 ? INT64_MAX : INT64_MIN;
    return static_cast<int64_t>(std::trunc(d));
  }
  case json::value_t::string: {
    const auto &s = v.get_ref<const std::string &>();
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
      return std::nullopt;
    size_t e = s.find_last_not_of(" \t\r\n");
    std::string body = s.substr(b, e - b + 1);
    size_t digits = (body[0] == '+' || body[0] == '-') ? 1 : 0;
    if (digits == body.size())
      return std::nullopt;
    for (size_t i = digits; i < body.size(); ++i) {
      if (body[i] < '0' || body[i] > '9')
        return std::nullopt;
    }
    errno = 0;
    long long parsed = std::strtoll(body.c_str(), nullptr, 10);
    if (errno == ERANGE)
      return body[0] == '-' ? INT64_MIN : INT64_MAX;
    return static_cast<int64_t>(parsed);
  }
  default:
    return std::nullopt;
  }
}

// ============================================================================
// Classifier
// ============================================================================
class Classifier {
public:
  // nullopt = pass, otherwise the reject reason
  using Check = std::function<std::optional<std::string>(const json &record)>;

  struct Predicate {
    std::string name;
    Check check;
  };

  static constexpr int64_t MIN_FLOOR = 0;
  static constexpr int64_t MAX_FLOOR = 999;

  explicit Classifier(tables::TablesPtr tables, MissingKeyPolicy policy = MissingKeyPolicy::LENIENT)
      : tables_(std::move(tables)), policy_(policy) {
    if (!tables_)
      throw std::invalid_argument("Classifier requires reference tables");
    build_predicates();
  }

  // predicates capture this
  Classifier(const Classifier &) = delete;
  Classifier &operator=(const Classifier &) = delete;

  // May throw CheckError when a field cannot be compared
  Verdict classify(const json &record) const {
    if (!record.is_object())
      return Verdict::reject(reason::INVALID_INPUT_TYPE);

    for (const auto &p : predicates_) {
      if (auto r = p.check(record))
        return Verdict::reject(std::move(*r));
    }
    return Verdict::accept();
  }

  const std::vector<Predicate> &predicates() const { return predicates_; }
  const tables::ReferenceTables &tables() const { return *tables_; }
  MissingKeyPolicy policy() const { return policy_; }

private:
  // record[key], or the policy default when absent (nullopt = treat as absent)
  std::optional<json> field(const json &record, const char *key,
                            const std::optional<json> &lenient,
                            const std::optional<json> &strict) const {
    auto it = record.find(key);
    if (it != record.end())
      return *it;
    return policy_ == MissingKeyPolicy::STRICT ? strict : lenient;
  }

  void add(const char *name, Check check) { predicates_.push_back({name, std::move(check)}); }

  void build_predicates() {
    const auto &t = *tables_;

    add("daily_mode", [](const json &r) -> std::optional<std::string> {
      if (r.contains("daily_mods") || r.contains("neow_cos3"))
        return reason::DAILY_MODS;
      return std::nullopt;
    });

    add("chose_seed", [this](const json &r) -> std::optional<std::string> {
      auto v = field(r, "chose_seed", json(false), json(true));
      if (v && truthy(*v))
        return reason::CHOSE_SEED;
      return std::nullopt;
    });

    add("circlet_count", [this](const json &r) -> std::optional<std::string> {
      auto v = field(r, "circlet_count", json(0), json(1));
      if (v && greater_than_zero(*v, "circlet_count"))
        return reason::CIRCLET_COUNT;
      return std::nullopt;
    });

    add("is_beta", [this](const json &r) -> std::optional<std::string> {
      auto v = field(r, "is_beta", json(false), json(true));
      if (v && truthy(*v))
        return reason::IS_BETA;
      return std::nullopt;
    });

    add("special_seed", [this](const json &r) -> std::optional<std::string> {
      auto v = field(r, "special_seed", json(0), json(1));
      if (v && greater_than_zero(*v, "special_seed"))
        return reason::SPECIAL_SEED;
      return std::nullopt;
    });

    add("character", [&t](const json &r) -> std::optional<std::string> {
      auto it = r.find("character_chosen");
      if (it != r.end() && it->is_string() && t.disallowed_characters.count(it->get<std::string>()))
        return reason::CHARACTER;
      return std::nullopt;
    });

    add("neow_cost", [this, &t](const json &r) -> std::optional<std::string> {
      auto v = field(r, "neow_cost", std::nullopt, json(""));
      if (!v || v->is_null())
        return std::nullopt;
      // "", [] and {} are invalid regardless of the table
      if (v->empty() || (v->is_string() && v->get_ref<const std::string &>().empty()))
        return reason::NEOW_COST;
      if (v->is_string() && t.invalid_neow_costs.count(v->get<std::string>()))
        return reason::NEOW_COST;
      return std::nullopt;
    });

    add("neow_bonus", [&t](const json &r) -> std::optional<std::string> {
      auto it = r.find("neow_bonus");
      if (it == r.end() || !truthy(*it))
        return std::nullopt;
      if (!it->is_string() || !t.neow_bonuses.count(it->get<std::string>()))
        return reason::NEOW_BONUS;
      return std::nullopt;
    });

    add("events", [&t](const json &r) { return check_events(r, t); });

    add("cards", [&t](const json &r) -> std::optional<std::string> {
      auto it = r.find("master_deck");
      if (it == r.end())
        return std::nullopt;
      if (!it->is_array())
        return reason::CARD;
      for (const auto &card : *it) {
        if (!card.is_string() || !t.is_valid_card(card.get_ref<const std::string &>()))
          return reason::CARD;
      }
      return std::nullopt;
    });

    add("enemies", [&t](const json &r) -> std::optional<std::string> {
      auto it = r.find("damage_taken");
      if (it == r.end() || !it->is_array())
        return std::nullopt; // non-list is not evidence of a mod
      for (const auto &battle : *it) {
        if (!battle.is_object())
          return reason::ENEMY;
        auto e = battle.find("enemies");
        if (e == battle.end() || e->is_null())
          continue;
        if (!e->is_string())
          return reason::ENEMY;
        const auto &enemy = e->get_ref<const std::string &>();
        if (enemy.find(':') != std::string::npos || t.modded_enemies.count(enemy))
          return reason::ENEMY;
      }
      return std::nullopt;
    });

    add("floor_range", [this](const json &r) -> std::optional<std::string> {
      auto v = field(r, "floor_reached", std::nullopt, json(0));
      if (!v || v->is_null())
        return std::nullopt;
      auto floor = to_integer(*v);
      if (!floor || *floor < MIN_FLOOR || *floor > MAX_FLOOR)
        return reason::FLOOR;
      return std::nullopt;
    });
  }

  static std::optional<std::string> check_events(const json &r, const tables::ReferenceTables &t) {
    auto it = r.find("event_choices");
    if (it == r.end())
      return std::nullopt;
    if (!it->is_array())
      return reason::EVENT;

    for (const auto &entry : *it) {
      if (!entry.is_object() || !entry.contains("event_name"))
        return reason::EVENT;

      const auto &name = entry.at("event_name");
      if (!name.is_string() || !t.is_valid_event(name.get_ref<const std::string &>()))
        return reason::EVENT;

      auto choice = entry.find("player_choice");
      if (choice != entry.end() && choice->is_string()) {
        const auto &event_name = name.get_ref<const std::string &>();
        const auto &player_choice = choice->get_ref<const std::string &>();
        if (t.is_blocked_choice(event_name, player_choice))
          return reason::event_choice(event_name, player_choice);
      }
    }
    return std::nullopt;
  }

  tables::TablesPtr tables_;
  MissingKeyPolicy policy_;
  std::vector<Predicate> predicates_;
};

} // namespace classify
