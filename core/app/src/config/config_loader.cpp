#include "tradegate/config/config_loader.hpp"
#include "tradegate/config/config_error.hpp"
#include "tradegate/time/time_utils.hpp"
#include "tradegate/time/time_window.hpp"
#include "tradegate/time/time_zone.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <type_traits>
#include <utility>

namespace tradegate {

namespace {

using nlohmann::json;

std::string child(const std::string& path, const std::string& key) {
  return path + "." + key;
}

std::string element(const std::string& path, std::size_t index) {
  return path + "[" + std::to_string(index) + "]";
}

void requireObject(const json& value, const std::string& path) {
  if (!value.is_object()) {
    throw ConfigError(path + ": expected an object");
  }
}

void requireArray(const json& value, const std::string& path) {
  if (!value.is_array()) {
    throw ConfigError(path + ": expected an array");
  }
}

// Reads obj[key] as T; missing keys and type mismatches become ConfigError.
// Integral T accepts only JSON integers: 2.7 is rejected, not truncated.
template <typename T>
T requiredField(const json& obj, const std::string& key, const std::string& path) {
  requireObject(obj, path);
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw ConfigError(child(path, key) + ": required field is missing");
  }
  if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    if (!it->is_number_integer()) {
      throw ConfigError(child(path, key) + ": must be an integer");
    }
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(child(path, key) + ": " + e.what());
  }
}

template <typename T>
T optionalField(const json& obj, const std::string& key, const std::string& path,
           T fallback) {
  requireObject(obj, path);
  if (obj.find(key) == obj.end()) {
    return fallback;
  }
  return requiredField<T>(obj, key, path);
}

// Reruns `parse` and prefixes any ConfigError it raises with `path`.
template <typename Fn>
auto atPath(const std::string& path, Fn&& parse) -> decltype(parse()) {
  try {
    return parse();
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

domain::TimeWindow parseWindow(const json& value, const std::string& path) {
  const auto name = requiredField<std::string>(value, "name", path);
  const auto zone = requiredField<std::string>(value, "timezone", path);
  const auto start_text = requiredField<std::string>(value, "start", path);
  const auto end_text = requiredField<std::string>(value, "end", path);

  const auto start = atPath(child(path, "start"),
                            [&] { return parseTimeOfDay(start_text); });
  const auto end =
      atPath(child(path, "end"), [&] { return parseTimeOfDay(end_text); });
  return atPath(path, [&] { return makeTimeWindow(name, zone, start, end); });
}

AccountConfig parseAccount(const json& value, const std::string& path) {
  requireObject(value, path);

  auto id = requiredField<std::string>(value, "id", path);
  if (id.empty()) {
    throw ConfigError(child(path, "id") + ": must not be empty");
  }

  const auto zone_name = optionalField<std::string>(value, "reference_timezone",
                                               path, std::string("UTC"));
  const absl::TimeZone zone = atPath(child(path, "reference_timezone"),
                                     [&] { return loadTimeZone(zone_name); });

  const auto rollover_text =
      optionalField<std::string>(value, "rollover_time", path, std::string("00:00"));
  const auto rollover = atPath(child(path, "rollover_time"),
                               [&] { return parseTimeOfDay(rollover_text); });
  if (rollover >= std::chrono::hours{24}) {
    throw ConfigError(child(path, "rollover_time") + ": must be before 24:00");
  }

  if (value.find("drawdown_lookback") == value.end()) {
    throw ConfigError(child(path, "drawdown_lookback") +
                      ": required field is missing (use {\"days\": N} or "
                      "{\"trades\": N})");
  }
  const auto lookback = parseDrawdownLookback(
      value.at("drawdown_lookback"), child(path, "drawdown_lookback"));

  if (value.find("limits") == value.end()) {
    throw ConfigError(child(path, "limits") + ": required field is missing");
  }
  const auto limits = parseLimits(value.at("limits"), child(path, "limits"));

  return AccountConfig{std::move(id),
                       domain::LedgerSettings(zone, rollover, lookback),
                       limits};
}

}  // namespace

// -----------------------------------------------------------------------------
// parseLimits: all five fields required, then the cross-field invariants
// -----------------------------------------------------------------------------
domain::RiskLimits parseLimits(const json& limits, const std::string& path) {
  domain::RiskLimits out;
  out.max_risk_per_trade_pct =
      requiredField<double>(limits, "max_risk_per_trade_pct", path);
  out.max_daily_risk_pct = requiredField<double>(limits, "max_daily_risk_pct", path);
  out.daily_stop_r = requiredField<double>(limits, "daily_stop_r", path);
  out.max_concurrent_r = requiredField<double>(limits, "max_concurrent_r", path);
  out.drawdown_threshold_r =
      requiredField<double>(limits, "drawdown_threshold_r", path);
  atPath(path, [&] { domain::validate(out); });
  return out;
}

domain::DrawdownLookback parseDrawdownLookback(const json& lookback,
                                               const std::string& path) {
  requireObject(lookback, path);
  const bool has_days = lookback.find("days") != lookback.end();
  const bool has_trades = lookback.find("trades") != lookback.end();
  if (has_days == has_trades) {
    throw ConfigError(path + ": exactly one of 'days' or 'trades' is required");
  }
  if (has_days) {
    const int days = requiredField<int>(lookback, "days", path);
    return atPath(path, [&] { return domain::DrawdownLookback::days(days); });
  }
  const int trades = requiredField<int>(lookback, "trades", path);
  return atPath(path,
                [&] { return domain::DrawdownLookback::trades(trades); });
}

SessionConfig parseSessions(const json& symbols, const std::string& path) {
  requireObject(symbols, path);

  SessionConfig sessions;
  for (auto it = symbols.begin(); it != symbols.end(); ++it) {
    const std::string symbol_path = child(path, it.key());
    requireObject(it.value(), symbol_path);

    std::vector<domain::TimeWindow> windows;
    auto list = it.value().find("session_windows");
    if (list != it.value().end()) {
      const std::string list_path = child(symbol_path, "session_windows");
      requireArray(*list, list_path);
      for (std::size_t i = 0; i < list->size(); ++i) {
        windows.push_back(parseWindow((*list)[i], element(list_path, i)));
      }
    }
    sessions.emplace(it.key(), std::move(windows));
  }
  return sessions;
}

NewsGuardConfig parseNewsGuard(const json& guard, const std::string& path) {
  NewsGuardConfig config;
  config.enabled = optionalField<bool>(guard, "enabled", path, true);

  const int before = optionalField<int>(guard, "block_minutes_before", path, 15);
  const int after = optionalField<int>(guard, "block_minutes_after", path, 15);
  if (before < 0) {
    throw ConfigError(child(path, "block_minutes_before") + ": must be >= 0");
  }
  if (after < 0) {
    throw ConfigError(child(path, "block_minutes_after") + ": must be >= 0");
  }
  config.block_before = std::chrono::minutes{before};
  config.block_after = std::chrono::minutes{after};

  config.watched_events = optionalField<std::vector<std::string>>(
      guard, "events", path, std::vector<std::string>{});
  return config;
}

NewsEvent parseNewsEvent(const json& event, const std::string& path) {
  NewsEvent out;
  out.name = requiredField<std::string>(event, "name", path);
  out.currency = requiredField<std::string>(event, "currency", path);
  out.impact = optionalField<std::string>(event, "impact", path, std::string("high"));
  out.time = ms_to_timestamp(requiredField<std::int64_t>(event, "time_ms", path));
  return out;
}

// -----------------------------------------------------------------------------
// parseConfig(root)
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& root) {
  requireObject(root, "$");

  EngineConfig config;

  auto accounts = root.find("accounts");
  if (accounts == root.end()) {
    throw ConfigError("accounts: required field is missing");
  }
  requireArray(*accounts, "accounts");
  if (accounts->empty()) {
    throw ConfigError("accounts: at least one account is required");
  }

  std::set<std::string> seen;
  for (std::size_t i = 0; i < accounts->size(); ++i) {
    const std::string path = element("accounts", i);
    AccountConfig account = parseAccount((*accounts)[i], path);
    if (!seen.insert(account.id).second) {
      throw ConfigError(child(path, "id") + ": duplicate account id '" +
                        account.id + "'");
    }
    config.accounts.push_back(std::move(account));
  }

  auto symbols = root.find("symbols");
  if (symbols != root.end()) {
    config.sessions = parseSessions(*symbols, "symbols");
  }

  auto guard = root.find("news_guard");
  if (guard != root.end()) {
    config.news_guard = parseNewsGuard(*guard, "news_guard");
    auto calendar = guard->find("calendar");
    if (calendar != guard->end()) {
      requireArray(*calendar, "news_guard.calendar");
      for (std::size_t i = 0; i < calendar->size(); ++i) {
        config.news_calendar.push_back(parseNewsEvent(
            (*calendar)[i], element("news_guard.calendar", i)));
      }
    }
  }

  auto engine = root.find("engine");
  if (engine != root.end()) {
    const int workers = optionalField<int>(*engine, "worker_threads", "engine", 2);
    if (workers < 1) {
      throw ConfigError("engine.worker_threads: must be >= 1");
    }
    config.worker_threads = static_cast<std::size_t>(workers);
  }

  return config;
}

EngineConfig parseConfig(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::exception& e) {
    throw ConfigError(std::string("malformed JSON: ") + e.what());
  }
  return parseConfig(root);
}

EngineConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  EngineConfig config = atPath(path, [&] { return parseConfig(buffer.str()); });
  std::cout << "[ConfigLoader] Loaded " << path << ": "
            << config.accounts.size() << " account(s), "
            << config.sessions.size() << " symbol(s), news guard "
            << (config.news_guard.enabled ? "on" : "off") << ".\n";
  return config;
}

}  // namespace tradegate
