#include "tradegate/engine/admission_engine.hpp"
#include "tradegate/config/config_error.hpp"
#include "tradegate/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tradegate {

namespace {

// A closed_fraction this close to 1 is a full close.
constexpr double kFullCloseEpsilon = 1e-9;

}  // namespace

// -----------------------------------------------------------------------------
// AccountRuntime: ledger first, then the gate and controller that use it
// -----------------------------------------------------------------------------
AdmissionEngine::AccountRuntime::AccountRuntime(const AccountConfig& config,
                                                const ITimeProvider& clock,
                                                const SessionGate& sessions,
                                                const NewsGuard& news,
                                                CommitmentIdGenerator& ids)
    : ledger(config.id, config.settings, config.limits, clock),
      gate(ledger),
      controller(sessions, news, gate, ids) {}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AdmissionEngine::AdmissionEngine(const EngineConfig& config,
                                 const ITimeProvider& clock)
    : clock_(clock),
      sessions_(config.sessions),
      news_(config.news_guard) {
  if (config.accounts.empty()) {
    throw ConfigError("engine: at least one account is required");
  }

  for (const AccountConfig& account : config.accounts) {
    auto runtime = std::make_unique<AccountRuntime>(account, clock_, sessions_,
                                                    news_, ids_);
    if (!accounts_.emplace(account.id, std::move(runtime)).second) {
      throw ConfigError("engine: duplicate account id '" + account.id + "'");
    }
  }

  if (!config.news_calendar.empty()) {
    news_.loadCalendar(config.news_calendar);
  }

  // Workers are wired now so that events pushed before start() are handled
  // once the threads run.
  const std::size_t worker_count =
      config.worker_threads == 0 ? 1 : config.worker_threads;
  for (std::size_t i = 0; i < worker_count; ++i) {
    auto worker =
        std::make_unique<EventLoopThread>("worker-" + std::to_string(i));
    worker->eventBus().subscribe(
        [this](const Event& event) { dispatch(event); });
    workers_.push_back(std::move(worker));
  }
}

AdmissionEngine::~AdmissionEngine() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void AdmissionEngine::start() {
  if (running_.exchange(true)) {
    return;
  }
  for (auto& worker : workers_) {
    worker->start();
  }
  std::cout << "[AdmissionEngine] started. Accounts: " << accounts_.size()
            << ", workers: " << workers_.size() << ".\n";
}

void AdmissionEngine::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  for (auto& worker : workers_) {
    worker->stop();
  }
  std::cout << "[AdmissionEngine] stopped. All workers joined.\n";
}

// -----------------------------------------------------------------------------
// Account lookup
// -----------------------------------------------------------------------------
AdmissionEngine::AccountRuntime* AdmissionEngine::findRuntime(
    const std::string& account_id) {
  auto it = accounts_.find(account_id);
  return it == accounts_.end() ? nullptr : it->second.get();
}

AdmissionEngine::AccountRuntime& AdmissionEngine::runtime(
    const std::string& account_id) {
  AccountRuntime* account = findRuntime(account_id);
  if (account == nullptr) {
    throw std::invalid_argument("unknown account '" + account_id + "'");
  }
  return *account;
}

std::vector<std::string> AdmissionEngine::accountIds() const {
  std::vector<std::string> ids;
  ids.reserve(accounts_.size());
  for (const auto& [id, account] : accounts_) {
    ids.push_back(id);
  }
  return ids;
}

// -----------------------------------------------------------------------------
// Synchronous API
// -----------------------------------------------------------------------------
domain::AdmissionDecision AdmissionEngine::evaluate(
    const CandidateSignal& signal) {
  AccountRuntime& account = runtime(signal.account_id);
  domain::RiskLedgerView after;
  domain::AdmissionDecision decision =
      account.controller.evaluate(signal, &after);

  publishDecision(decision);
  if (decision.approved()) {
    publishUpdate(after, "reserve");
  }
  return decision;
}

ReleaseResult AdmissionEngine::closeTrade(const TradeClose& close) {
  return applyClose(runtime(close.account_id), close);
}

bool AdmissionEngine::rollover(const std::string& account_id,
                               Timestamp boundary) {
  AccountRuntime& account = runtime(account_id);
  domain::RiskLedgerView after;
  const bool rolled = account.ledger.rollover(boundary, &after);
  if (rolled) {
    publishUpdate(after, "rollover");
  }
  return rolled;
}

domain::RiskLedgerView AdmissionEngine::snapshot(
    const std::string& account_id) {
  return runtime(account_id).ledger.snapshot();
}

std::vector<domain::RiskLedgerView> AdmissionEngine::snapshots() {
  std::vector<domain::RiskLedgerView> views;
  views.reserve(accounts_.size());
  for (auto& [id, account] : accounts_) {
    views.push_back(account->ledger.snapshot());
  }
  return views;
}

// -----------------------------------------------------------------------------
// applyClose(): full close, partial close or fraction fault
// -----------------------------------------------------------------------------
ReleaseResult AdmissionEngine::applyClose(AccountRuntime& account,
                                          const TradeClose& close) {
  const double fraction = close.closed_fraction;
  // An unset closed_at is stamped with the ledger clock.
  const Timestamp closed_at = close.closed_at == Timestamp{}
                                  ? ms_to_timestamp(clock_.now_ms())
                                  : close.closed_at;

  domain::RiskLedgerView after;
  ReleaseResult result = ReleaseResult::InvalidFraction;
  const char* cause = "close";
  if (fraction > 1.0 - kFullCloseEpsilon && fraction < 1.0 + kFullCloseEpsilon) {
    result = account.ledger.release(close.commitment_id, close.realized_pnl_r,
                                    close.realized_pnl_dollars, closed_at,
                                    &after);
  } else if (fraction > 0.0 && fraction < 1.0) {
    result = account.ledger.reduce(close.commitment_id, fraction,
                                   close.realized_pnl_r,
                                   close.realized_pnl_dollars, closed_at,
                                   &after);
    cause = "reduce";
  }

  if (result == ReleaseResult::Released) {
    publishUpdate(after, cause);
    return result;
  }

  std::ostringstream detail;
  detail << "close of commitment " << close.commitment_id << " (fraction "
         << fraction << ") refused: " << toString(result);
  publishFault(close.account_id, close.commitment_id, toString(result),
               detail.str(), close.closed_at);
  return result;
}

// -----------------------------------------------------------------------------
// Streamed API: round-robin across workers
// -----------------------------------------------------------------------------
void AdmissionEngine::pushSignal(CandidateSignal signal) {
  pushEvent(std::move(signal));
}

void AdmissionEngine::pushTradeClose(TradeClose close) {
  pushEvent(std::move(close));
}

void AdmissionEngine::pushEvent(Event event) {
  const std::size_t index =
      next_worker_.fetch_add(1, std::memory_order_relaxed) % workers_.size();
  workers_[index]->push(std::move(event));
}

void AdmissionEngine::drain() {
  for (auto& worker : workers_) {
    worker->drain();
  }
}

// -----------------------------------------------------------------------------
// dispatch(): input event → synchronous handler, faults instead of throws
// -----------------------------------------------------------------------------
void AdmissionEngine::dispatch(const Event& event) {
  if (const auto* signal = std::get_if<CandidateSignal>(&event)) {
    if (AccountRuntime* account = findRuntime(signal->account_id)) {
      domain::RiskLedgerView after;
      domain::AdmissionDecision decision =
          account->controller.evaluate(*signal, &after);
      publishDecision(decision);
      if (decision.approved()) {
        publishUpdate(after, "reserve");
      }
    } else {
      publishFault(signal->account_id, 0, "UnknownAccount",
                   "signal " + signal->signal_id + " for unknown account '" +
                       signal->account_id + "' skipped",
                   signal->timestamp);
    }
    return;
  }

  if (const auto* close = std::get_if<TradeClose>(&event)) {
    if (AccountRuntime* account = findRuntime(close->account_id)) {
      applyClose(*account, *close);
    } else {
      publishFault(close->account_id, close->commitment_id, "UnknownAccount",
                   "close for unknown account '" + close->account_id +
                       "' skipped",
                   close->closed_at);
    }
    return;
  }

  if (const auto* request = std::get_if<RolloverRequest>(&event)) {
    if (AccountRuntime* account = findRuntime(request->account_id)) {
      domain::RiskLedgerView after;
      if (account->ledger.rollover(request->boundary, &after)) {
        publishUpdate(after, "rollover");
      }
    } else {
      publishFault(request->account_id, 0, "UnknownAccount",
                   "rollover for unknown account '" + request->account_id +
                       "' skipped",
                   request->boundary);
    }
    return;
  }

  std::cerr << "[AdmissionEngine] Ignoring output event pushed as input.\n";
}

// -----------------------------------------------------------------------------
// Reload
// -----------------------------------------------------------------------------
void AdmissionEngine::reloadSessions(SessionConfig config) {
  const std::size_t symbols = config.size();
  sessions_.replaceConfig(std::move(config));
  std::cout << "[AdmissionEngine] Session config reloaded: " << symbols
            << " symbol(s).\n";
}

void AdmissionEngine::reloadLimits(const std::string& account_id,
                                   const domain::RiskLimits& limits) {
  AccountRuntime& account = runtime(account_id);
  domain::RiskLedgerView after;
  account.ledger.replaceLimits(limits, &after);
  std::cout << "[AdmissionEngine] Limits reloaded for " << account_id
            << ": max_concurrent_r=" << limits.max_concurrent_r
            << " max_daily_risk_r=" << limits.maxDailyRiskR()
            << " daily_stop_r=" << limits.daily_stop_r << ".\n";
  publishUpdate(after, "limits");
}

std::size_t AdmissionEngine::loadNewsCalendar(
    const std::vector<NewsEvent>& events) {
  const std::size_t kept = news_.loadCalendar(events);
  news_.pruneBefore(ms_to_timestamp(clock_.now_ms()));
  return kept;
}

bool AdmissionEngine::addNewsEvent(const NewsEvent& event) {
  const bool kept = news_.addEvent(event);
  news_.pruneBefore(ms_to_timestamp(clock_.now_ms()));
  return kept;
}

// -----------------------------------------------------------------------------
// Output publication
// -----------------------------------------------------------------------------
void AdmissionEngine::publishDecision(
    const domain::AdmissionDecision& decision) {
  AdmissionDecisionEvent event;
  event.decision = decision;
  event.sequence_id = ++sequence_;
  output_bus_.publish(event);
}

void AdmissionEngine::publishUpdate(const domain::RiskLedgerView& view,
                                    const char* cause) {
  LedgerUpdateEvent event;
  event.view = view;
  event.cause = cause;
  event.sequence_id = ++sequence_;
  output_bus_.publish(event);
}

void AdmissionEngine::publishFault(const std::string& account_id,
                                   CommitmentId id, const std::string& fault,
                                   const std::string& detail, Timestamp at) {
  std::cerr << "[AdmissionEngine] Ledger fault (" << account_id << "): "
            << detail << "\n";

  LedgerFaultEvent event;
  event.account_id = account_id;
  event.commitment_id = id;
  event.fault = fault;
  event.detail = detail;
  event.timestamp = at;
  event.sequence_id = ++sequence_;
  output_bus_.publish(event);
}

// -----------------------------------------------------------------------------
// executeCommand(): monitoring surface
// -----------------------------------------------------------------------------
std::string AdmissionEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  std::istringstream words(cmd);
  std::string verb;
  std::string argument;
  std::string extra;
  words >> verb >> argument >> extra;

  if (verb == "PING" && argument.empty()) {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS" && argument.empty()) {
    nlohmann::json accounts = nlohmann::json::array();
    for (const auto& view : snapshots()) {
      accounts.push_back(toJson(view));
    }
    response["status"] = "ok";
    response["accounts"] = std::move(accounts);
  } else if (verb == "STATUS" && extra.empty()) {
    if (AccountRuntime* account = findRuntime(argument)) {
      response["status"] = "ok";
      response["account"] = toJson(account->ledger.snapshot());
    } else {
      response["status"] = "error";
      response["response"] = "Unknown account: " + argument;
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// JSON shapes
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::RiskLedgerView& view) {
  nlohmann::json j;
  j["account_id"] = view.account_id;
  j["trading_day"] = view.trading_day;
  j["as_of_ms"] = timestamp_to_ms(view.as_of);
  j["daily_pnl_r"] = view.daily_pnl_r;
  j["daily_pnl_dollars"] = view.daily_pnl_dollars;
  j["trade_count"] = view.trade_count;
  j["active_trades_count"] = view.active_trades_count;
  j["active_risk_r"] = view.active_risk_r;
  j["max_risk_per_trade"] = view.max_risk_per_trade;
  j["max_daily_risk"] = view.max_daily_risk;
  j["max_daily_risk_r"] = view.max_daily_risk_r;
  j["daily_stop_r"] = view.daily_stop_r;
  j["max_concurrent_r"] = view.max_concurrent_r;
  j["drawdown_threshold_r"] = view.drawdown_threshold_r;
  j["daily_risk_used_r"] = view.daily_risk_used_r;
  j["drawdown_r"] = view.drawdown_r;
  j["risk_utilization"] = view.risk_utilization;
  j["risk_reduction_active"] = view.risk_reduction_active;
  j["can_trade"] = view.can_trade;
  return j;
}

nlohmann::json toJson(const domain::AdmissionDecision& decision) {
  nlohmann::json j;
  j["status"] = decision.approved() ? "Approved" : "Rejected";
  j["reason"] = domain::toString(decision.reason);
  j["message"] = decision.message;
  j["account_id"] = decision.account_id;
  j["signal_id"] = decision.signal_id;
  j["symbol"] = decision.symbol;
  j["timestamp_ms"] = timestamp_to_ms(decision.timestamp);
  j["proposed_risk_r"] = decision.proposed_risk_r;
  j["effective_risk_r"] = decision.effective_risk_r;
  j["risk_reduced"] = decision.risk_reduced;
  j["commitment_id"] = decision.commitment_id;
  return j;
}

nlohmann::json toJson(const LedgerFaultEvent& fault) {
  nlohmann::json j;
  j["account_id"] = fault.account_id;
  j["commitment_id"] = fault.commitment_id;
  j["fault"] = fault.fault;
  j["detail"] = fault.detail;
  j["timestamp_ms"] = timestamp_to_ms(fault.timestamp);
  return j;
}

}  // namespace tradegate
