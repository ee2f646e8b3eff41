#pragma once

#include "tradegate/admission/admission_controller.hpp"
#include "tradegate/concurrent/commitment_id_generator.hpp"
#include "tradegate/concurrent/event_loop_thread.hpp"
#include "tradegate/config/config_loader.hpp"
#include "tradegate/domain/decision.hpp"
#include "tradegate/domain/risk_ledger_view.hpp"
#include "tradegate/eventbus/event_bus.hpp"
#include "tradegate/events/event.hpp"
#include "tradegate/risk/risk_gate.hpp"
#include "tradegate/risk/risk_ledger.hpp"
#include "tradegate/session/news_guard.hpp"
#include "tradegate/session/session_gate.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// AdmissionEngine
// -----------------------------------------------------------------------------
//
// @brief  Process-level owner of every account's ledger, the shared session
//         and news state, the worker loops, and the output bus.
//
// @details
// Two ways in:
//
//   Synchronous   evaluate(), closeTrade(), rollover(), snapshot(): run on
//                 the caller's thread and return the result. An unknown
//                 account is a caller bug and throws std::invalid_argument.
//
//   Streamed      pushSignal(), pushTradeClose(), pushEvent(): enqueue onto
//                 one of N EventLoopThreads, round-robin. Several signals
//                 for one account can therefore be evaluated at the same
//                 time and contend for its ledger; the ledger's fused
//                 check-and-reserve keeps the budget exact. An unknown
//                 account is logged and reported as a LedgerFaultEvent.
//
// Either way every outcome is published on outputBus():
//   AdmissionDecisionEvent   each evaluated signal
//   LedgerUpdateEvent        view after each reserve/close/reduce/rollover/
//                            limits reload
//   LedgerFaultEvent         refused bookkeeping (also logged to stderr)
//
// Output callbacks run on the thread that produced the outcome (a worker or
// the synchronous caller) and must be thread-safe.
//
// Thread layout:
//   worker-0 .. worker-(N-1)   EventLoopThread, input dispatch
//   caller threads             synchronous API, executeCommand(), reloads
//
// Ownership:
//   AdmissionEngine
//    ├── ids_          (CommitmentIdGenerator, shared by all accounts)
//    ├── sessions_     (SessionGate, copy-and-swap reload)
//    ├── news_         (NewsGuard, copy-and-swap calendar)
//    ├── output_bus_   (EventBus)
//    ├── accounts_     (account id → AccountRuntime, fixed after construction)
//    │     └── ledger → gate → controller
//    └── workers_      (EventLoopThreads, declared last, stopped first)
//
// The account map is built once in the constructor and never modified, so
// lookups need no lock. Everything mutable inside a runtime has its own
// synchronization.
// -----------------------------------------------------------------------------
class AdmissionEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config  Validated configuration (see ConfigLoader).
  // @param  clock   Source of "now" for every ledger. Must outlive the
  //                 engine.
  //
  // @throws ConfigError if the config has no accounts, duplicate ids or
  //         invalid limits.
  //
  // No threads are spawned; call start() before using the streamed API.
  // The synchronous API works without start().
  // -------------------------------------------------------------------------
  AdmissionEngine(const EngineConfig& config, const ITimeProvider& clock);

  ~AdmissionEngine();

  AdmissionEngine(const AdmissionEngine&) = delete;
  AdmissionEngine& operator=(const AdmissionEngine&) = delete;
  AdmissionEngine(AdmissionEngine&&) = delete;
  AdmissionEngine& operator=(AdmissionEngine&&) = delete;

  // Idempotent. start() spawns the workers; stop() joins them.
  void start();
  void stop();
  bool running() const { return running_.load(); }

  // --- Synchronous API ------------------------------------------------------
  domain::AdmissionDecision evaluate(const CandidateSignal& signal);

  // -------------------------------------------------------------------------
  // closeTrade(close)
  // -------------------------------------------------------------------------
  // closed_fraction == 1      full close: RiskLedger::release()
  // 0 < closed_fraction < 1   partial close: RiskLedger::reduce(); the pnl
  //                           fields hold what the closed portion realized
  //                           and are booked immediately.
  // otherwise                 InvalidFraction
  // Non-finite pnl in either form is InvalidPnl.
  //
  // Any result other than Released is also logged and published as a
  // LedgerFaultEvent.
  // -------------------------------------------------------------------------
  ReleaseResult closeTrade(const TradeClose& close);

  // Returns false if the account-day of `boundary` was already started.
  bool rollover(const std::string& account_id, Timestamp boundary);

  domain::RiskLedgerView snapshot(const std::string& account_id);
  std::vector<domain::RiskLedgerView> snapshots();

  // --- Streamed API ---------------------------------------------------------
  void pushSignal(CandidateSignal signal);
  void pushTradeClose(TradeClose close);
  void pushEvent(Event event);

  // Blocks until every event pushed before the call has been handled.
  void drain();

  // Handles one input event on the calling thread with streamed semantics
  // (unknown accounts are faults, not exceptions). Output events are
  // ignored with a warning. The workers and the replay CLI both use it.
  void dispatch(const Event& event);

  // --- Reload ---------------------------------------------------------------
  void reloadSessions(SessionConfig config);

  // @throws std::invalid_argument for an unknown account, ConfigError for
  //         invalid limits (the old limits stay in force).
  void reloadLimits(const std::string& account_id,
                    const domain::RiskLimits& limits);

  // Both also drop calendar events whose blackout ended before clock now.
  std::size_t loadNewsCalendar(const std::vector<NewsEvent>& events);
  bool addNewsEvent(const NewsEvent& event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //   "PING"              → {"status":"ok","response":"PONG"}
  //   "STATUS"            → {"status":"ok","accounts":[<view>, ...]}
  //   "STATUS <account>"  → {"status":"ok","account":<view>}
  //   other               → {"status":"error","response":"..."}
  //
  // Thread-safety: Safe from any thread; views are ledger snapshots.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // --- Accessors ------------------------------------------------------------
  EventBus& outputBus() { return output_bus_; }
  const SessionGate& sessions() const { return sessions_; }
  const NewsGuard& newsGuard() const { return news_; }
  std::vector<std::string> accountIds() const;
  std::size_t workerCount() const { return workers_.size(); }

 private:
  struct AccountRuntime {
    AccountRuntime(const AccountConfig& config, const ITimeProvider& clock,
                   const SessionGate& sessions, const NewsGuard& news,
                   CommitmentIdGenerator& ids);

    RiskLedger ledger;
    RiskGate gate;
    AdmissionController controller;
  };

  AccountRuntime& runtime(const std::string& account_id);
  AccountRuntime* findRuntime(const std::string& account_id);

  void publishDecision(const domain::AdmissionDecision& decision);
  // `view` must come from the same critical section as the mutation.
  void publishUpdate(const domain::RiskLedgerView& view, const char* cause);
  void publishFault(const std::string& account_id, CommitmentId id,
                    const std::string& fault, const std::string& detail,
                    Timestamp at);

  ReleaseResult applyClose(AccountRuntime& account, const TradeClose& close);

  const ITimeProvider& clock_;

  CommitmentIdGenerator ids_;
  SessionGate sessions_;
  NewsGuard news_;
  EventBus output_bus_;

  std::map<std::string, std::unique_ptr<AccountRuntime>> accounts_;

  std::atomic<std::uint64_t> sequence_{0};
  std::atomic<std::size_t> next_worker_{0};
  std::atomic<bool> running_{false};

  // Declared last: destroyed (and joined) before anything they call into.
  std::vector<std::unique_ptr<EventLoopThread>> workers_;
};

// JSON shapes used by executeCommand() and the CLI.
nlohmann::json toJson(const domain::RiskLedgerView& view);
nlohmann::json toJson(const domain::AdmissionDecision& decision);
nlohmann::json toJson(const LedgerFaultEvent& fault);

}  // namespace tradegate
