#pragma once

#include "tradegate/events/event.hpp"
#include "tradegate/session/news_guard.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <istream>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// ReplayGateway: JSON-lines bridge from a recorded session into the engine
// -----------------------------------------------------------------------------
//
// @brief  Reads one JSON record per line, advances the simulation clock to
//         the record's timestamp, and hands the decoded record to a sink.
//
// @details
// Record types ("type" field):
//   signal    timestamp_ms, account, symbol, risk_r [, signal_id]
//               → CandidateSignal via event_sink
//   close     [timestamp_ms,] account, commitment_id, pnl_r
//             [, pnl_dollars][, fraction]
//               → TradeClose via event_sink
//   rollover  timestamp_ms, account
//               → RolloverRequest via event_sink
//   command   command
//               → command_sink; the response is written to `out`
//   news      time_ms, name, currency [, impact]
//               → NewsEvent via news_sink (calendar append)
//
// For every record carrying timestamp_ms the order is:
//   1. advance_time(timestamp_ms)
//   2. sink(record)
// so anything that reads the clock while handling the record sees its time.
//
// Malformed lines are logged to stderr with their line number and skipped.
// Blank lines are ignored.
//
// Thread model:
//   run() blocks the calling thread until end of stream or stop(). stop()
//   may be called from any thread (including a signal handler; it is a
//   single atomic store) and takes effect before the next line.
//
// Ownership:
//   Holds a reference to the SimulationTimeProvider and copies of the sinks.
// -----------------------------------------------------------------------------
class ReplayGateway {
 public:
  using EventSink = std::function<void(Event)>;
  using CommandSink = std::function<std::string(const std::string&)>;
  using NewsSink = std::function<void(const NewsEvent&)>;

  struct Stats {
    std::size_t lines{0};       // Non-blank lines read
    std::size_t dispatched{0};  // Records handed to a sink
    std::size_t skipped{0};     // Malformed or unsupported records
  };

  ReplayGateway(SimulationTimeProvider& time_provider, EventSink event_sink,
                CommandSink command_sink, NewsSink news_sink,
                std::ostream& out);

  ReplayGateway(const ReplayGateway&) = delete;
  ReplayGateway& operator=(const ReplayGateway&) = delete;
  ReplayGateway(ReplayGateway&&) = delete;
  ReplayGateway& operator=(ReplayGateway&&) = delete;

  Stats run(std::istream& in);

  void stop();

  // Decodes and dispatches one line. Returns false if it was skipped.
  bool handleLine(const std::string& line, std::size_t line_number);

 private:
  SimulationTimeProvider& time_provider_;
  EventSink event_sink_;
  CommandSink command_sink_;
  NewsSink news_sink_;
  std::ostream& out_;

  std::atomic<bool> running_{false};
};

}  // namespace tradegate
