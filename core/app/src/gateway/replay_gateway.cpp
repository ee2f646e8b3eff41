#include "tradegate/gateway/replay_gateway.hpp"
#include "tradegate/config/config_error.hpp"
#include "tradegate/config/config_loader.hpp"
#include "tradegate/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <iostream>
#include <utility>

namespace tradegate {

namespace {

bool isBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

ReplayGateway::ReplayGateway(SimulationTimeProvider& time_provider,
                             EventSink event_sink, CommandSink command_sink,
                             NewsSink news_sink, std::ostream& out)
    : time_provider_(time_provider),
      event_sink_(std::move(event_sink)),
      command_sink_(std::move(command_sink)),
      news_sink_(std::move(news_sink)),
      out_(out) {}

// -----------------------------------------------------------------------------
// run(): line loop, until end of stream or stop()
// -----------------------------------------------------------------------------
ReplayGateway::Stats ReplayGateway::run(std::istream& in) {
  running_.store(true);

  Stats stats;
  std::string line;
  std::size_t line_number = 0;
  while (running_.load() && std::getline(in, line)) {
    ++line_number;
    if (isBlank(line)) {
      continue;
    }
    ++stats.lines;
    if (handleLine(line, line_number)) {
      ++stats.dispatched;
    } else {
      ++stats.skipped;
    }
  }

  if (!running_.load()) {
    std::cout << "[ReplayGateway] Stopped after line " << line_number << ".\n";
  }
  running_.store(false);
  return stats;
}

void ReplayGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// handleLine(): decode one record and dispatch it
// -----------------------------------------------------------------------------
bool ReplayGateway::handleLine(const std::string& line,
                               std::size_t line_number) {
  try {
    const auto json = nlohmann::json::parse(line);
    const std::string type = json.at("type").get<std::string>();

    // --- Step 1: advance the clock before anything reads it ----------------
    std::int64_t timestamp_ms = time_provider_.now_ms();
    if (json.contains("timestamp_ms")) {
      timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
      time_provider_.advance_time(timestamp_ms);
    }

    // --- Step 2: dispatch by record type ------------------------------------
    if (type == "signal") {
      CandidateSignal signal;
      signal.account_id = json.at("account").get<std::string>();
      signal.symbol = json.at("symbol").get<std::string>();
      signal.proposed_risk_r = json.at("risk_r").get<double>();
      signal.signal_id = json.value("signal_id",
                                    "line-" + std::to_string(line_number));
      signal.timestamp = ms_to_timestamp(timestamp_ms);
      event_sink_(std::move(signal));
      return true;
    }

    if (type == "close") {
      TradeClose close;
      close.account_id = json.at("account").get<std::string>();
      close.commitment_id = json.at("commitment_id").get<CommitmentId>();
      close.realized_pnl_r = json.at("pnl_r").get<double>();
      close.realized_pnl_dollars = json.value("pnl_dollars", 0.0);
      close.closed_fraction = json.value("fraction", 1.0);
      close.closed_at = ms_to_timestamp(timestamp_ms);
      event_sink_(std::move(close));
      return true;
    }

    if (type == "rollover") {
      RolloverRequest request;
      request.account_id = json.at("account").get<std::string>();
      request.boundary = ms_to_timestamp(timestamp_ms);
      event_sink_(std::move(request));
      return true;
    }

    if (type == "command") {
      const std::string command = json.at("command").get<std::string>();
      out_ << command_sink_(command) << "\n";
      return true;
    }

    if (type == "news") {
      news_sink_(parseNewsEvent(json, "line " + std::to_string(line_number)));
      return true;
    }

    std::cerr << "[ReplayGateway] line " << line_number
              << ": unsupported record type '" << type << "'\n";
    return false;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ReplayGateway] line " << line_number
              << ": malformed record: " << e.what() << "\n";
  } catch (const ConfigError& e) {
    std::cerr << "[ReplayGateway] line " << line_number
              << ": malformed record: " << e.what() << "\n";
  }
  return false;
}

}  // namespace tradegate
