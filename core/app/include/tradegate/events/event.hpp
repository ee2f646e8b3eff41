#pragma once

#include "tradegate/events/admission_decision_event.hpp"
#include "tradegate/events/event_types.hpp"
#include "tradegate/events/ledger_fault_event.hpp"
#include "tradegate/events/ledger_update_event.hpp"

#include <variant>

namespace tradegate {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The one envelope carried by every EventBus and worker queue.
//
// Inputs (pushed into worker loops):
//   CandidateSignal, TradeClose, RolloverRequest
// Outputs (published on AdmissionEngine::outputBus()):
//   AdmissionDecisionEvent, LedgerUpdateEvent, LedgerFaultEvent
//
// Dispatch with std::get_if or EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<
    CandidateSignal,
    TradeClose,
    RolloverRequest,
    AdmissionDecisionEvent,
    LedgerUpdateEvent,
    LedgerFaultEvent>;

}  // namespace tradegate
