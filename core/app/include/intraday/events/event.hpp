#pragma once

#include "intraday/events/decision_events.hpp"
#include "intraday/events/event_types.hpp"
#include "intraday/events/performance_event.hpp"
#include "intraday/events/risk_event.hpp"
#include "intraday/events/signal_event.hpp"
#include "intraday/events/trade_event.hpp"

#include <variant>

namespace intraday {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The one envelope carried by EventBus and ThreadSafeQueue. The first four
// alternatives are inbound (gateway → strategy loop); the rest are produced
// by the core and consumed by EventLogger, IpcServer and any execution
// collaborator subscribed to the strategy bus.
//
// Adding an alternative means updating formatEvent(); the std::visit there
// fails to compile until it does.
// -----------------------------------------------------------------------------
using Event = std::variant<
    BarEvent,
    TickEvent,
    DayEndEvent,
    RunEndEvent,
    EntryDecisionEvent,
    ExitDecisionEvent,
    TradeEvent,
    SignalEvent,
    RiskEvent,
    PerformanceEvent>;

}  // namespace intraday
