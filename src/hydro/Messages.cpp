// =============================================================================
// Runnel - Simulation Worker Protocol
// =============================================================================

#include "Messages.h"

namespace Runnel {

const char* requestName(const WorkerRequest& request) {
    return std::visit(Overloaded{
        [](const InitRequest&)      { return "init"; },
        [](const StartRequest&)     { return "start"; },
        [](const StopRequest&)      { return "stop"; },
        [](const StartRainRequest&) { return "start-rain"; },
        [](const StopRainRequest&)  { return "stop-rain"; },
        [](const ResetRequest&)     { return "reset"; },
        [](const SetParamsRequest&) { return "set-params"; },
    }, request);
}

const char* eventName(const WorkerEvent& event) {
    return std::visit(Overloaded{
        [](const LoadedEvent&)      { return "loaded"; },
        [](const ReadyEvent&)       { return "ready"; },
        [](const WaterUpdateEvent&) { return "water-update"; },
    }, event);
}

} // namespace Runnel
