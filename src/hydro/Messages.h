// =============================================================================
// Runnel - Simulation Worker Protocol
// =============================================================================
// Closed set of requests (main thread -> worker) and events (worker -> main
// thread). Buffers travel inside the messages and are moved, never shared.
// Handlers dispatch with std::visit over an Overloaded visitor, so adding an
// alternative without handling it fails to compile.
// =============================================================================

#pragma once

#include "core/Types.h"
#include <variant>
#include <vector>

namespace Runnel {

// =============================================================================
// Requests
// =============================================================================

struct InitRequest {
    std::vector<f32> elevation;   // Row-major, meters
    u32 width = 0;
    u32 height = 0;
    f32 cellSize = 0.5f;          // Meters per cell
    u64 generation = 0;           // Echoed by every event produced for this terrain
};

struct StartRequest {};
struct StopRequest {};
struct StartRainRequest {};
struct StopRainRequest {};
struct ResetRequest {};

// Rates already converted to meters per step
struct SetParamsRequest {
    f32 rainRate = 0.0f;
    f32 evaporation = 0.0f;
    f32 infiltration = 0.0f;
    f32 flowRate = 0.25f;
};

using WorkerRequest = std::variant<
    InitRequest,
    StartRequest,
    StopRequest,
    StartRainRequest,
    StopRainRequest,
    ResetRequest,
    SetParamsRequest>;

// =============================================================================
// Events
// =============================================================================

// Worker thread is running and accepts InitRequest
struct LoadedEvent {};

// Buffers are allocated; StartRequest will tick
struct ReadyEvent {
    u32 width = 0;
    u32 height = 0;
    u64 generation = 0;
};

struct WaterUpdateEvent {
    std::vector<f32> grid;
    u32 width = 0;
    u32 height = 0;
    u64 step = 0;
    u64 generation = 0;
};

using WorkerEvent = std::variant<
    LoadedEvent,
    ReadyEvent,
    WaterUpdateEvent>;

// =============================================================================
// Helpers
// =============================================================================

template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const char* requestName(const WorkerRequest& request);
const char* eventName(const WorkerEvent& event);

} // namespace Runnel
