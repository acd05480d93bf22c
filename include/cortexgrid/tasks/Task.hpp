#pragma once

#include "cortexgrid/Error.hpp"
#include "cortexgrid/Types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cortexgrid::tasks {

enum class TaskPriority : std::uint8_t {
    Low = 0,
    Normal = 1,
    High = 2,
    Critical = 3
};

inline constexpr std::size_t kPriorityTiers = 4;

// Maps the TASK_REQUEST priority byte onto the four tiers.
TaskPriority priority_from_byte(std::uint8_t value) noexcept;
std::uint8_t priority_to_byte(TaskPriority priority) noexcept;
const char* to_string(TaskPriority priority) noexcept;

enum class TaskState {
    Pending,
    InFlight,
    Completed,
    Failed
};

const char* to_string(TaskState state) noexcept;

struct QueuedTask {
    using Clock = std::chrono::steady_clock;

    std::uint64_t task_id{0};
    std::string capability;
    std::vector<std::uint8_t> payload;
    TaskPriority priority{TaskPriority::Normal};
    std::optional<NodeId> target_node;
    bool require_remote{false};
    std::uint8_t retries{0};
    std::chrono::milliseconds timeout{0};
    Clock::time_point created_at{};
    Clock::time_point dispatched_at{};
};

struct TaskOutcome {
    std::uint64_t task_id{0};
    TaskState state{TaskState::Failed};
    std::vector<std::uint8_t> output;
    std::optional<Error> error;
    // Empty when the task ran locally.
    std::optional<NodeId> executed_by;
    std::uint32_t execution_ms{0};
    std::uint8_t retries{0};
};

}  // namespace cortexgrid::tasks
