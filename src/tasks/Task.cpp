#include "cortexgrid/tasks/Task.hpp"

namespace cortexgrid::tasks {

TaskPriority priority_from_byte(std::uint8_t value) noexcept {
    return static_cast<TaskPriority>(value >> 6);
}

std::uint8_t priority_to_byte(TaskPriority priority) noexcept {
    return static_cast<std::uint8_t>(static_cast<std::uint8_t>(priority) << 6);
}

const char* to_string(TaskPriority priority) noexcept {
    switch (priority) {
        case TaskPriority::Low:
            return "low";
        case TaskPriority::Normal:
            return "normal";
        case TaskPriority::High:
            return "high";
        case TaskPriority::Critical:
            return "critical";
    }
    return "normal";
}

const char* to_string(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:
            return "pending";
        case TaskState::InFlight:
            return "in_flight";
        case TaskState::Completed:
            return "completed";
        case TaskState::Failed:
            return "failed";
    }
    return "failed";
}

}  // namespace cortexgrid::tasks
