#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cortexgrid::daemon {

// Process-wide JSON-lines logger, shared by every node in the process.
class StructuredLogger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    static std::optional<Level> parse_level(std::string_view name) noexcept;
    static std::string_view level_name(Level level) noexcept;

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    // Lines below this level are discarded.
    void set_min_level(Level level);

    // Redirects output; nullptr restores std::clog.
    void set_stream(std::ostream* stream);

    static std::string format_line(std::string_view timestamp,
                                   Level level,
                                   std::string_view event,
                                   const FieldList& fields);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string format_timestamp();

    bool enabled_{true};
    Level min_level_{Level::Info};
    std::ostream* stream_{nullptr};
    mutable std::mutex mutex_;
};

inline void log_event(StructuredLogger::Level level,
                      std::string_view event,
                      StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace cortexgrid::daemon
