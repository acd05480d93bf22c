#include "cortexgrid/daemon/StructuredLogger.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <iostream>

namespace cortexgrid::daemon {

namespace {

constexpr std::array<std::string_view, 3> kLevelNames{"info", "warning", "error"};
constexpr char kHexDigits[] = "0123456789ABCDEF";

void append_escaped(std::string& out, std::string_view value) {
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                out += "\\\"";
                continue;
            case '\\':
                out += "\\\\";
                continue;
            case '\n':
                out += "\\n";
                continue;
            case '\r':
                out += "\\r";
                continue;
            case '\t':
                out += "\\t";
                continue;
            default:
                break;
        }
        if (ch < 0x20) {
            out += "\\u00";
            out.push_back(kHexDigits[ch >> 4]);
            out.push_back(kHexDigits[ch & 0x0F]);
        } else {
            out.push_back(static_cast<char>(ch));
        }
    }
}

void append_string_member(std::string& out, std::string_view key, std::string_view value) {
    out.push_back('"');
    append_escaped(out, key);
    out += "\":\"";
    append_escaped(out, value);
    out.push_back('"');
}

void append_padded(std::string& out, long value, int width) {
    const auto digits = std::to_string(value);
    for (int i = static_cast<int>(digits.size()); i < width; ++i) {
        out.push_back('0');
    }
    out += digits;
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

std::optional<StructuredLogger::Level> StructuredLogger::parse_level(std::string_view name) noexcept {
    for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
        if (kLevelNames[i] == name) {
            return static_cast<Level>(i);
        }
    }
    return std::nullopt;
}

std::string_view StructuredLogger::level_name(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : kLevelNames[0];
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || level < min_level_) {
        return;
    }

    std::ostream& out = stream_ ? *stream_ : std::clog;
    out << format_line(format_timestamp(), level, event, fields);
    out.flush();
}

std::string StructuredLogger::format_line(std::string_view timestamp,
                                          Level level,
                                          std::string_view event,
                                          const FieldList& fields) {
    std::string line;
    line.reserve(64 + event.size() + fields.size() * 32);
    line.push_back('{');
    append_string_member(line, "ts", timestamp);
    line.push_back(',');
    append_string_member(line, "level", level_name(level));
    line.push_back(',');
    append_string_member(line, "event", event);

    if (!fields.empty()) {
        line += ",\"fields\":{";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) {
                line.push_back(',');
            }
            first = false;
            append_string_member(line, key, value);
        }
        line.push_back('}');
    }

    line += "}\n";
    return line;
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_min_level(Level level) {
    std::scoped_lock lock(mutex_);
    min_level_ = level;
}

void StructuredLogger::set_stream(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    stream_ = stream;
}

// ISO-8601 UTC with milliseconds, e.g. 2026-01-01T00:00:00.000Z.
std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
    gmtime_r(&now_c, &tm);

    std::string out;
    out.reserve(24);
    append_padded(out, tm.tm_year + 1900, 4);
    out.push_back('-');
    append_padded(out, tm.tm_mon + 1, 2);
    out.push_back('-');
    append_padded(out, tm.tm_mday, 2);
    out.push_back('T');
    append_padded(out, tm.tm_hour, 2);
    out.push_back(':');
    append_padded(out, tm.tm_min, 2);
    out.push_back(':');
    append_padded(out, tm.tm_sec, 2);
    out.push_back('.');
    append_padded(out, static_cast<long>(millis), 3);
    out.push_back('Z');
    return out;
}

}  // namespace cortexgrid::daemon
