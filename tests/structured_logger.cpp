#include "cortexgrid/daemon/StructuredLogger.hpp"

#include <cassert>
#include <sstream>
#include <string>

using cortexgrid::daemon::StructuredLogger;

int main() {
    const auto line = StructuredLogger::format_line("2026-01-01T00:00:00.000Z",
                                                    StructuredLogger::Level::Warning,
                                                    "sync.integrity_mismatch",
                                                    {{"peer", "ab\"cd"}, {"detail", "line\nbreak"}});
    assert(line ==
           "{\"ts\":\"2026-01-01T00:00:00.000Z\",\"level\":\"warning\",\"event\":\"sync.integrity_mismatch\","
           "\"fields\":{\"peer\":\"ab\\\"cd\",\"detail\":\"line\\nbreak\"}}\n");

    const auto bare = StructuredLogger::format_line("t", StructuredLogger::Level::Info, "node.listening", {});
    assert(bare == "{\"ts\":\"t\",\"level\":\"info\",\"event\":\"node.listening\"}\n");

    auto& logger = StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_stream(&sink);
    logger.set_enabled(true);

    cortexgrid::daemon::log_event(StructuredLogger::Level::Error, "task.failed", {{"code", "timeout"}});
    const auto written = sink.str();
    assert(written.find("\"level\":\"error\"") != std::string::npos);
    assert(written.find("\"event\":\"task.failed\"") != std::string::npos);
    assert(written.find("\"code\":\"timeout\"") != std::string::npos);
    assert(written.back() == '\n');

    logger.set_enabled(false);
    assert(!logger.enabled());
    cortexgrid::daemon::log_event(StructuredLogger::Level::Info, "ignored");
    assert(sink.str() == written);

    logger.set_enabled(true);
    logger.set_min_level(StructuredLogger::Level::Warning);
    cortexgrid::daemon::log_event(StructuredLogger::Level::Info, "below.threshold");
    assert(sink.str() == written);
    cortexgrid::daemon::log_event(StructuredLogger::Level::Warning, "relay.dropped");
    assert(sink.str().find("relay.dropped") != std::string::npos);

    assert(StructuredLogger::parse_level("error") == StructuredLogger::Level::Error);
    assert(!StructuredLogger::parse_level("debug").has_value());
    assert(StructuredLogger::level_name(StructuredLogger::Level::Warning) == "warning");

    const auto control = StructuredLogger::format_line("t", StructuredLogger::Level::Info, "x", {{"k", std::string(1, '\x01')}});
    assert(control.find("\\u0001") != std::string::npos);

    logger.set_min_level(StructuredLogger::Level::Info);
    logger.set_stream(nullptr);
    return 0;
}
