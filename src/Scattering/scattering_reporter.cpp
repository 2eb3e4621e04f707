/**
 * @file scattering_reporter.cpp
 * @brief
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#include "scattering_reporter.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdio>

namespace elrates::scattering {

void ScatteringReporter::report_list(LogLevel level, std::string_view header, const std::vector<std::string>& lines) {
    report(level, header);
    for (const auto& line : lines) {
        report(level, fmt::format("  - {}", line));
    }
}

void ConsoleReporter::report(LogLevel level, std::string_view message) {
    if (static_cast<uint8_t>(level) < static_cast<uint8_t>(m_threshold)) {
        return;
    }
    switch (level) {
        case LogLevel::warning:
            fmt::print(stderr, "Warning: {}\n", message);
            break;
        case LogLevel::debug:
            fmt::print("[debug] {}\n", message);
            break;
        default:
            fmt::print("{}\n", message);
            break;
    }
}

}  // namespace elrates::scattering
