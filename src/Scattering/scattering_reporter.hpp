/**
 * @file scattering_reporter.hpp
 * @brief Diagnostic sink injected into the scattering mechanisms.
 * @version 0.1
 * @date 2026-10-14
 *
 *
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace elrates::scattering {

enum class LogLevel : uint8_t { debug = 0, info = 1, warning = 2 };

class ScatteringReporter {
 public:
    virtual ~ScatteringReporter() = default;

    virtual void report(LogLevel level, std::string_view message) = 0;

    void debug(std::string_view message) { report(LogLevel::debug, message); }
    void info(std::string_view message) { report(LogLevel::info, message); }
    void warning(std::string_view message) { report(LogLevel::warning, message); }

    /**
     * @brief Report a header followed by one indented line per entry.
     *
     * @param level
     * @param header
     * @param lines
     */
    void report_list(LogLevel level, std::string_view header, const std::vector<std::string>& lines);
};

/**
 * @brief Print messages on the console with fmt. Warnings go to stderr.
 *
 */
class ConsoleReporter : public ScatteringReporter {
 private:
    LogLevel m_threshold = LogLevel::info;

 public:
    ConsoleReporter() = default;
    explicit ConsoleReporter(LogLevel threshold) : m_threshold(threshold) {}

    void report(LogLevel level, std::string_view message) override;
};

class NullReporter : public ScatteringReporter {
 public:
    void report(LogLevel, std::string_view) override {}
};

}  // namespace elrates::scattering
