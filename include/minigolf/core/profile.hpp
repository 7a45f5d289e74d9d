/**
 * @file profile.hpp
 * @brief Lightweight timing of named code sections
 *
 * Each named section accumulates call count and total, minimum and
 * maximum duration. Sections may nest; a section must be ended in the
 * reverse order it was started.
 *
 * Example usage:
 * @code
 * void tick() {
 *     PROFILE_SCOPE("tick");  // Automatically times this scope
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats();
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <stack>
#include <string>
#include <unordered_map>

namespace Profiling {

/**
 * @brief Process-wide collector of section timings.
 *
 * Singleton; use the static methods.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timing statistics for a named section
     */
    struct ProfileData {
        Duration total_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    /**
     * @brief Start timing a named section.
     * @param name The section's name (must be ended with endSection).
     */
    static void startSection(const std::string& name);

    /**
     * @brief End timing the innermost open section.
     * @param name The section's name (must match the most recent startSection).
     */
    static void endSection(const std::string& name);

    /**
     * @brief Print one line per section to stdout, slowest first.
     */
    static void printStats();

    /**
     * @brief Number of completed calls recorded for a section (0 if unknown).
     */
    static uint64_t callCount(const std::string& name);

    /**
     * @brief Drop all recorded data.
     */
    static void reset();

private:
    struct OpenSection {
        std::string name;
        TimePoint start_time;
    };

    std::unordered_map<std::string, ProfileData> sections;
    std::stack<OpenSection> open_sections;

    Profiler() = default;

    static Profiler& getInstance();
};

/**
 * @brief RAII guard that times the enclosing scope.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
