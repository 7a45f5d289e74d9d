/**
 * @file profile.cpp
 * @brief Implementation of the section profiler described in profile.hpp
 */

#include "minigolf/core/profile.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>
#include <vector>

namespace Profiling {

Profiler& Profiler::getInstance() {
    static Profiler instance;
    return instance;
}

void Profiler::startSection(const std::string& name) {
    auto& instance = getInstance();
    instance.open_sections.push({name, Clock::now()});
}

void Profiler::endSection(const std::string& name) {
    auto& instance = getInstance();

    if (instance.open_sections.empty()) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name << "\") but no section is open.\n";
        return;
    }
    if (instance.open_sections.top().name != name) {
        std::cerr << "[Profiler] Warning: endSection(\"" << name
                  << "\") but innermost section is \"" << instance.open_sections.top().name << "\".\n";
        return;
    }

    Duration const duration = Clock::now() - instance.open_sections.top().start_time;
    instance.open_sections.pop();

    auto& data = instance.sections[name];
    data.total_time += duration;
    data.call_count += 1;
    data.min_time = std::min(data.min_time, duration);
    data.max_time = std::max(data.max_time, duration);
}

void Profiler::printStats() {
    auto& instance = getInstance();

    std::vector<std::pair<std::string, ProfileData>> rows(instance.sections.begin(),
                                                          instance.sections.end());
    std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second.total_time > b.second.total_time;
    });

    std::cout << "\nProfiling Statistics:\n";
    for (const auto& [name, pd] : rows) {
        double const totalUs = std::chrono::duration<double, std::micro>(pd.total_time).count();
        double const avgUs = pd.call_count > 0 ? totalUs / static_cast<double>(pd.call_count) : 0.0;
        double const minUs = std::chrono::duration<double, std::micro>(pd.min_time).count();
        double const maxUs = std::chrono::duration<double, std::micro>(pd.max_time).count();

        std::cout << "  " << std::left << std::setw(28) << name
                  << " [" << pd.call_count << " calls] "
                  << std::fixed << std::setprecision(2)
                  << "total " << totalUs << "us, avg " << avgUs
                  << "us, min " << minUs << "us, max " << maxUs << "us\n";
    }
}

uint64_t Profiler::callCount(const std::string& name) {
    const auto& instance = getInstance();
    auto it = instance.sections.find(name);
    return it == instance.sections.end() ? 0 : it->second.call_count;
}

void Profiler::reset() {
    getInstance().sections.clear();
}

ScopedProfiler::ScopedProfiler(std::string name)
    : section_name(std::move(name))
{
    Profiler::startSection(section_name);
}

ScopedProfiler::~ScopedProfiler() {
    Profiler::endSection(section_name);
}

} // namespace Profiling
