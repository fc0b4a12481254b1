#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Named wall-clock accumulators for the grid tick and the frame loop.
 */
class Timers {
public:
    Timers() = default;
    ~Timers() = default;

    // Start a timer with the given name.
    void startTimer(const std::string& name);

    // Stop a timer with the given name and return accumulated time in milliseconds.
    double stopTimer(const std::string& name);

    bool hasTimer(const std::string& name) const;

    // Total accumulated time for a timer in milliseconds, -1 if unknown.
    double getAccumulatedTime(const std::string& name) const;

    void resetTimer(const std::string& name);

    // Number of times a timer has been started.
    uint32_t getCallCount(const std::string& name) const;

    void dumpTimerStats() const;
    std::vector<std::string> getAllTimerNames() const;

    nlohmann::json exportAllTimersAsJson() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct TimerData {
        TimePoint startTime;
        double accumulatedTime = 0.0;
        bool isRunning = false;
        uint32_t callCount = 0;
    };

    std::unordered_map<std::string, TimerData> timers;
};
