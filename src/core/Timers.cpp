#include "Timers.h"

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

void Timers::startTimer(const std::string& name)
{
    auto& timer = timers[name];
    if (!timer.isRunning) {
        timer.startTime = std::chrono::steady_clock::now();
        timer.isRunning = true;
        timer.callCount++;
    }
}

double Timers::stopTimer(const std::string& name)
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return -1.0;
    }

    auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - timer.startTime);
    timer.accumulatedTime += duration.count() / 1000.0;
    timer.isRunning = false;
    return timer.accumulatedTime;
}

bool Timers::hasTimer(const std::string& name) const
{
    return timers.find(name) != timers.end();
}

double Timers::getAccumulatedTime(const std::string& name) const
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return -1.0;
    }

    const auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }

    // Include the running session.
    auto current = std::chrono::steady_clock::now();
    auto currentDuration =
        std::chrono::duration_cast<std::chrono::microseconds>(current - timer.startTime);
    return timer.accumulatedTime + (currentDuration.count() / 1000.0);
}

void Timers::resetTimer(const std::string& name)
{
    auto it = timers.find(name);
    if (it != timers.end()) {
        it->second.accumulatedTime = 0.0;
        it->second.callCount = 0;
        if (it->second.isRunning) {
            it->second.startTime = std::chrono::steady_clock::now();
        }
    }
}

uint32_t Timers::getCallCount(const std::string& name) const
{
    auto it = timers.find(name);
    if (it == timers.end()) {
        return 0;
    }
    return it->second.callCount;
}

void Timers::dumpTimerStats() const
{
    std::cout << "\nTimer Statistics:" << std::endl;
    std::cout << "----------------" << std::endl;

    double frameTime = getAccumulatedTime("frame_total");

    std::vector<std::string> names = getAllTimerNames();
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        double time = getAccumulatedTime(name);
        uint32_t calls = getCallCount(name);
        std::cout << "  " << name << ": " << time << "ms (" << (calls > 0 ? time / calls : 0)
                  << "ms avg, " << calls << " calls";
        if (frameTime > 0.0 && name != "frame_total") {
            std::cout << ", " << (time / frameTime * 100.0) << "% of frame time";
        }
        std::cout << ")" << std::endl;
    }

    std::cout << "----------------" << std::endl;
}

std::vector<std::string> Timers::getAllTimerNames() const
{
    std::vector<std::string> names;
    names.reserve(timers.size());
    for (const auto& pair : timers) {
        names.push_back(pair.first);
    }
    return names;
}

nlohmann::json Timers::exportAllTimersAsJson() const
{
    nlohmann::json j = nlohmann::json::object();

    for (const auto& [name, timerData] : timers) {
        double total_ms = getAccumulatedTime(name);
        uint32_t calls = timerData.callCount;
        double avg_ms = calls > 0 ? total_ms / calls : 0.0;

        j[name] = { { "total_ms", total_ms }, { "avg_ms", avg_ms }, { "calls", calls } };
    }

    return j;
}
