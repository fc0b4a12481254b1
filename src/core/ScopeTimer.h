#pragma once

#include "Timers.h"
#include <string>

class ScopeTimer {
public:
    explicit ScopeTimer(Timers& timers, const std::string& name) : m_timers(timers), m_name(name)
    {
        m_timers.startTimer(m_name);
    }

    ~ScopeTimer() { m_timers.stopTimer(m_name); }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    Timers& m_timers;
    std::string m_name;
};
