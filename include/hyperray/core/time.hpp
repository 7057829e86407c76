// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace hyperray::time {

using Clock = std::chrono::steady_clock;

/// Measures the interval between rendered frames
class FrameTimer {
public:
    FrameTimer();

    /// Marks the end of a frame and returns its duration in seconds
    double tick();

    double delta_seconds() const { return m_delta_seconds; }
    double total_seconds() const;

private:
    Clock::time_point m_start;
    Clock::time_point m_last;
    double m_delta_seconds = 0.0;
};

/// Logs the elapsed time of a scope when destroyed
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label);
    ~ScopedTimer();

    double elapsed_ms() const;

private:
    std::string m_label;
    Clock::time_point m_begin;
};

} // namespace hyperray::time
