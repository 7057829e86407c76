// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "hyperray/core/time.hpp"

#include <utility>

#include "hyperray/core/log.h"

namespace hyperray::time {

namespace {

double seconds_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

FrameTimer::FrameTimer() : m_start(Clock::now()), m_last(m_start) {}

double FrameTimer::tick() {
    const Clock::time_point now = Clock::now();
    m_delta_seconds = seconds_between(m_last, now);
    m_last = now;
    return m_delta_seconds;
}

double FrameTimer::total_seconds() const {
    return seconds_between(m_start, Clock::now());
}

ScopedTimer::ScopedTimer(std::string label) : m_label(std::move(label)), m_begin(Clock::now()) {}

ScopedTimer::~ScopedTimer() {
    HYPERRAY_LOG_DEBUG("{} took {:.3f} ms", m_label, elapsed_ms());
}

double ScopedTimer::elapsed_ms() const {
    return seconds_between(m_begin, Clock::now()) * 1000.0;
}

} // namespace hyperray::time
