// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/pump_schedule.h"

#include <chrono>

namespace tabhost {

namespace {

uint64_t SteadyNowUs() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

uint64_t SaturatingAdd(uint64_t a, uint64_t b) {
  return (a > PumpSchedule::kNoPumpScheduled - b)
             ? PumpSchedule::kNoPumpScheduled - 1
             : a + b;
}

}  // namespace

PumpSchedule::PumpSchedule(NowCallback now) : now_(std::move(now)) {}

void PumpSchedule::SetReady(bool ready) {
  ready_.store(ready);
}

bool PumpSchedule::IsReady() const {
  return ready_.load();
}

void PumpSchedule::ScheduleWork(int64_t delay_ms) {
  uint64_t delay_us = 0;
  if (delay_ms > 0) {
    const uint64_t ms = static_cast<uint64_t>(delay_ms);
    delay_us = ms > kNoPumpScheduled / 1000 ? kNoPumpScheduled : ms * 1000;
  }
  const uint64_t target = SaturatingAdd(Now(), delay_us);

  uint64_t current = next_pump_us_.load();
  while (target < current &&
         !next_pump_us_.compare_exchange_weak(current, target)) {
  }
}

bool PumpSchedule::ShouldPump() const {
  return IsReady() && Now() >= next_pump_us_.load();
}

uint64_t PumpSchedule::TimeUntilNextPumpUs() const {
  const uint64_t next = next_pump_us_.load();
  const uint64_t now = Now();
  return next > now ? next - now : 0;
}

void PumpSchedule::Pump(base::OnceClosure do_work) {
  next_pump_us_.store(kNoPumpScheduled);

  std::move(do_work).Run();

  // Only install the fallback if nothing was requested while working.
  uint64_t expected = kNoPumpScheduled;
  next_pump_us_.compare_exchange_strong(expected,
                                        SaturatingAdd(Now(), kIdleFallbackUs));
}

uint64_t PumpSchedule::Now() const {
  return now_ ? now_.Run() : SteadyNowUs();
}

}  // namespace tabhost
