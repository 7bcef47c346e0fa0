// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_PUMP_SCHEDULE_H_
#define TABHOST_BROWSER_PUMP_SCHEDULE_H_
#pragma once

#include <stdint.h>

#include <atomic>

#include "include/base/cef_callback.h"

namespace tabhost {

// Tracks when the engine next wants CefDoMessageLoopWork() to be called. The
// engine reports requests via OnScheduleMessagePumpWork() on arbitrary
// threads; the host thread polls ShouldPump() and calls Pump(). All times are
// in microseconds on a monotonic clock.
class PumpSchedule {
 public:
  using NowCallback = base::RepeatingCallback<uint64_t()>;

  // Marker stored while no pump is scheduled.
  static constexpr uint64_t kNoPumpScheduled = UINT64_MAX;

  // Delay applied after a pump during which the engine requested nothing.
  // Keeps the engine polled at roughly 30Hz while idle.
  static constexpr uint64_t kIdleFallbackUs = 33000;

  // |now| defaults to the steady clock.
  explicit PumpSchedule(NowCallback now = NowCallback());

  PumpSchedule(const PumpSchedule&) = delete;
  PumpSchedule& operator=(const PumpSchedule&) = delete;

  // Readiness of the engine context. Set once OnContextInitialized() runs and
  // cleared at shutdown.
  void SetReady(bool ready);
  bool IsReady() const;

  // Requests a pump no later than |delay_ms| from now. Negative values are
  // treated as zero. An earlier pending request is never pushed back. May be
  // called on any thread.
  void ScheduleWork(int64_t delay_ms);

  // Returns true if the context is ready and the scheduled time has passed.
  bool ShouldPump() const;

  // Microseconds until the scheduled pump, or 0 if it is due. Returns a very
  // large value when nothing is scheduled.
  uint64_t TimeUntilNextPumpUs() const;

  // Clears the schedule, runs |do_work| once and, if |do_work| did not cause a
  // new request, schedules the idle fallback.
  void Pump(base::OnceClosure do_work);

  // Raw scheduled time, for tests.
  uint64_t next_pump_us() const { return next_pump_us_.load(); }

 private:
  uint64_t Now() const;

  NowCallback now_;
  std::atomic<bool> ready_{false};

  // Starts at zero so the first check after readiness pumps immediately.
  std::atomic<uint64_t> next_pump_us_{0};
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_PUMP_SCHEDULE_H_
