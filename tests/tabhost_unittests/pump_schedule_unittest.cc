// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "gtest/gtest.h"
#include "include/base/cef_callback.h"
#include "include/base/cef_callback_helpers.h"
#include "tabhost/browser/pump_schedule.h"

using namespace tabhost;

namespace {

uint64_t ReadClock(const uint64_t* clock) {
  return *clock;
}

void CountWork(int* count) {
  ++*count;
}

void ScheduleDuringWork(PumpSchedule* schedule, int64_t delay_ms) {
  schedule->ScheduleWork(delay_ms);
}

class ManualClock {
 public:
  PumpSchedule::NowCallback GetCallback() {
    return base::BindRepeating(&ReadClock, base::Unretained(&now_us_));
  }

  void Advance(uint64_t us) { now_us_ += us; }
  uint64_t now() const { return now_us_; }

 private:
  uint64_t now_us_ = 1000000;
};

}  // namespace

TEST(PumpSchedule, NotReadyNeverPumps) {
  ManualClock clock;
  PumpSchedule schedule(clock.GetCallback());

  EXPECT_FALSE(schedule.IsReady());
  EXPECT_FALSE(schedule.ShouldPump());

  schedule.SetReady(true);
  // Nothing has run yet, so the first check pumps.
  EXPECT_TRUE(schedule.ShouldPump());

  schedule.SetReady(false);
  EXPECT_FALSE(schedule.ShouldPump());
}

TEST(PumpSchedule, PumpInstallsIdleFallback) {
  ManualClock clock;
  PumpSchedule schedule(clock.GetCallback());
  schedule.SetReady(true);

  int work_count = 0;
  schedule.Pump(base::BindOnce(&CountWork, base::Unretained(&work_count)));
  EXPECT_EQ(1, work_count);

  EXPECT_EQ(clock.now() + PumpSchedule::kIdleFallbackUs,
            schedule.next_pump_us());
  EXPECT_FALSE(schedule.ShouldPump());
  EXPECT_EQ(PumpSchedule::kIdleFallbackUs, schedule.TimeUntilNextPumpUs());

  clock.Advance(PumpSchedule::kIdleFallbackUs);
  EXPECT_TRUE(schedule.ShouldPump());
  EXPECT_EQ(0U, schedule.TimeUntilNextPumpUs());
}

TEST(PumpSchedule, ScheduleWorkKeepsEarliest) {
  ManualClock clock;
  PumpSchedule schedule(clock.GetCallback());
  schedule.SetReady(true);
  schedule.Pump(base::DoNothing());

  schedule.ScheduleWork(10);
  EXPECT_EQ(clock.now() + 10000, schedule.next_pump_us());

  // A later request does not push the pump back.
  schedule.ScheduleWork(20);
  EXPECT_EQ(clock.now() + 10000, schedule.next_pump_us());

  // An earlier request moves it forward.
  schedule.ScheduleWork(2);
  EXPECT_EQ(clock.now() + 2000, schedule.next_pump_us());
}

TEST(PumpSchedule, NegativeDelayMeansNow) {
  ManualClock clock;
  PumpSchedule schedule(clock.GetCallback());
  schedule.SetReady(true);
  schedule.Pump(base::DoNothing());
  EXPECT_FALSE(schedule.ShouldPump());

  schedule.ScheduleWork(-5);
  EXPECT_EQ(clock.now(), schedule.next_pump_us());
  EXPECT_TRUE(schedule.ShouldPump());
}

TEST(PumpSchedule, RequestDuringWorkSurvivesPump) {
  ManualClock clock;
  PumpSchedule schedule(clock.GetCallback());
  schedule.SetReady(true);

  schedule.Pump(
      base::BindOnce(&ScheduleDuringWork, base::Unretained(&schedule), 1));

  // The fallback does not override the request made while working.
  EXPECT_EQ(clock.now() + 1000, schedule.next_pump_us());
}

TEST(PumpSchedule, HugeDelaySaturates) {
  ManualClock clock;
  PumpSchedule schedule(clock.GetCallback());
  schedule.SetReady(true);

  schedule.Pump(base::BindOnce(&ScheduleDuringWork,
                               base::Unretained(&schedule), INT64_MAX));
  EXPECT_LT(schedule.next_pump_us(), PumpSchedule::kNoPumpScheduled);
  EXPECT_GT(schedule.next_pump_us(), clock.now());
  EXPECT_FALSE(schedule.ShouldPump());
}
