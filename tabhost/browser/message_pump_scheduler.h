// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_MESSAGE_PUMP_SCHEDULER_H_
#define TABHOST_BROWSER_MESSAGE_PUMP_SCHEDULER_H_
#pragma once

#include <stdint.h>

#include "include/base/cef_ref_counted.h"
#include "include/base/cef_weak_ptr.h"
#include "tabhost/browser/engine.h"

namespace tabhost {

class TabController;

// Drives the engine's message loop from the host main loop. Each cycle pumps
// the engine if work is due, drains every tab of the owning TabController and
// reposts itself with a delay derived from the engine's next requested pump.
// The scheduler stops on its own once the owner is destroyed.
//
// All methods must be called on the main thread.
class MessagePumpScheduler
    : public base::RefCountedThreadSafe<MessagePumpScheduler> {
 public:
  // Creates a scheduler and posts its first cycle to the MainMessageLoop.
  // |engine| must outlive |owner|.
  static scoped_refptr<MessagePumpScheduler> Start(
      Engine* engine,
      base::WeakPtr<TabController> owner,
      int64_t min_delay_us,
      int64_t max_delay_us);

  // Returns |hint_us| clamped to [|min_delay_us|, |max_delay_us|]. Negative
  // hints map to |min_delay_us|.
  static int64_t ClampDelayUs(int64_t hint_us,
                              int64_t min_delay_us,
                              int64_t max_delay_us);

  MessagePumpScheduler(const MessagePumpScheduler&) = delete;
  MessagePumpScheduler& operator=(const MessagePumpScheduler&) = delete;

  // Runs one cycle without posting the next one. Returns the delay for the
  // next cycle in microseconds, or -1 if the owner is gone.
  int64_t DoCycle();

  bool is_stopped() const { return stopped_; }
  size_t cycle_count() const { return cycle_count_; }
  size_t pump_count() const { return pump_count_; }

 private:
  friend class base::RefCountedThreadSafe<MessagePumpScheduler>;

  MessagePumpScheduler(Engine* engine,
                       base::WeakPtr<TabController> owner,
                       int64_t min_delay_us,
                       int64_t max_delay_us);
  ~MessagePumpScheduler();

  // Runs a cycle and posts the next one.
  void RunCycle();

  Engine* const engine_;
  base::WeakPtr<TabController> owner_;
  const int64_t min_delay_us_;
  const int64_t max_delay_us_;

  bool stopped_ = false;
  size_t cycle_count_ = 0;
  size_t pump_count_ = 0;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_MESSAGE_PUMP_SCHEDULER_H_
