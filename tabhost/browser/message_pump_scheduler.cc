// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/message_pump_scheduler.h"

#include <limits>

#include "include/base/cef_callback.h"
#include "include/base/cef_logging.h"
#include "tabhost/browser/main_message_loop.h"
#include "tabhost/browser/tab_controller.h"

namespace tabhost {

// static
scoped_refptr<MessagePumpScheduler> MessagePumpScheduler::Start(
    Engine* engine,
    base::WeakPtr<TabController> owner,
    int64_t min_delay_us,
    int64_t max_delay_us) {
  scoped_refptr<MessagePumpScheduler> scheduler(new MessagePumpScheduler(
      engine, std::move(owner), min_delay_us, max_delay_us));
  MainMessageLoop::Get()->PostClosure(
      base::BindOnce(&MessagePumpScheduler::RunCycle, scheduler));
  return scheduler;
}

// static
int64_t MessagePumpScheduler::ClampDelayUs(int64_t hint_us,
                                           int64_t min_delay_us,
                                           int64_t max_delay_us) {
  DCHECK_LE(min_delay_us, max_delay_us);
  if (hint_us < min_delay_us) {
    return min_delay_us;
  }
  if (hint_us > max_delay_us) {
    return max_delay_us;
  }
  return hint_us;
}

MessagePumpScheduler::MessagePumpScheduler(Engine* engine,
                                           base::WeakPtr<TabController> owner,
                                           int64_t min_delay_us,
                                           int64_t max_delay_us)
    : engine_(engine),
      owner_(std::move(owner)),
      min_delay_us_(min_delay_us),
      max_delay_us_(max_delay_us) {
  DCHECK(engine_);
}

MessagePumpScheduler::~MessagePumpScheduler() = default;

int64_t MessagePumpScheduler::DoCycle() {
  if (stopped_) {
    return -1;
  }

  TabController* owner = owner_.get();
  if (!owner) {
    VLOG(1) << "Message pump owner is gone; stopping after " << cycle_count_
            << " cycles";
    stopped_ = true;
    return -1;
  }

  ++cycle_count_;

  if (engine_->IsContextReady() && engine_->ShouldPump()) {
    engine_->PumpMessages();
    ++pump_count_;
  }

  // Tabs are drained every cycle, whether or not the engine was pumped.
  owner->DrainAllTabs();

  const uint64_t hint = engine_->TimeUntilNextPumpUs();
  const int64_t signed_hint =
      hint > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
          ? std::numeric_limits<int64_t>::max()
          : static_cast<int64_t>(hint);
  return ClampDelayUs(signed_hint, min_delay_us_, max_delay_us_);
}

void MessagePumpScheduler::RunCycle() {
  REQUIRE_MAIN_THREAD();

  const int64_t delay_us = DoCycle();
  if (delay_us < 0) {
    return;
  }
  MainMessageLoop::Get()->PostDelayedClosure(
      base::BindOnce(&MessagePumpScheduler::RunCycle,
                     scoped_refptr<MessagePumpScheduler>(this)),
      delay_us);
}

}  // namespace tabhost
