// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_TESTS_TABHOST_UNITTESTS_FAKE_MAIN_MESSAGE_LOOP_H_
#define TABHOST_TESTS_TABHOST_UNITTESTS_FAKE_MAIN_MESSAGE_LOOP_H_
#pragma once

#include <stdint.h>

#include <deque>

#include "tabhost/browser/main_message_loop.h"

namespace tabhost {

// MainMessageLoop that queues posted tasks until the test runs them. Delays
// are recorded but not honored.
class FakeMainMessageLoop : public MainMessageLoop {
 public:
  FakeMainMessageLoop();
  ~FakeMainMessageLoop() override;

  // MainMessageLoop methods:
  int Run() override;
  void Quit() override;
  void PostTask(CefRefPtr<CefTask> task) override;
  void PostDelayedTask(CefRefPtr<CefTask> task, int64_t delay_us) override;
  bool RunsTasksOnCurrentThread() const override { return true; }

  // Runs the tasks queued when this method is called, in posting order.
  // Tasks posted while running stay queued. Returns the number of tasks run.
  size_t RunPendingTasks();

  size_t pending_task_count() const { return tasks_.size(); }

  // Delay of the most recently posted task, or -1 if none was delayed.
  int64_t last_delay_us() const { return last_delay_us_; }

  bool quit_called() const { return quit_called_; }

 private:
  std::deque<CefRefPtr<CefTask>> tasks_;
  int64_t last_delay_us_ = -1;
  bool quit_called_ = false;
};

}  // namespace tabhost

#endif  // TABHOST_TESTS_TABHOST_UNITTESTS_FAKE_MAIN_MESSAGE_LOOP_H_
