// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_MAIN_MESSAGE_LOOP_H_
#define TABHOST_BROWSER_MAIN_MESSAGE_LOOP_H_
#pragma once

#include <stdint.h>

#include <memory>

#include "include/base/cef_callback.h"
#include "include/cef_task.h"

namespace tabhost {

// Represents the message loop running on the host UI thread. Only one
// instance may exist at a time.
class MainMessageLoop {
 public:
  // Returns the singleton instance of this object.
  static MainMessageLoop* Get();

  MainMessageLoop(const MainMessageLoop&) = delete;
  MainMessageLoop& operator=(const MainMessageLoop&) = delete;

  // Run the message loop. The thread that this method is called on will be
  // considered the main thread. This blocks until Quit() is called.
  virtual int Run() = 0;

  // Quit the message loop.
  virtual void Quit() = 0;

  // Post a task for execution on the main message loop.
  virtual void PostTask(CefRefPtr<CefTask> task) = 0;

  // Post a task for execution on the main message loop after |delay_us|
  // microseconds.
  virtual void PostDelayedTask(CefRefPtr<CefTask> task, int64_t delay_us) = 0;

  // Returns true if this message loop runs tasks on the current thread.
  virtual bool RunsTasksOnCurrentThread() const = 0;

  // Post a closure for execution on the main message loop.
  void PostClosure(base::OnceClosure closure);
  void PostDelayedClosure(base::OnceClosure closure, int64_t delay_us);

 protected:
  // Only allow deletion via std::unique_ptr.
  friend std::default_delete<MainMessageLoop>;

  MainMessageLoop();
  virtual ~MainMessageLoop();
};

#define CURRENTLY_ON_MAIN_THREAD() \
  tabhost::MainMessageLoop::Get()->RunsTasksOnCurrentThread()

#define REQUIRE_MAIN_THREAD() DCHECK(CURRENTLY_ON_MAIN_THREAD())

}  // namespace tabhost

#endif  // TABHOST_BROWSER_MAIN_MESSAGE_LOOP_H_
