// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_MAIN_MESSAGE_LOOP_GLIB_H_
#define TABHOST_BROWSER_MAIN_MESSAGE_LOOP_GLIB_H_
#pragma once

#include <glib.h>

#include "include/base/cef_platform_thread.h"
#include "tabhost/browser/main_message_loop.h"

namespace tabhost {

// Main message loop backed by the default GLib context. The engine runs its
// own GLib context internally, so this loop only carries host tasks and the
// message pump scheduler. Each posted task becomes a one-shot GSource whose
// ready time is the requested deadline.
class MainMessageLoopGlib : public MainMessageLoop {
 public:
  MainMessageLoopGlib();
  ~MainMessageLoopGlib() override;

  // MainMessageLoop methods.
  int Run() override;
  void Quit() override;
  void PostTask(CefRefPtr<CefTask> task) override;
  void PostDelayedTask(CefRefPtr<CefTask> task, int64_t delay_us) override;
  bool RunsTasksOnCurrentThread() const override;

 private:
  void DoQuit();

  const base::PlatformThreadId thread_id_;

  GMainContext* main_context_;
  GMainLoop* main_loop_ = nullptr;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_MAIN_MESSAGE_LOOP_GLIB_H_
