// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_TABHOST_APP_H_
#define TABHOST_BROWSER_TABHOST_APP_H_
#pragma once

#include "include/cef_app.h"
#include "tabhost/browser/pump_schedule.h"

namespace tabhost {

// Application implementation for the browser process and for sub-processes.
// Sub-processes only use the command-line hooks.
class TabhostApp : public CefApp, public CefBrowserProcessHandler {
 public:
  // |enable_gpu| keeps GPU compositing for off-screen rendering.
  explicit TabhostApp(bool enable_gpu);

  TabhostApp(const TabhostApp&) = delete;
  TabhostApp& operator=(const TabhostApp&) = delete;

  PumpSchedule& schedule() { return schedule_; }
  const PumpSchedule& schedule() const { return schedule_; }

  // CefApp methods:
  void OnBeforeCommandLineProcessing(
      const CefString& process_type,
      CefRefPtr<CefCommandLine> command_line) override;
  CefRefPtr<CefBrowserProcessHandler> GetBrowserProcessHandler() override {
    return this;
  }

  // CefBrowserProcessHandler methods:
  void OnContextInitialized() override;
  void OnBeforeChildProcessLaunch(
      CefRefPtr<CefCommandLine> command_line) override;
  void OnScheduleMessagePumpWork(int64_t delay_ms) override;

 private:
  const bool enable_gpu_;
  PumpSchedule schedule_;

  IMPLEMENT_REFCOUNTING(TabhostApp);
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_TABHOST_APP_H_
