// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/tabhost_app.h"

#include "include/base/cef_logging.h"
#include "include/wrapper/cef_helpers.h"

namespace tabhost {

TabhostApp::TabhostApp(bool enable_gpu) : enable_gpu_(enable_gpu) {}

void TabhostApp::OnBeforeCommandLineProcessing(
    const CefString& process_type,
    CefRefPtr<CefCommandLine> command_line) {
  // Only the browser process needs additional flags.
  if (!process_type.empty()) {
    return;
  }

  // Tabs are created on demand by the host, never by the engine.
  command_line->AppendSwitch("no-startup-window");
  command_line->AppendSwitch("noerrdialogs");
  command_line->AppendSwitch("hide-crash-restore-bubble");
  command_line->AppendSwitch("disable-gpu-sandbox");

  // Use software rendering and compositing (disable GPU) for increased FPS
  // and decreased CPU usage with off-screen rendering.
  if (!enable_gpu_) {
    command_line->AppendSwitch("disable-gpu");
    command_line->AppendSwitch("disable-gpu-compositing");
  }
}

void TabhostApp::OnContextInitialized() {
  CEF_REQUIRE_UI_THREAD();
  LOG(INFO) << "Engine context initialized";
  schedule_.SetReady(true);
}

void TabhostApp::OnBeforeChildProcessLaunch(
    CefRefPtr<CefCommandLine> command_line) {
  command_line->AppendSwitch("disable-session-crashed-bubble");
}

void TabhostApp::OnScheduleMessagePumpWork(int64_t delay_ms) {
  // May be called on any thread.
  schedule_.ScheduleWork(delay_ms);
}

}  // namespace tabhost
