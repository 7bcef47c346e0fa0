// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_ENGINE_CONTEXT_H_
#define TABHOST_BROWSER_ENGINE_CONTEXT_H_
#pragma once

#include <stdint.h>

#include "include/base/cef_thread_checker.h"
#include "include/cef_app.h"
#include "tabhost/browser/tabhost_app.h"
#include "tabhost/common/app_config.h"

namespace tabhost {

// Owns the process-wide engine state in the browser process: the CefApp, the
// readiness flag and the pump schedule. Only one instance may exist at a time.
// All methods except the pump queries must be called on the thread that
// created the object.
class EngineContext {
 public:
  // Returns the singleton instance, or nullptr if none exists.
  static EngineContext* Get();

  explicit EngineContext(const AppConfig& config);
  ~EngineContext();

  EngineContext(const EngineContext&) = delete;
  EngineContext& operator=(const EngineContext&) = delete;

  // Hands control to CEF if the current process is a sub-process. Returns the
  // sub-process exit code, or -1 if this is the browser process. Must be
  // called before Initialize(). Calling it again returns -1.
  int ExecuteSubprocess(const CefMainArgs& args);

  // Initializes CEF. Returns false if ExecuteSubprocess() was not called or if
  // CEF fails to initialize. Returns true without doing anything if already
  // initialized.
  bool Initialize(const CefMainArgs& args);

  // Runs engine work until the context reports readiness. Gives up after
  // |max_attempts| rounds spaced 10ms apart. Returns true once ready.
  bool WaitUntilReady(int max_attempts);

  // Shuts down CEF. Does nothing unless Initialize() succeeded. All browsers
  // must be closed and the pump run briefly before calling this.
  void Shutdown();

  // Fills |settings| from the configuration.
  void PopulateSettings(CefSettings* settings) const;

  // Fills |settings| for a new windowless browser.
  void PopulateBrowserSettings(CefBrowserSettings* settings) const;

  // True once the engine reported OnContextInitialized and until Shutdown().
  bool IsContextReady() const;

  // See PumpSchedule.
  bool ShouldPump() const;
  uint64_t TimeUntilNextPumpUs() const;

  // Performs a single unit of engine work.
  void PumpMessages();

  const AppConfig& config() const { return config_; }
  CefRefPtr<TabhostApp> app() const { return app_; }

 private:
  const AppConfig config_;
  CefRefPtr<TabhostApp> app_;

  // Track context state. Only a single thread exists while these are set.
  bool subprocess_checked_ = false;
  bool initialized_ = false;
  bool shutdown_ = false;

  base::ThreadChecker thread_checker_;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_ENGINE_CONTEXT_H_
