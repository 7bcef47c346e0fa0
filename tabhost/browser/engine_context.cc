// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/engine_context.h"

#include <unistd.h>

#include "include/base/cef_callback.h"
#include "include/base/cef_logging.h"
#include "tabhost/common/file_util.h"

namespace tabhost {

namespace {

EngineContext* g_engine_context = nullptr;

}  // namespace

// static
EngineContext* EngineContext::Get() {
  return g_engine_context;
}

EngineContext::EngineContext(const AppConfig& config)
    : config_(config), app_(new TabhostApp(config.enable_gpu)) {
  DCHECK(!g_engine_context);
  g_engine_context = this;
}

EngineContext::~EngineContext() {
  // The context must either not have been initialized, or it must have also
  // been shut down.
  DCHECK(!initialized_ || shutdown_);
  g_engine_context = nullptr;
}

int EngineContext::ExecuteSubprocess(const CefMainArgs& args) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (subprocess_checked_) {
    return -1;
  }
  subprocess_checked_ = true;

  // CEF applications have multiple sub-processes (render, GPU, etc) that share
  // the same executable. This function checks the command-line and, if this
  // is a sub-process, executes the appropriate logic.
  return CefExecuteProcess(args, app_, nullptr);
}

bool EngineContext::Initialize(const CefMainArgs& args) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (initialized_ && !shutdown_) {
    return true;
  }
  if (!subprocess_checked_) {
    LOG(ERROR) << "Sub-process hand-off must run before initialization";
    return false;
  }
  if (shutdown_) {
    LOG(ERROR) << "The engine cannot be initialized again after shutdown";
    return false;
  }

  CefSettings settings;
  PopulateSettings(&settings);

  if (!CefInitialize(args, settings, app_, nullptr)) {
    LOG(ERROR) << "CefInitialize failed with exit code "
               << CefGetExitCode();
    return false;
  }

  initialized_ = true;
  return true;
}

bool EngineContext::WaitUntilReady(int max_attempts) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (!initialized_ || shutdown_) {
    return false;
  }

  for (int i = 0; i < max_attempts && !IsContextReady(); ++i) {
    CefDoMessageLoopWork();
    if (!IsContextReady()) {
      usleep(10000);
    }
  }

  if (!IsContextReady()) {
    LOG(ERROR) << "Engine context not ready after " << max_attempts
               << " attempts";
    return false;
  }
  return true;
}

void EngineContext::Shutdown() {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (!initialized_ || shutdown_) {
    return;
  }

  app_->schedule().SetReady(false);
  CefShutdown();

  shutdown_ = true;
}

void EngineContext::PopulateSettings(CefSettings* settings) const {
  settings->windowless_rendering_enabled = true;
  settings->external_message_pump = true;
  settings->no_sandbox = true;
  settings->log_severity = config_.log_severity;
  if (!config_.log_file.empty()) {
    CefString(&settings->log_file) = config_.log_file;
  }

  if (!config_.cache_path.empty()) {
    const std::string browser_cache =
        file_util::JoinPath(config_.cache_path, "browser_cache");
    CefString(&settings->root_cache_path) = browser_cache;
    CefString(&settings->cache_path) = browser_cache;
    settings->persist_session_cookies = true;
  }

  settings->remote_debugging_port = config_.remote_debugging_port;
}

void EngineContext::PopulateBrowserSettings(
    CefBrowserSettings* settings) const {
  settings->windowless_frame_rate = config_.frame_rate;
}

bool EngineContext::IsContextReady() const {
  return app_->schedule().IsReady();
}

bool EngineContext::ShouldPump() const {
  return app_->schedule().ShouldPump();
}

uint64_t EngineContext::TimeUntilNextPumpUs() const {
  return app_->schedule().TimeUntilNextPumpUs();
}

void EngineContext::PumpMessages() {
  DCHECK(thread_checker_.CalledOnValidThread());
  app_->schedule().Pump(base::BindOnce(&CefDoMessageLoopWork));
}

}  // namespace tabhost
