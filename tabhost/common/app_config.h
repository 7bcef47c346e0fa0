// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_COMMON_APP_CONFIG_H_
#define TABHOST_COMMON_APP_CONFIG_H_
#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "include/cef_command_line.h"
#include "include/internal/cef_types.h"

namespace tabhost {

// Process-wide configuration. Populated once at startup from the command line
// and treated as read-only afterwards.
struct AppConfig {
  static constexpr int kDefaultFrameRate = 60;
  static constexpr int64_t kDefaultPumpMinDelayUs = 500;
  static constexpr int64_t kDefaultPumpMaxDelayUs = 4000;
  static constexpr size_t kDefaultEventQueueCapacity = 4096;

  // Builds a configuration from |command_line|. Malformed values are logged
  // and replaced with the defaults.
  static AppConfig FromCommandLine(CefRefPtr<CefCommandLine> command_line);

  // URLs to open at startup. Empty means a single new tab page.
  std::vector<std::string> initial_urls;

  // Root directory for the engine's profile data.
  std::string cache_path;

  // Directory that downloads are written to. Empty selects the default.
  std::string download_dir;

  int frame_rate = kDefaultFrameRate;

  // Bounds for the delay between two message pump cycles.
  int64_t pump_min_delay_us = kDefaultPumpMinDelayUs;
  int64_t pump_max_delay_us = kDefaultPumpMaxDelayUs;

  // Maximum number of undelivered events per tab.
  size_t event_queue_capacity = kDefaultEventQueueCapacity;

  // 0 disables remote debugging.
  int remote_debugging_port = 0;

  cef_log_severity_t log_severity = LOGSEVERITY_WARNING;
  std::string log_file;

  bool enable_gpu = false;
};

// Returns the default cache directory for the current user.
std::string GetDefaultCachePath();

}  // namespace tabhost

#endif  // TABHOST_COMMON_APP_CONFIG_H_
