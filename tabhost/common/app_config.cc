// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/common/app_config.h"

#include <errno.h>
#include <stdlib.h>

#include <algorithm>

#include "include/base/cef_logging.h"
#include "tabhost/common/file_util.h"
#include "tabhost/common/tabhost_switches.h"

namespace tabhost {

namespace {

// Parses the value of |switch_name| as an integer in [min_value, max_value].
// Leaves |value| unchanged if the switch is absent or malformed.
template <typename T>
void ReadIntSwitch(CefRefPtr<CefCommandLine> command_line,
                   const char* switch_name,
                   T min_value,
                   T max_value,
                   T* value) {
  if (!command_line->HasSwitch(switch_name)) {
    return;
  }

  const std::string str = command_line->GetSwitchValue(switch_name);
  char* end = nullptr;
  errno = 0;
  const long long parsed = strtoll(str.c_str(), &end, 10);
  if (str.empty() || errno != 0 || *end != '\0' ||
      parsed < static_cast<long long>(min_value) ||
      parsed > static_cast<long long>(max_value)) {
    LOG(WARNING) << "Ignoring invalid value \"" << str << "\" for --"
                 << switch_name;
    return;
  }
  *value = static_cast<T>(parsed);
}

cef_log_severity_t ParseLogSeverity(const std::string& str) {
  if (str == "verbose") {
    return LOGSEVERITY_VERBOSE;
  }
  if (str == "info") {
    return LOGSEVERITY_INFO;
  }
  if (str == "warning") {
    return LOGSEVERITY_WARNING;
  }
  if (str == "error") {
    return LOGSEVERITY_ERROR;
  }
  if (str == "fatal") {
    return LOGSEVERITY_FATAL;
  }
  if (str == "disable") {
    return LOGSEVERITY_DISABLE;
  }
  LOG(WARNING) << "Unknown log severity \"" << str << "\"";
  return LOGSEVERITY_WARNING;
}

}  // namespace

std::string GetDefaultCachePath() {
  const std::string home = file_util::GetHomeDirectory();
  if (home.empty()) {
    return std::string();
  }
  return file_util::JoinPath(home, ".cache/tabhost");
}

// static
AppConfig AppConfig::FromCommandLine(CefRefPtr<CefCommandLine> command_line) {
  AppConfig config;

  if (command_line->HasSwitch(switches::kUrl)) {
    config.initial_urls.push_back(
        command_line->GetSwitchValue(switches::kUrl));
  }

  // Plain arguments are treated as additional URLs to open.
  CefCommandLine::ArgumentList arguments;
  command_line->GetArguments(arguments);
  for (const auto& argument : arguments) {
    config.initial_urls.push_back(argument);
  }

  if (command_line->HasSwitch(switches::kCachePath)) {
    config.cache_path = command_line->GetSwitchValue(switches::kCachePath);
  } else {
    config.cache_path = GetDefaultCachePath();
  }

  if (command_line->HasSwitch(switches::kDownloadDir)) {
    config.download_dir = command_line->GetSwitchValue(switches::kDownloadDir);
  }

  ReadIntSwitch(command_line, switches::kOffScreenFrameRate, 1, 240,
                &config.frame_rate);
  ReadIntSwitch<int64_t>(command_line, switches::kPumpMinDelayUs, 1,
                         1000 * 1000, &config.pump_min_delay_us);
  ReadIntSwitch<int64_t>(command_line, switches::kPumpMaxDelayUs, 1,
                         1000 * 1000, &config.pump_max_delay_us);
  ReadIntSwitch<size_t>(command_line, switches::kEventQueueCapacity, 1,
                        1 << 20, &config.event_queue_capacity);
  ReadIntSwitch(command_line, switches::kRemoteDebuggingPort, 0, 65535,
                &config.remote_debugging_port);

  if (config.pump_min_delay_us > config.pump_max_delay_us) {
    LOG(WARNING) << "--" << switches::kPumpMinDelayUs << " exceeds --"
                 << switches::kPumpMaxDelayUs << "; swapping";
    std::swap(config.pump_min_delay_us, config.pump_max_delay_us);
  }

  if (command_line->HasSwitch(switches::kLogSeverity)) {
    config.log_severity =
        ParseLogSeverity(command_line->GetSwitchValue(switches::kLogSeverity));
  }
  if (command_line->HasSwitch(switches::kLogFile)) {
    config.log_file = command_line->GetSwitchValue(switches::kLogFile);
  }

  config.enable_gpu = command_line->HasSwitch(switches::kEnableGPU);

  return config;
}

}  // namespace tabhost
