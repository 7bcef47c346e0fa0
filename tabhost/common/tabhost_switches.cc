// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/common/tabhost_switches.h"

namespace tabhost::switches {

// This file only contains command-line switches specific to tabhost. Switches
// that CEF and Chromium understand directly (for example
// "remote-debugging-port") are passed through to the engine unchanged.

const char kUrl[] = "url";
const char kCachePath[] = "cache-path";
const char kOffScreenFrameRate[] = "off-screen-frame-rate";
const char kPumpMinDelayUs[] = "pump-min-delay-us";
const char kPumpMaxDelayUs[] = "pump-max-delay-us";
const char kEventQueueCapacity[] = "event-queue-capacity";
const char kRemoteDebuggingPort[] = "remote-debugging-port";
const char kLogSeverity[] = "log-severity";
const char kLogFile[] = "log-file";
const char kDownloadDir[] = "download-dir";
const char kEnableGPU[] = "enable-gpu";

}  // namespace tabhost::switches
