// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

// Defines all of the command line switches used by tabhost.

#ifndef TABHOST_COMMON_TABHOST_SWITCHES_H_
#define TABHOST_COMMON_TABHOST_SWITCHES_H_
#pragma once

namespace tabhost::switches {

extern const char kUrl[];
extern const char kCachePath[];
extern const char kOffScreenFrameRate[];
extern const char kPumpMinDelayUs[];
extern const char kPumpMaxDelayUs[];
extern const char kEventQueueCapacity[];
extern const char kRemoteDebuggingPort[];
extern const char kLogSeverity[];
extern const char kLogFile[];
extern const char kDownloadDir[];
extern const char kEnableGPU[];

}  // namespace tabhost::switches

#endif  // TABHOST_COMMON_TABHOST_SWITCHES_H_
