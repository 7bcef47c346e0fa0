// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_ENGINE_H_
#define TABHOST_BROWSER_ENGINE_H_
#pragma once

#include <stdint.h>

#include <string>

#include "include/base/cef_ref_counted.h"
#include "include/cef_client.h"
#include "tabhost/browser/native_browser.h"

namespace tabhost {

// Parameters for a new windowless browser.
struct BrowserCreateParams {
  std::string url;
  // Receives every engine callback for the new browser.
  CefRefPtr<CefClient> client;
};

// The engine operations used by tabs and by the message pump scheduler. All
// methods are called on the host UI thread.
class Engine {
 public:
  virtual ~Engine() {}

  // True once the engine context is initialized and until shutdown.
  virtual bool IsContextReady() const = 0;

  // True if the engine asked for message loop work that is now due.
  virtual bool ShouldPump() const = 0;

  // Performs one unit of engine message loop work.
  virtual void PumpMessages() = 0;

  // Microseconds until the engine wants the next pump.
  virtual uint64_t TimeUntilNextPumpUs() const = 0;

  // Creates a browser synchronously. Returns nullptr on failure.
  virtual scoped_refptr<NativeBrowser> CreateBrowser(
      const BrowserCreateParams& params) = 0;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_ENGINE_H_
