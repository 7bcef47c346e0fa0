// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/engine_cef.h"

#include "include/base/cef_logging.h"
#include "include/cef_browser.h"
#include "tabhost/browser/native_browser_cef.h"

namespace tabhost {

EngineCef::EngineCef(EngineContext* context) : context_(context) {
  DCHECK(context_);
}

bool EngineCef::IsContextReady() const {
  return context_->IsContextReady();
}

bool EngineCef::ShouldPump() const {
  return context_->ShouldPump();
}

void EngineCef::PumpMessages() {
  context_->PumpMessages();
}

uint64_t EngineCef::TimeUntilNextPumpUs() const {
  return context_->TimeUntilNextPumpUs();
}

scoped_refptr<NativeBrowser> EngineCef::CreateBrowser(
    const BrowserCreateParams& params) {
  if (!context_->IsContextReady()) {
    LOG(ERROR) << "Cannot create a browser before the engine is ready";
    return nullptr;
  }

  CefWindowInfo window_info;
  window_info.SetAsWindowless(kNullWindowHandle);

  CefBrowserSettings settings;
  context_->PopulateBrowserSettings(&settings);

  CefRefPtr<CefBrowser> browser = CefBrowserHost::CreateBrowserSync(
      window_info, params.client, params.url, settings, nullptr, nullptr);
  if (!browser) {
    LOG(ERROR) << "CreateBrowserSync failed for " << params.url;
    return nullptr;
  }

  return base::MakeRefCounted<NativeBrowserCef>(browser);
}

}  // namespace tabhost
