// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_ENGINE_CEF_H_
#define TABHOST_BROWSER_ENGINE_CEF_H_
#pragma once

#include "tabhost/browser/engine.h"
#include "tabhost/browser/engine_context.h"

namespace tabhost {

// Engine implementation that drives CEF through an EngineContext.
class EngineCef : public Engine {
 public:
  // |context| must outlive this object.
  explicit EngineCef(EngineContext* context);

  EngineCef(const EngineCef&) = delete;
  EngineCef& operator=(const EngineCef&) = delete;

  // Engine methods:
  bool IsContextReady() const override;
  bool ShouldPump() const override;
  void PumpMessages() override;
  uint64_t TimeUntilNextPumpUs() const override;
  scoped_refptr<NativeBrowser> CreateBrowser(
      const BrowserCreateParams& params) override;

 private:
  EngineContext* const context_;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_ENGINE_CEF_H_
