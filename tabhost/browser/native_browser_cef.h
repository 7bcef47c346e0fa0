// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_NATIVE_BROWSER_CEF_H_
#define TABHOST_BROWSER_NATIVE_BROWSER_CEF_H_
#pragma once

#include "include/cef_browser.h"
#include "tabhost/browser/native_browser.h"

namespace tabhost {

// NativeBrowser backed by a CEF browser.
class NativeBrowserCef : public NativeBrowser {
 public:
  explicit NativeBrowserCef(CefRefPtr<CefBrowser> browser);

  // NativeBrowser methods:
  int GetIdentifier() const override;
  void CloseBrowser(bool force_close) override;
  void LoadURL(const std::string& url) override;
  void Reload() override;
  void ReloadIgnoreCache() override;
  void StopLoad() override;
  void GoBack() override;
  void GoForward() override;
  void ExecuteEditCommand(EditCommand command) override;
  void Find(const std::string& text,
            bool forward,
            bool match_case,
            bool find_next) override;
  void StopFinding(bool clear_selection) override;
  void WasResized() override;
  void WasHidden(bool hidden) override;
  void NotifyScreenInfoChanged() override;
  void Invalidate() override;
  void SetFocus(bool focus) override;
  void SetAudioMuted(bool muted) override;
  void ShowDevTools() override;
  void CloseDevTools() override;
  void SendMouseClickEvent(const CefMouseEvent& event,
                           cef_mouse_button_type_t type,
                           bool mouse_up,
                           int click_count) override;
  void SendMouseMoveEvent(const CefMouseEvent& event,
                          bool mouse_leave) override;
  void SendMouseWheelEvent(const CefMouseEvent& event,
                           int delta_x,
                           int delta_y) override;
  void SendKeyEvent(const CefKeyEvent& event) override;
  void ImeCommitText(const std::string& text) override;

 private:
  ~NativeBrowserCef() override;

  CefRefPtr<CefBrowserHost> host() const { return browser_->GetHost(); }

  CefRefPtr<CefBrowser> browser_;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_NATIVE_BROWSER_CEF_H_
