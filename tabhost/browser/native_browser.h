// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_NATIVE_BROWSER_H_
#define TABHOST_BROWSER_NATIVE_BROWSER_H_
#pragma once

#include <string>

#include "include/base/cef_ref_counted.h"
#include "include/internal/cef_types_wrappers.h"

namespace tabhost {

// Edit commands that act on the focused frame.
enum class EditCommand {
  kUndo,
  kRedo,
  kCut,
  kCopy,
  kPaste,
  kDelete,
  kSelectAll,
};

// A live engine browser. Owned by the BrowserRegistry while it is open; other
// code only borrows it for the duration of a single call. Methods may be
// called on the host UI thread only.
class NativeBrowser : public base::RefCountedThreadSafe<NativeBrowser> {
 public:
  NativeBrowser(const NativeBrowser&) = delete;
  NativeBrowser& operator=(const NativeBrowser&) = delete;

  // Engine-assigned identifier, unique for the lifetime of the process.
  virtual int GetIdentifier() const = 0;

  // Requests that the browser close. With |force_close| no unload handlers are
  // given a chance to cancel.
  virtual void CloseBrowser(bool force_close) = 0;

  // Navigation.
  virtual void LoadURL(const std::string& url) = 0;
  virtual void Reload() = 0;
  virtual void ReloadIgnoreCache() = 0;
  virtual void StopLoad() = 0;
  virtual void GoBack() = 0;
  virtual void GoForward() = 0;

  virtual void ExecuteEditCommand(EditCommand command) = 0;

  // Find in page. Results are reported asynchronously as FindResult events.
  virtual void Find(const std::string& text,
                    bool forward,
                    bool match_case,
                    bool find_next) = 0;
  virtual void StopFinding(bool clear_selection) = 0;

  // Off-screen view state.
  virtual void WasResized() = 0;
  virtual void WasHidden(bool hidden) = 0;
  virtual void NotifyScreenInfoChanged() = 0;
  virtual void Invalidate() = 0;
  virtual void SetFocus(bool focus) = 0;
  virtual void SetAudioMuted(bool muted) = 0;

  virtual void ShowDevTools() = 0;
  virtual void CloseDevTools() = 0;

  // Input.
  virtual void SendMouseClickEvent(const CefMouseEvent& event,
                                   cef_mouse_button_type_t type,
                                   bool mouse_up,
                                   int click_count) = 0;
  virtual void SendMouseMoveEvent(const CefMouseEvent& event,
                                  bool mouse_leave) = 0;
  virtual void SendMouseWheelEvent(const CefMouseEvent& event,
                                   int delta_x,
                                   int delta_y) = 0;
  virtual void SendKeyEvent(const CefKeyEvent& event) = 0;
  virtual void ImeCommitText(const std::string& text) = 0;

 protected:
  friend class base::RefCountedThreadSafe<NativeBrowser>;

  NativeBrowser() = default;
  virtual ~NativeBrowser() = default;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_NATIVE_BROWSER_H_
