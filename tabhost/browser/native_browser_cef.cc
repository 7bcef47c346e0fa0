// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/native_browser_cef.h"

#include "include/base/cef_logging.h"

namespace tabhost {

NativeBrowserCef::NativeBrowserCef(CefRefPtr<CefBrowser> browser)
    : browser_(browser) {
  DCHECK(browser_);
}

NativeBrowserCef::~NativeBrowserCef() = default;

int NativeBrowserCef::GetIdentifier() const {
  return browser_->GetIdentifier();
}

void NativeBrowserCef::CloseBrowser(bool force_close) {
  host()->CloseBrowser(force_close);
}

void NativeBrowserCef::LoadURL(const std::string& url) {
  browser_->GetMainFrame()->LoadURL(url);
}

void NativeBrowserCef::Reload() {
  browser_->Reload();
}

void NativeBrowserCef::ReloadIgnoreCache() {
  browser_->ReloadIgnoreCache();
}

void NativeBrowserCef::StopLoad() {
  browser_->StopLoad();
}

void NativeBrowserCef::GoBack() {
  browser_->GoBack();
}

void NativeBrowserCef::GoForward() {
  browser_->GoForward();
}

void NativeBrowserCef::ExecuteEditCommand(EditCommand command) {
  CefRefPtr<CefFrame> frame = browser_->GetFocusedFrame();
  if (!frame) {
    frame = browser_->GetMainFrame();
  }
  if (!frame) {
    return;
  }

  switch (command) {
    case EditCommand::kUndo:
      frame->Undo();
      break;
    case EditCommand::kRedo:
      frame->Redo();
      break;
    case EditCommand::kCut:
      frame->Cut();
      break;
    case EditCommand::kCopy:
      frame->Copy();
      break;
    case EditCommand::kPaste:
      frame->Paste();
      break;
    case EditCommand::kDelete:
      frame->Delete();
      break;
    case EditCommand::kSelectAll:
      frame->SelectAll();
      break;
  }
}

void NativeBrowserCef::Find(const std::string& text,
                            bool forward,
                            bool match_case,
                            bool find_next) {
  host()->Find(text, forward, match_case, find_next);
}

void NativeBrowserCef::StopFinding(bool clear_selection) {
  host()->StopFinding(clear_selection);
}

void NativeBrowserCef::WasResized() {
  host()->WasResized();
}

void NativeBrowserCef::WasHidden(bool hidden) {
  host()->WasHidden(hidden);
}

void NativeBrowserCef::NotifyScreenInfoChanged() {
  host()->NotifyScreenInfoChanged();
}

void NativeBrowserCef::Invalidate() {
  host()->Invalidate(PET_VIEW);
}

void NativeBrowserCef::SetFocus(bool focus) {
  host()->SetFocus(focus);
}

void NativeBrowserCef::SetAudioMuted(bool muted) {
  host()->SetAudioMuted(muted);
}

void NativeBrowserCef::ShowDevTools() {
  // DevTools always opens in a separate top-level window.
  CefWindowInfo window_info;
  CefBrowserSettings settings;
  host()->ShowDevTools(window_info, nullptr, settings, CefPoint());
}

void NativeBrowserCef::CloseDevTools() {
  host()->CloseDevTools();
}

void NativeBrowserCef::SendMouseClickEvent(const CefMouseEvent& event,
                                           cef_mouse_button_type_t type,
                                           bool mouse_up,
                                           int click_count) {
  host()->SendMouseClickEvent(event, type, mouse_up, click_count);
}

void NativeBrowserCef::SendMouseMoveEvent(const CefMouseEvent& event,
                                          bool mouse_leave) {
  host()->SendMouseMoveEvent(event, mouse_leave);
}

void NativeBrowserCef::SendMouseWheelEvent(const CefMouseEvent& event,
                                           int delta_x,
                                           int delta_y) {
  host()->SendMouseWheelEvent(event, delta_x, delta_y);
}

void NativeBrowserCef::SendKeyEvent(const CefKeyEvent& event) {
  host()->SendKeyEvent(event);
}

void NativeBrowserCef::ImeCommitText(const std::string& text) {
  host()->ImeCommitText(text, CefRange::InvalidRange(), 0);
}

}  // namespace tabhost
