// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_TESTS_TABHOST_UNITTESTS_FAKE_ENGINE_H_
#define TABHOST_TESTS_TABHOST_UNITTESTS_FAKE_ENGINE_H_
#pragma once

#include <string>
#include <vector>

#include "tabhost/browser/engine.h"
#include "tabhost/browser/native_browser.h"

namespace tabhost {

// NativeBrowser that records the calls it receives.
class FakeNativeBrowser : public NativeBrowser {
 public:
  explicit FakeNativeBrowser(int identifier);

  // NativeBrowser methods:
  int GetIdentifier() const override { return identifier_; }
  void CloseBrowser(bool force_close) override;
  void LoadURL(const std::string& url) override;
  void Reload() override { ++reload_count; }
  void ReloadIgnoreCache() override { ++reload_ignore_cache_count; }
  void StopLoad() override { ++stop_count; }
  void GoBack() override { ++go_back_count; }
  void GoForward() override { ++go_forward_count; }
  void ExecuteEditCommand(EditCommand command) override;
  void Find(const std::string& text,
            bool forward,
            bool match_case,
            bool find_next) override;
  void StopFinding(bool clear_selection) override { ++stop_finding_count; }
  void WasResized() override { ++was_resized_count; }
  void WasHidden(bool hidden) override;
  void NotifyScreenInfoChanged() override { ++screen_info_changed_count; }
  void Invalidate() override { ++invalidate_count; }
  void SetFocus(bool focus) override { focused = focus; }
  void SetAudioMuted(bool muted) override;
  void ShowDevTools() override { ++show_devtools_count; }
  void CloseDevTools() override { ++close_devtools_count; }
  void SendMouseClickEvent(const CefMouseEvent& event,
                           cef_mouse_button_type_t type,
                           bool mouse_up,
                           int click_count) override {
    ++mouse_click_count;
  }
  void SendMouseMoveEvent(const CefMouseEvent& event,
                          bool mouse_leave) override {
    ++mouse_move_count;
  }
  void SendMouseWheelEvent(const CefMouseEvent& event,
                           int delta_x,
                           int delta_y) override {
    ++mouse_wheel_count;
  }
  void SendKeyEvent(const CefKeyEvent& event) override { ++key_event_count; }
  void ImeCommitText(const std::string& text) override {
    ime_text.push_back(text);
  }

  int close_count = 0;
  bool last_force_close = false;
  std::vector<std::string> loaded_urls;
  int reload_count = 0;
  int reload_ignore_cache_count = 0;
  int stop_count = 0;
  int go_back_count = 0;
  int go_forward_count = 0;
  std::vector<EditCommand> edit_commands;
  std::vector<std::string> find_texts;
  int stop_finding_count = 0;
  int was_resized_count = 0;
  int was_hidden_count = 0;
  bool hidden = false;
  int screen_info_changed_count = 0;
  int invalidate_count = 0;
  bool focused = false;
  int set_muted_count = 0;
  bool muted = false;
  int show_devtools_count = 0;
  int close_devtools_count = 0;
  int mouse_click_count = 0;
  int mouse_move_count = 0;
  int mouse_wheel_count = 0;
  int key_event_count = 0;
  std::vector<std::string> ime_text;

 private:
  ~FakeNativeBrowser() override;

  const int identifier_;
};

// Engine whose readiness, pump schedule and browser creation are controlled
// by the test.
class FakeEngine : public Engine {
 public:
  FakeEngine();

  FakeEngine(const FakeEngine&) = delete;
  FakeEngine& operator=(const FakeEngine&) = delete;

  // Engine methods:
  bool IsContextReady() const override { return ready; }
  bool ShouldPump() const override { return should_pump; }
  void PumpMessages() override { ++pump_count; }
  uint64_t TimeUntilNextPumpUs() const override { return time_until_next_us; }
  scoped_refptr<NativeBrowser> CreateBrowser(
      const BrowserCreateParams& params) override;

  // Browser returned by the most recent successful CreateBrowser call.
  FakeNativeBrowser* last_browser() const;

  bool ready = true;
  bool should_pump = false;
  uint64_t time_until_next_us = 0;
  bool fail_create = false;

  int pump_count = 0;
  int create_count = 0;
  int next_browser_id = 1;
  std::vector<BrowserCreateParams> create_params;
  std::vector<scoped_refptr<FakeNativeBrowser>> browsers;
};

}  // namespace tabhost

#endif  // TABHOST_TESTS_TABHOST_UNITTESTS_FAKE_ENGINE_H_
