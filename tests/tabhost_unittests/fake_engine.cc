// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tests/tabhost_unittests/fake_engine.h"

namespace tabhost {

FakeNativeBrowser::FakeNativeBrowser(int identifier)
    : identifier_(identifier) {}

FakeNativeBrowser::~FakeNativeBrowser() = default;

void FakeNativeBrowser::CloseBrowser(bool force_close) {
  ++close_count;
  last_force_close = force_close;
}

void FakeNativeBrowser::LoadURL(const std::string& url) {
  loaded_urls.push_back(url);
}

void FakeNativeBrowser::ExecuteEditCommand(EditCommand command) {
  edit_commands.push_back(command);
}

void FakeNativeBrowser::Find(const std::string& text,
                             bool forward,
                             bool match_case,
                             bool find_next) {
  find_texts.push_back(text);
}

void FakeNativeBrowser::WasHidden(bool hidden_state) {
  ++was_hidden_count;
  hidden = hidden_state;
}

void FakeNativeBrowser::SetAudioMuted(bool muted_state) {
  ++set_muted_count;
  muted = muted_state;
}

FakeEngine::FakeEngine() = default;

scoped_refptr<NativeBrowser> FakeEngine::CreateBrowser(
    const BrowserCreateParams& params) {
  ++create_count;
  create_params.push_back(params);
  if (fail_create) {
    return nullptr;
  }

  scoped_refptr<FakeNativeBrowser> browser(
      new FakeNativeBrowser(next_browser_id++));
  browsers.push_back(browser);
  return browser;
}

FakeNativeBrowser* FakeEngine::last_browser() const {
  return browsers.empty() ? nullptr : browsers.back().get();
}

}  // namespace tabhost
