// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/browser_event.h"

#include "include/base/cef_logging.h"

namespace tabhost {

namespace {

BrowserEvent MakeEvent(BrowserEvent::Type type) {
  BrowserEvent event;
  event.type = type;
  return event;
}

}  // namespace

// static
BrowserEvent BrowserEvent::AddressChanged(const std::string& url) {
  BrowserEvent event = MakeEvent(Type::kAddressChanged);
  event.url = url;
  return event;
}

// static
BrowserEvent BrowserEvent::TitleChanged(const std::string& title) {
  BrowserEvent event = MakeEvent(Type::kTitleChanged);
  event.title = title;
  return event;
}

// static
BrowserEvent BrowserEvent::FaviconUrlChanged(
    const std::vector<std::string>& urls) {
  BrowserEvent event = MakeEvent(Type::kFaviconUrlChanged);
  event.favicon_urls = urls;
  return event;
}

// static
BrowserEvent BrowserEvent::LoadingStateChanged(bool is_loading,
                                               bool can_go_back,
                                               bool can_go_forward) {
  BrowserEvent event = MakeEvent(Type::kLoadingStateChanged);
  event.is_loading = is_loading;
  event.can_go_back = can_go_back;
  event.can_go_forward = can_go_forward;
  return event;
}

// static
BrowserEvent BrowserEvent::LoadingProgress(double progress) {
  BrowserEvent event = MakeEvent(Type::kLoadingProgress);
  event.progress = progress;
  return event;
}

// static
BrowserEvent BrowserEvent::FrameReady() {
  return MakeEvent(Type::kFrameReady);
}

// static
BrowserEvent BrowserEvent::BrowserCreated(int browser_id) {
  BrowserEvent event = MakeEvent(Type::kBrowserCreated);
  event.browser_id = browser_id;
  return event;
}

// static
BrowserEvent BrowserEvent::PopupRequested(const std::string& url) {
  BrowserEvent event = MakeEvent(Type::kPopupRequested);
  event.url = url;
  return event;
}

// static
BrowserEvent BrowserEvent::OpenNewTab(const std::string& url,
                                      bool foreground) {
  BrowserEvent event = MakeEvent(Type::kOpenNewTab);
  event.url = url;
  event.foreground = foreground;
  return event;
}

// static
BrowserEvent BrowserEvent::LoadError(const std::string& url,
                                     int error_code,
                                     const std::string& error_text) {
  BrowserEvent event = MakeEvent(Type::kLoadError);
  event.url = url;
  event.error_code = error_code;
  event.error_text = error_text;
  return event;
}

// static
BrowserEvent BrowserEvent::ContextMenuRequested(const ContextMenuInfo& info) {
  BrowserEvent event = MakeEvent(Type::kContextMenuRequested);
  event.context_menu = info;
  return event;
}

// static
BrowserEvent BrowserEvent::FindResult(const FindResultInfo& info) {
  BrowserEvent event = MakeEvent(Type::kFindResult);
  event.find_result = info;
  return event;
}

// static
BrowserEvent BrowserEvent::DownloadUpdated(const DownloadInfo& info) {
  BrowserEvent event = MakeEvent(Type::kDownloadUpdated);
  event.download = info;
  return event;
}

const char* BrowserEventTypeName(BrowserEvent::Type type) {
  switch (type) {
    case BrowserEvent::Type::kAddressChanged:
      return "AddressChanged";
    case BrowserEvent::Type::kTitleChanged:
      return "TitleChanged";
    case BrowserEvent::Type::kFaviconUrlChanged:
      return "FaviconUrlChanged";
    case BrowserEvent::Type::kLoadingStateChanged:
      return "LoadingStateChanged";
    case BrowserEvent::Type::kLoadingProgress:
      return "LoadingProgress";
    case BrowserEvent::Type::kFrameReady:
      return "FrameReady";
    case BrowserEvent::Type::kBrowserCreated:
      return "BrowserCreated";
    case BrowserEvent::Type::kPopupRequested:
      return "PopupRequested";
    case BrowserEvent::Type::kOpenNewTab:
      return "OpenNewTab";
    case BrowserEvent::Type::kLoadError:
      return "LoadError";
    case BrowserEvent::Type::kContextMenuRequested:
      return "ContextMenuRequested";
    case BrowserEvent::Type::kFindResult:
      return "FindResult";
    case BrowserEvent::Type::kDownloadUpdated:
      return "DownloadUpdated";
  }
  NOTREACHED();
  return "Unknown";
}

}  // namespace tabhost
