// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_BROWSER_EVENT_H_
#define TABHOST_BROWSER_BROWSER_EVENT_H_
#pragma once

#include <stdint.h>

#include <string>
#include <vector>

namespace tabhost {

// Editing capabilities reported with a context menu request.
enum ContextMenuEditFlags {
  CONTEXT_MENU_CAN_UNDO = 1 << 0,
  CONTEXT_MENU_CAN_REDO = 1 << 1,
  CONTEXT_MENU_CAN_CUT = 1 << 2,
  CONTEXT_MENU_CAN_COPY = 1 << 3,
  CONTEXT_MENU_CAN_PASTE = 1 << 4,
  CONTEXT_MENU_CAN_DELETE = 1 << 5,
  CONTEXT_MENU_CAN_SELECT_ALL = 1 << 6,
};

// What was under the pointer when a context menu was requested. Coordinates
// are in view pixels.
struct ContextMenuInfo {
  int x = 0;
  int y = 0;
  std::string link_url;
  std::string selection_text;
  std::string page_url;
  bool is_editable = false;
  // Combination of ContextMenuEditFlags values.
  int edit_flags = 0;
};

struct FindResultInfo {
  int identifier = 0;
  int count = 0;
  int active_match_ordinal = 0;
  bool final_update = false;
};

struct DownloadInfo {
  uint32_t id = 0;
  std::string url;
  std::string original_url;
  std::string suggested_file_name;
  // Empty until the engine has picked the target path.
  std::string full_path;
  int64_t current_speed = 0;
  // -1 if the total size is unknown.
  int percent_complete = -1;
  int64_t total_bytes = 0;
  int64_t received_bytes = 0;
  bool is_in_progress = false;
  bool is_complete = false;
  bool is_canceled = false;
  bool is_interrupted = false;
};

// A notification produced by an engine callback for one tab. Only the fields
// relevant to |type| are set.
struct BrowserEvent {
  enum class Type {
    kAddressChanged,
    kTitleChanged,
    kFaviconUrlChanged,
    kLoadingStateChanged,
    kLoadingProgress,
    kFrameReady,
    kBrowserCreated,
    kPopupRequested,
    kOpenNewTab,
    kLoadError,
    kContextMenuRequested,
    kFindResult,
    kDownloadUpdated,
  };

  static BrowserEvent AddressChanged(const std::string& url);
  static BrowserEvent TitleChanged(const std::string& title);
  static BrowserEvent FaviconUrlChanged(const std::vector<std::string>& urls);
  static BrowserEvent LoadingStateChanged(bool is_loading,
                                          bool can_go_back,
                                          bool can_go_forward);
  static BrowserEvent LoadingProgress(double progress);
  static BrowserEvent FrameReady();
  static BrowserEvent BrowserCreated(int browser_id);
  static BrowserEvent PopupRequested(const std::string& url);
  static BrowserEvent OpenNewTab(const std::string& url, bool foreground);
  static BrowserEvent LoadError(const std::string& url,
                                int error_code,
                                const std::string& error_text);
  static BrowserEvent ContextMenuRequested(const ContextMenuInfo& info);
  static BrowserEvent FindResult(const FindResultInfo& info);
  static BrowserEvent DownloadUpdated(const DownloadInfo& info);

  Type type = Type::kFrameReady;

  // kAddressChanged, kPopupRequested, kOpenNewTab, kLoadError.
  std::string url;
  // kTitleChanged.
  std::string title;
  // kFaviconUrlChanged.
  std::vector<std::string> favicon_urls;
  // kLoadingStateChanged.
  bool is_loading = false;
  bool can_go_back = false;
  bool can_go_forward = false;
  // kLoadingProgress, in [0, 1].
  double progress = 0.0;
  // kBrowserCreated.
  int browser_id = 0;
  // kOpenNewTab.
  bool foreground = true;
  // kLoadError.
  int error_code = 0;
  std::string error_text;

  ContextMenuInfo context_menu;
  FindResultInfo find_result;
  DownloadInfo download;
};

// Returns a short name for |type|, for logging.
const char* BrowserEventTypeName(BrowserEvent::Type type);

}  // namespace tabhost

#endif  // TABHOST_BROWSER_BROWSER_EVENT_H_
