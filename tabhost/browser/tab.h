// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_TAB_H_
#define TABHOST_BROWSER_TAB_H_
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "tabhost/browser/browser_event.h"
#include "tabhost/browser/browser_registry.h"
#include "tabhost/browser/engine.h"
#include "tabhost/browser/event_channel.h"
#include "tabhost/browser/render_state.h"
#include "tabhost/common/app_config.h"

namespace tabhost {

// Notification from a Tab to its owner, produced while draining the tab's
// events on the host thread.
struct TabEvent {
  enum class Type {
    kAddressChanged,
    kTitleChanged,
    kLoadingStateChanged,
    kFrameReady,
    // The tab wants |url| loaded. Without a browser the owner should create
    // one once a viewport is known.
    kNavigateToUrl,
    kOpenNewTab,
    kFaviconChanged,
    kLoadError,
    kContextMenuOpen,
    kFindResult,
    kDownloadUpdated,
  };

  explicit TabEvent(Type type) : type(type) {}

  Type type;

  // kAddressChanged, kNavigateToUrl, kOpenNewTab, kFaviconChanged and
  // kLoadError.
  std::string url;
  // kTitleChanged.
  std::string title;
  // kOpenNewTab.
  bool foreground = true;
  // kLoadError.
  int error_code = 0;
  std::string error_text;

  ContextMenuInfo context_menu;
  FindResultInfo find_result;
  DownloadInfo download;
};

// One browser tab. Owns the navigation state cached from engine callbacks and
// the receiving end of the tab's event channel. The engine browser itself is
// owned by the BrowserRegistry and only borrowed per call.
//
// States:
//   kNoHandle -> kHandleCreated -> kVisible <-> kHidden
//   kVisible/kHidden -> kSuspended -> back to the prior visibility
//   any -> kClosed
//
// All methods must be called on the host UI thread.
class Tab {
 public:
  enum class State {
    kNoHandle,
    kHandleCreated,
    kVisible,
    kHidden,
    kSuspended,
    kClosed,
  };

  // Receives TabEvents. May close the Tab from within OnTabEvent, after which
  // the remaining queued events are discarded, but must not destroy it.
  class Delegate {
   public:
    virtual void OnTabEvent(Tab* tab, const TabEvent& event) = 0;

   protected:
    virtual ~Delegate() {}
  };

  static const char kDefaultUrl[];
  static const char kDefaultTitle[];

  // |engine| and |registry| must outlive this object. |delegate| may be null.
  Tab(int id,
      const AppConfig& config,
      Engine* engine,
      BrowserRegistry* registry,
      Delegate* delegate);

  // Closes the browser if one is still open.
  ~Tab();

  Tab(const Tab&) = delete;
  Tab& operator=(const Tab&) = delete;

  // Creates the engine browser and loads |initial_url|, or the cached URL if
  // empty. Returns true without doing anything if a browser already exists.
  // Returns false if the engine is not ready or creation fails; the tab then
  // stays in kNoHandle and creation may be retried. Clears the pending URL on
  // success.
  bool CreateBrowser(const std::string& initial_url);

  // Loads |url|. Without a browser the URL becomes the pending URL and a
  // kNavigateToUrl event asks the owner to create the browser. A suspended tab
  // loads |url| in the background and reports it after Resume().
  void Navigate(const std::string& url);

  void Reload();
  void ReloadIgnoreCache();
  void Stop();

  // Ignored unless the engine reported the matching capability.
  void GoBack();
  void GoForward();

  // Editing commands for the focused frame.
  void ExecuteEditCommand(EditCommand command);
  void Copy() { ExecuteEditCommand(EditCommand::kCopy); }
  void Cut() { ExecuteEditCommand(EditCommand::kCut); }
  void Paste() { ExecuteEditCommand(EditCommand::kPaste); }
  void Undo() { ExecuteEditCommand(EditCommand::kUndo); }
  void Redo() { ExecuteEditCommand(EditCommand::kRedo); }
  void SelectAll() { ExecuteEditCommand(EditCommand::kSelectAll); }
  void Delete() { ExecuteEditCommand(EditCommand::kDelete); }

  void FindInPage(const std::string& text,
                  bool forward,
                  bool match_case,
                  bool find_next);
  void StopFinding(bool clear_selection);

  // View size in logical pixels.
  void SetSize(int width, int height);
  void SetScaleFactor(float scale_factor);
  void SetFocus(bool focus);

  // Shows or hides the tab. While suspended only the visibility restored by
  // Resume() changes.
  void SetHidden(bool hidden);

  // Requests a full repaint.
  void Invalidate();

  void SetAudioMuted(bool muted);

  void ShowDevTools();
  void CloseDevTools();

  void SendMouseClick(const CefMouseEvent& event,
                      cef_mouse_button_type_t type,
                      bool mouse_up,
                      int click_count);
  void SendMouseMove(const CefMouseEvent& event, bool mouse_leave);
  void SendMouseWheel(const CefMouseEvent& event, int delta_x, int delta_y);
  void SendKeyEvent(const CefKeyEvent& event);
  void ImeCommitText(const std::string& text);

  // Hides and mutes the tab but keeps the browser. Idempotent. Ignored unless
  // the tab is visible or hidden.
  void Suspend();

  // Restores the URL, visibility and audio state saved by Suspend().
  // Idempotent.
  void Resume();

  // Removes the browser from the registry, closes it and enters kClosed.
  // Idempotent.
  void CloseBrowser();

  // Applies every queued engine event in arrival order and forwards the
  // resulting TabEvents to the delegate. Events arriving after CloseBrowser(),
  // including ones still queued when the delegate closes the tab, are
  // discarded. Returns the number of events drained.
  size_t DrainEvents();

  // Returns the most recent painted frame, or nullptr.
  std::shared_ptr<const FrameBuffer> current_frame() const;

  int id() const { return id_; }
  State state() const { return state_; }
  std::optional<int> browser_id() const { return browser_id_; }
  bool has_browser() const { return browser_id_.has_value(); }
  bool is_suspended() const { return state_ == State::kSuspended; }

  const std::string& url() const { return url_; }
  const std::string& title() const { return title_; }
  const std::string& favicon_url() const { return favicon_url_; }
  bool is_loading() const { return is_loading_; }
  bool can_go_back() const { return can_go_back_; }
  bool can_go_forward() const { return can_go_forward_; }
  double loading_progress() const { return loading_progress_; }
  bool is_muted() const { return is_muted_; }
  bool is_hidden() const { return hidden_; }

  bool is_new_tab_page() const { return is_new_tab_page_; }
  void set_new_tab_page(bool new_tab_page) { is_new_tab_page_ = new_tab_page; }

  bool is_pinned() const { return is_pinned_; }
  void set_pinned(bool pinned) { is_pinned_ = pinned; }

  const std::string& pending_url() const { return pending_url_; }
  bool has_pending_url() const { return !pending_url_.empty(); }
  void set_pending_url(const std::string& url) { pending_url_ = url; }

  const std::string& suspended_url() const { return suspended_url_; }

 private:
  // Runs |fn| with the registered browser. Returns false if there is none.
  template <typename Fn>
  bool WithBrowser(Fn&& fn) {
    if (!browser_id_) {
      return false;
    }
    return registry_->WithBrowser(*browser_id_, std::forward<Fn>(fn));
  }

  void ApplyEvent(const BrowserEvent& event);
  void Notify(const TabEvent& event);

  const int id_;
  Engine* const engine_;
  BrowserRegistry* const registry_;
  Delegate* const delegate_;
  const std::string download_dir_;

  State state_ = State::kNoHandle;
  std::optional<int> browser_id_;

  EventReceiver receiver_;
  scoped_refptr<RenderState> render_state_;

  std::string url_;
  std::string title_;
  std::string favicon_url_;
  bool is_loading_ = false;
  bool can_go_back_ = false;
  bool can_go_forward_ = false;
  double loading_progress_ = 0.0;
  bool is_muted_ = false;
  bool hidden_ = false;
  bool is_new_tab_page_ = false;
  bool is_pinned_ = false;

  std::string pending_url_;

  // Set while suspended.
  std::string suspended_url_;
  bool hidden_before_suspend_ = false;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_TAB_H_
