// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/tab.h"

#include "include/base/cef_logging.h"
#include "tabhost/browser/tab_client.h"

namespace tabhost {

namespace {

const char* GetStateName(Tab::State state) {
  switch (state) {
    case Tab::State::kNoHandle:
      return "NoHandle";
    case Tab::State::kHandleCreated:
      return "HandleCreated";
    case Tab::State::kVisible:
      return "Visible";
    case Tab::State::kHidden:
      return "Hidden";
    case Tab::State::kSuspended:
      return "Suspended";
    case Tab::State::kClosed:
      return "Closed";
  }
  NOTREACHED();
  return "Unknown";
}

}  // namespace

const char Tab::kDefaultUrl[] = "about:blank";
const char Tab::kDefaultTitle[] = "New Tab";

Tab::Tab(int id,
         const AppConfig& config,
         Engine* engine,
         BrowserRegistry* registry,
         Delegate* delegate)
    : id_(id),
      engine_(engine),
      registry_(registry),
      delegate_(delegate),
      download_dir_(config.download_dir),
      receiver_(config.event_queue_capacity),
      render_state_(base::MakeRefCounted<RenderState>()),
      url_(kDefaultUrl),
      title_(kDefaultTitle) {
  DCHECK(engine_);
  DCHECK(registry_);
}

Tab::~Tab() {
  CloseBrowser();
}

bool Tab::CreateBrowser(const std::string& initial_url) {
  if (state_ == State::kClosed) {
    LOG(ERROR) << "Tab " << id_ << " is closed; not creating a browser";
    return false;
  }
  if (browser_id_) {
    return true;
  }
  if (!engine_->IsContextReady()) {
    LOG(ERROR) << "Tab " << id_
               << ": engine context is not ready, deferring browser creation";
    return false;
  }

  const std::string url = initial_url.empty() ? url_ : initial_url;

  BrowserCreateParams params;
  params.url = url;
  params.client =
      new TabClient(receiver_.CreateSender(), render_state_, download_dir_);

  scoped_refptr<NativeBrowser> browser = engine_->CreateBrowser(params);
  if (!browser) {
    LOG(ERROR) << "Tab " << id_ << ": failed to create a browser for " << url;
    return false;
  }

  const int browser_id = browser->GetIdentifier();
  if (!registry_->Insert(browser_id, browser)) {
    // The registry already logged the reason.
    browser->CloseBrowser(true);
    return false;
  }

  browser_id_ = browser_id;
  state_ = State::kHandleCreated;
  url_ = url;
  is_loading_ = true;
  pending_url_.clear();

  browser->WasResized();
  if (hidden_) {
    browser->WasHidden(true);
  }
  if (is_muted_) {
    browser->SetAudioMuted(true);
  }
  state_ = hidden_ ? State::kHidden : State::kVisible;

  VLOG(1) << "Tab " << id_ << " created browser " << browser_id << " for "
          << url;
  return true;
}

void Tab::Navigate(const std::string& url) {
  if (state_ == State::kClosed) {
    VLOG(1) << "Tab " << id_ << " is closed; ignoring navigation to " << url;
    return;
  }

  is_new_tab_page_ = false;

  if (browser_id_) {
    if (WithBrowser(
            [&url](NativeBrowser* browser) { browser->LoadURL(url); })) {
      url_ = url;
      is_loading_ = true;
      // Address updates are ignored while suspended, so Resume() must restore
      // the new URL.
      if (state_ == State::kSuspended) {
        suspended_url_ = url;
      }
    }
    return;
  }

  url_ = url;
  pending_url_ = url;

  TabEvent event(TabEvent::Type::kNavigateToUrl);
  event.url = url;
  Notify(event);
}

void Tab::Reload() {
  if (WithBrowser([](NativeBrowser* browser) { browser->Reload(); })) {
    is_loading_ = true;
  }
}

void Tab::ReloadIgnoreCache() {
  if (WithBrowser(
          [](NativeBrowser* browser) { browser->ReloadIgnoreCache(); })) {
    is_loading_ = true;
  }
}

void Tab::Stop() {
  if (WithBrowser([](NativeBrowser* browser) { browser->StopLoad(); })) {
    is_loading_ = false;
  }
}

void Tab::GoBack() {
  if (!can_go_back_) {
    VLOG(1) << "Tab " << id_ << " cannot go back";
    return;
  }
  WithBrowser([](NativeBrowser* browser) { browser->GoBack(); });
}

void Tab::GoForward() {
  if (!can_go_forward_) {
    VLOG(1) << "Tab " << id_ << " cannot go forward";
    return;
  }
  WithBrowser([](NativeBrowser* browser) { browser->GoForward(); });
}

void Tab::ExecuteEditCommand(EditCommand command) {
  WithBrowser([command](NativeBrowser* browser) {
    browser->ExecuteEditCommand(command);
  });
}

void Tab::FindInPage(const std::string& text,
                     bool forward,
                     bool match_case,
                     bool find_next) {
  if (text.empty()) {
    StopFinding(true);
    return;
  }
  WithBrowser([&](NativeBrowser* browser) {
    browser->Find(text, forward, match_case, find_next);
  });
}

void Tab::StopFinding(bool clear_selection) {
  WithBrowser([clear_selection](NativeBrowser* browser) {
    browser->StopFinding(clear_selection);
  });
}

void Tab::SetSize(int width, int height) {
  render_state_->SetViewSize(width, height);
  WithBrowser([](NativeBrowser* browser) { browser->WasResized(); });
}

void Tab::SetScaleFactor(float scale_factor) {
  if (render_state_->GetScaleFactor() == scale_factor) {
    return;
  }
  render_state_->SetScaleFactor(scale_factor);
  WithBrowser([](NativeBrowser* browser) {
    browser->NotifyScreenInfoChanged();
    browser->WasResized();
  });
}

void Tab::SetFocus(bool focus) {
  WithBrowser([focus](NativeBrowser* browser) { browser->SetFocus(focus); });
}

void Tab::SetHidden(bool hidden) {
  hidden_ = hidden;

  if (state_ == State::kSuspended) {
    hidden_before_suspend_ = hidden;
    return;
  }
  if (state_ != State::kVisible && state_ != State::kHidden) {
    return;
  }

  WithBrowser([hidden](NativeBrowser* browser) {
    browser->WasHidden(hidden);
    if (!hidden) {
      browser->Invalidate();
    }
  });
  state_ = hidden ? State::kHidden : State::kVisible;
}

void Tab::Invalidate() {
  WithBrowser([](NativeBrowser* browser) { browser->Invalidate(); });
}

void Tab::SetAudioMuted(bool muted) {
  is_muted_ = muted;

  // Suspended tabs stay muted until resumed.
  if (state_ == State::kSuspended) {
    return;
  }
  WithBrowser(
      [muted](NativeBrowser* browser) { browser->SetAudioMuted(muted); });
}

void Tab::ShowDevTools() {
  WithBrowser([](NativeBrowser* browser) { browser->ShowDevTools(); });
}

void Tab::CloseDevTools() {
  WithBrowser([](NativeBrowser* browser) { browser->CloseDevTools(); });
}

void Tab::SendMouseClick(const CefMouseEvent& event,
                         cef_mouse_button_type_t type,
                         bool mouse_up,
                         int click_count) {
  WithBrowser([&](NativeBrowser* browser) {
    browser->SendMouseClickEvent(event, type, mouse_up, click_count);
  });
}

void Tab::SendMouseMove(const CefMouseEvent& event, bool mouse_leave) {
  WithBrowser([&](NativeBrowser* browser) {
    browser->SendMouseMoveEvent(event, mouse_leave);
  });
}

void Tab::SendMouseWheel(const CefMouseEvent& event,
                         int delta_x,
                         int delta_y) {
  WithBrowser([&](NativeBrowser* browser) {
    browser->SendMouseWheelEvent(event, delta_x, delta_y);
  });
}

void Tab::SendKeyEvent(const CefKeyEvent& event) {
  WithBrowser(
      [&event](NativeBrowser* browser) { browser->SendKeyEvent(event); });
}

void Tab::ImeCommitText(const std::string& text) {
  WithBrowser(
      [&text](NativeBrowser* browser) { browser->ImeCommitText(text); });
}

void Tab::Suspend() {
  if (state_ == State::kSuspended) {
    return;
  }
  if (state_ != State::kVisible && state_ != State::kHidden) {
    VLOG(1) << "Tab " << id_ << " cannot be suspended in state "
            << GetStateName(state_);
    return;
  }

  suspended_url_ = url_;
  hidden_before_suspend_ = (state_ == State::kHidden);

  WithBrowser([](NativeBrowser* browser) {
    browser->WasHidden(true);
    browser->SetAudioMuted(true);
  });
  state_ = State::kSuspended;
}

void Tab::Resume() {
  if (state_ != State::kSuspended) {
    return;
  }

  if (!browser_id_ || !registry_->Contains(*browser_id_)) {
    LOG(ERROR) << "Tab " << id_
               << " is suspended but its browser is no longer registered";
  }

  url_ = suspended_url_;
  suspended_url_.clear();
  state_ = hidden_before_suspend_ ? State::kHidden : State::kVisible;

  const bool hidden = hidden_before_suspend_;
  const bool muted = is_muted_;
  WithBrowser([hidden, muted](NativeBrowser* browser) {
    if (!hidden) {
      browser->WasHidden(false);
      browser->Invalidate();
    }
    browser->SetAudioMuted(muted);
  });
}

void Tab::CloseBrowser() {
  if (state_ == State::kClosed) {
    return;
  }

  if (browser_id_) {
    registry_->RemoveAndClose(*browser_id_);
    browser_id_.reset();
  }
  render_state_->ClearFrame();
  suspended_url_.clear();
  is_loading_ = false;
  state_ = State::kClosed;
}

size_t Tab::DrainEvents() {
  const std::vector<BrowserEvent> events = receiver_.Drain();

  // Late callbacks from a closed browser are discarded.
  if (state_ == State::kClosed) {
    return events.size();
  }

  for (const auto& event : events) {
    // The delegate may close the tab while events are applied.
    if (state_ == State::kClosed) {
      break;
    }
    ApplyEvent(event);
  }
  return events.size();
}

std::shared_ptr<const FrameBuffer> Tab::current_frame() const {
  return render_state_->GetFrame();
}

void Tab::ApplyEvent(const BrowserEvent& event) {
  const bool suspended = (state_ == State::kSuspended);

  switch (event.type) {
    case BrowserEvent::Type::kAddressChanged: {
      if (suspended) {
        break;
      }
      url_ = event.url;
      is_new_tab_page_ = false;
      TabEvent tab_event(TabEvent::Type::kAddressChanged);
      tab_event.url = event.url;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kTitleChanged: {
      if (suspended) {
        break;
      }
      title_ = event.title;
      TabEvent tab_event(TabEvent::Type::kTitleChanged);
      tab_event.title = event.title;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kFaviconUrlChanged: {
      if (suspended) {
        break;
      }
      favicon_url_ =
          event.favicon_urls.empty() ? std::string() : event.favicon_urls[0];
      TabEvent tab_event(TabEvent::Type::kFaviconChanged);
      tab_event.url = favicon_url_;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kLoadingStateChanged:
      is_loading_ = event.is_loading;
      can_go_back_ = event.can_go_back;
      can_go_forward_ = event.can_go_forward;
      Notify(TabEvent(TabEvent::Type::kLoadingStateChanged));
      break;
    case BrowserEvent::Type::kLoadingProgress:
      loading_progress_ = event.progress;
      break;
    case BrowserEvent::Type::kFrameReady:
      Notify(TabEvent(TabEvent::Type::kFrameReady));
      break;
    case BrowserEvent::Type::kBrowserCreated:
      VLOG(1) << "Tab " << id_ << " browser " << event.browser_id
              << " is ready";
      break;
    case BrowserEvent::Type::kPopupRequested: {
      TabEvent tab_event(TabEvent::Type::kNavigateToUrl);
      tab_event.url = event.url;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kOpenNewTab: {
      TabEvent tab_event(TabEvent::Type::kOpenNewTab);
      tab_event.url = event.url;
      tab_event.foreground = event.foreground;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kLoadError: {
      LOG(WARNING) << "Tab " << id_ << " failed to load " << event.url << ": "
                   << event.error_text << " (" << event.error_code << ")";
      TabEvent tab_event(TabEvent::Type::kLoadError);
      tab_event.url = event.url;
      tab_event.error_code = event.error_code;
      tab_event.error_text = event.error_text;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kContextMenuRequested: {
      TabEvent tab_event(TabEvent::Type::kContextMenuOpen);
      tab_event.context_menu = event.context_menu;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kFindResult: {
      TabEvent tab_event(TabEvent::Type::kFindResult);
      tab_event.find_result = event.find_result;
      Notify(tab_event);
      break;
    }
    case BrowserEvent::Type::kDownloadUpdated: {
      TabEvent tab_event(TabEvent::Type::kDownloadUpdated);
      tab_event.download = event.download;
      Notify(tab_event);
      break;
    }
  }
}

void Tab::Notify(const TabEvent& event) {
  if (delegate_) {
    delegate_->OnTabEvent(this, event);
  }
}

}  // namespace tabhost
