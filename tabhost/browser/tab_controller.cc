// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/tab_controller.h"

#include <algorithm>

#include "include/base/cef_callback.h"
#include "include/base/cef_logging.h"
#include "tabhost/browser/main_message_loop.h"

namespace tabhost {

TabController::TabController(const AppConfig& config,
                             Engine* engine,
                             BrowserRegistry* registry)
    : config_(config), engine_(engine), registry_(registry) {
  DCHECK(engine_);
  DCHECK(registry_);
}

TabController::~TabController() {
  // Stop the scheduler before the tabs go away.
  weak_ptr_factory_.InvalidateWeakPtrs();
  tabs_.clear();
  removed_tabs_.clear();
}

Tab* TabController::AddTab() {
  Tab* tab = InsertTab();
  tab->set_new_tab_page(true);
  SwitchToTab(tabs_.size() - 1);
  return tab;
}

Tab* TabController::OpenUrl(const std::string& url) {
  Tab* tab = InsertTab();

  // The tab is not active yet, so this only records the pending URL.
  tab->Navigate(url);

  SwitchToTab(IndexOf(tab));
  return tab;
}

Tab* TabController::OpenUrlInBackground(const std::string& url) {
  Tab* tab = InsertTab();
  tab->SetHidden(true);
  tab->Navigate(url);
  NotifyTabsChanged();
  return tab;
}

void TabController::SetViewport(int width, int height, float scale_factor) {
  REQUIRE_MAIN_THREAD();

  if (width <= 0 || height <= 0) {
    VLOG(1) << "Ignoring empty viewport " << width << "x" << height;
    return;
  }

  has_viewport_ = true;
  viewport_width_ = width;
  viewport_height_ = height;
  viewport_scale_factor_ = scale_factor > 0.0f ? scale_factor : 1.0f;

  for (const auto& tab : tabs_) {
    if (tab->has_browser()) {
      tab->SetScaleFactor(viewport_scale_factor_);
      tab->SetSize(viewport_width_, viewport_height_);
    }
  }

  MaybeCreateActiveBrowser();
}

bool TabController::SwitchToTab(size_t index) {
  REQUIRE_MAIN_THREAD();

  if (index >= tabs_.size()) {
    return false;
  }

  if (index != active_index_ && active_index_ < tabs_.size()) {
    Tab* previous = tabs_[active_index_].get();
    previous->SetFocus(false);
    previous->SetHidden(true);
  }

  active_index_ = index;
  ActivateCurrentTab();
  NotifyTabsChanged();
  return true;
}

bool TabController::CloseTab(size_t index) {
  REQUIRE_MAIN_THREAD();

  if (index >= tabs_.size()) {
    return false;
  }

  Tab* tab = tabs_[index].get();
  if (tab->is_pinned()) {
    VLOG(1) << "Not closing pinned tab " << tab->id();
    return false;
  }

  RememberClosedTab(*tab);
  tab->CloseBrowser();
  RemoveTab(index);

  if (tabs_.empty()) {
    active_index_ = 0;
    AddTab();
    return true;
  }

  if (index < active_index_) {
    --active_index_;
  } else if (index == active_index_) {
    active_index_ = std::min(active_index_, tabs_.size() - 1);
    ActivateCurrentTab();
  }

  NotifyTabsChanged();
  return true;
}

void TabController::CloseOtherTabs(size_t index) {
  REQUIRE_MAIN_THREAD();

  if (index >= tabs_.size()) {
    return;
  }

  Tab* keep = tabs_[index].get();
  Tab* previous_active = active_tab();

  for (size_t i = tabs_.size(); i-- > 0;) {
    Tab* tab = tabs_[i].get();
    if (tab == keep || tab->is_pinned()) {
      continue;
    }
    if (tab == previous_active) {
      previous_active = nullptr;
    }
    RememberClosedTab(*tab);
    tab->CloseBrowser();
    RemoveTab(i);
  }

  if (previous_active && previous_active != keep) {
    previous_active->SetFocus(false);
    previous_active->SetHidden(true);
  }

  active_index_ = IndexOf(keep);
  ActivateCurrentTab();
  NotifyTabsChanged();
}

bool TabController::ReopenClosedTab() {
  if (closed_tabs_.empty()) {
    return false;
  }

  const std::string url = closed_tabs_.back();
  closed_tabs_.pop_back();
  OpenUrl(url);
  return true;
}

void TabController::PinTab(size_t index) {
  Tab* tab = tab_at(index);
  if (!tab || tab->is_pinned()) {
    return;
  }
  tab->set_pinned(true);
  SortPinnedFirst();
  NotifyTabsChanged();
}

void TabController::UnpinTab(size_t index) {
  Tab* tab = tab_at(index);
  if (!tab || !tab->is_pinned()) {
    return;
  }
  tab->set_pinned(false);
  SortPinnedFirst();
  NotifyTabsChanged();
}

void TabController::SuspendTab(size_t index) {
  if (Tab* tab = tab_at(index)) {
    tab->Suspend();
  }
}

void TabController::ResumeTab(size_t index) {
  if (Tab* tab = tab_at(index)) {
    tab->Resume();
  }
}

size_t TabController::DrainAllTabs() {
  REQUIRE_MAIN_THREAD();

  size_t drained = 0;
  ++dispatch_depth_;

  // Handlers may add, close or reorder tabs while draining. Tabs added here
  // are drained in the next cycle.
  std::vector<Tab*> tabs;
  tabs.reserve(tabs_.size());
  for (const auto& tab : tabs_) {
    tabs.push_back(tab.get());
  }
  for (Tab* tab : tabs) {
    if (tab->state() != Tab::State::kClosed) {
      drained += tab->DrainEvents();
    }
  }

  --dispatch_depth_;

  if (creation_deferred_) {
    MaybeCreateActiveBrowser();
  }
  return drained;
}

void TabController::CloseAllBrowsers() {
  REQUIRE_MAIN_THREAD();

  for (const auto& tab : tabs_) {
    tab->CloseBrowser();
  }
  const size_t closed = registry_->CloseAll();
  VLOG(1) << "Closed " << closed << " remaining browser(s)";
}

Tab* TabController::tab_at(size_t index) const {
  return index < tabs_.size() ? tabs_[index].get() : nullptr;
}

Tab* TabController::active_tab() const {
  return tab_at(active_index_);
}

base::WeakPtr<TabController> TabController::GetWeakPtr() {
  return weak_ptr_factory_.GetWeakPtr();
}

void TabController::OnTabEvent(Tab* tab, const TabEvent& event) {
  ++dispatch_depth_;

  switch (event.type) {
    case TabEvent::Type::kNavigateToUrl:
      if (tab->has_browser()) {
        tab->Navigate(event.url);
      } else if (tab == active_tab()) {
        CreateBrowserForTab(tab);
      }
      break;
    case TabEvent::Type::kOpenNewTab:
      if (event.foreground) {
        OpenUrl(event.url);
      } else {
        OpenUrlInBackground(event.url);
      }
      break;
    default:
      break;
  }

  if (observer_) {
    observer_->OnTabEvent(tab, event);
  }

  --dispatch_depth_;
}

Tab* TabController::InsertTab() {
  // Unpinned tabs always follow the pinned ones, so appending is enough.
  tabs_.push_back(std::make_unique<Tab>(next_tab_id_++, config_, engine_,
                                        registry_, this));
  return tabs_.back().get();
}

bool TabController::CreateBrowserForTab(Tab* tab) {
  if (!has_viewport_) {
    VLOG(1) << "Deferring browser creation for tab " << tab->id()
            << " until a viewport is known";
    return false;
  }
  if (!engine_->IsContextReady()) {
    VLOG(1) << "Deferring browser creation for tab " << tab->id()
            << " until the engine is ready";
    creation_deferred_ = true;
    // The pump is needed for the engine to become ready.
    StartPump();
    return false;
  }

  tab->SetScaleFactor(viewport_scale_factor_);
  tab->SetSize(viewport_width_, viewport_height_);

  const std::string url =
      tab->has_pending_url() ? tab->pending_url() : tab->url();
  if (!tab->CreateBrowser(url)) {
    return false;
  }

  tab->SetFocus(true);
  tab->Invalidate();
  StartPump();
  return true;
}

void TabController::MaybeCreateActiveBrowser() {
  creation_deferred_ = false;

  Tab* tab = active_tab();
  if (!tab || tab->has_browser() || tab->state() == Tab::State::kClosed) {
    return;
  }
  CreateBrowserForTab(tab);
}

void TabController::ActivateCurrentTab() {
  Tab* tab = active_tab();
  if (!tab) {
    return;
  }

  if (tab->is_suspended()) {
    tab->Resume();
  }
  tab->SetHidden(false);

  if (!tab->has_browser()) {
    CreateBrowserForTab(tab);
    return;
  }

  if (has_viewport_) {
    tab->SetScaleFactor(viewport_scale_factor_);
    tab->SetSize(viewport_width_, viewport_height_);
  }
  tab->SetFocus(true);
}

size_t TabController::IndexOf(const Tab* tab) const {
  for (size_t i = 0; i < tabs_.size(); ++i) {
    if (tabs_[i].get() == tab) {
      return i;
    }
  }
  return tabs_.size();
}

void TabController::RemoveTab(size_t index) {
  std::unique_ptr<Tab> tab = std::move(tabs_[index]);
  tabs_.erase(tabs_.begin() + index);

  if (dispatch_depth_ == 0) {
    return;
  }

  // The tab may still be on the stack.
  if (removed_tabs_.empty()) {
    MainMessageLoop::Get()->PostClosure(
        base::BindOnce(&TabController::DeleteRemovedTabs, GetWeakPtr()));
  }
  removed_tabs_.push_back(std::move(tab));
}

void TabController::DeleteRemovedTabs() {
  VLOG(1) << "Deleting " << removed_tabs_.size() << " closed tab(s)";
  removed_tabs_.clear();
}

void TabController::SortPinnedFirst() {
  Tab* active = active_tab();
  std::stable_partition(
      tabs_.begin(), tabs_.end(),
      [](const std::unique_ptr<Tab>& tab) { return tab->is_pinned(); });
  if (active) {
    active_index_ = IndexOf(active);
  }
}

void TabController::RememberClosedTab(const Tab& tab) {
  if (tab.is_new_tab_page() || tab.url().empty()) {
    return;
  }

  closed_tabs_.push_back(tab.url());
  while (closed_tabs_.size() > kMaxClosedTabs) {
    closed_tabs_.pop_front();
  }
}

void TabController::StartPump() {
  if (scheduler_) {
    return;
  }
  scheduler_ = MessagePumpScheduler::Start(engine_, GetWeakPtr(),
                                           config_.pump_min_delay_us,
                                           config_.pump_max_delay_us);
}

void TabController::NotifyTabsChanged() {
  if (observer_) {
    observer_->OnTabsChanged();
  }
}

}  // namespace tabhost
