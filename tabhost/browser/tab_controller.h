// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_TAB_CONTROLLER_H_
#define TABHOST_BROWSER_TAB_CONTROLLER_H_
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "include/base/cef_weak_ptr.h"
#include "tabhost/browser/browser_registry.h"
#include "tabhost/browser/engine.h"
#include "tabhost/browser/message_pump_scheduler.h"
#include "tabhost/browser/tab.h"
#include "tabhost/common/app_config.h"

namespace tabhost {

// Owns the ordered list of tabs, tracks the active tab and the viewport, and
// creates browsers once a viewport is known. Starts the message pump
// scheduler when the first browser is created. Pinned tabs are always ordered
// before unpinned tabs.
//
// All methods must be called on the main thread.
class TabController : public Tab::Delegate {
 public:
  // Receives notifications for presentation. Methods are called on the main
  // thread.
  class Observer {
   public:
    // Called for every event produced by |tab|. May close tabs, including
    // |tab|. Tabs closed from here are destroyed by a task posted to the main
    // message loop, so |tab| stays valid until this call returns.
    virtual void OnTabEvent(Tab* tab, const TabEvent& event) {}

    // Called when tabs were added, removed, reordered or activated.
    virtual void OnTabsChanged() {}

   protected:
    virtual ~Observer() {}
  };

  // Maximum number of closed tabs remembered for ReopenClosedTab().
  static constexpr size_t kMaxClosedTabs = 25;

  // |engine| and |registry| must outlive this object.
  TabController(const AppConfig& config,
                Engine* engine,
                BrowserRegistry* registry);
  ~TabController() override;

  TabController(const TabController&) = delete;
  TabController& operator=(const TabController&) = delete;

  void set_observer(Observer* observer) { observer_ = observer; }

  // Appends a new tab page and activates it.
  Tab* AddTab();

  // Opens |url| in a new tab and activates it. The browser is created now if
  // a viewport is known, otherwise as soon as one is.
  Tab* OpenUrl(const std::string& url);

  // Opens |url| in a new inactive tab. The browser is created when the tab is
  // first activated.
  Tab* OpenUrlInBackground(const std::string& url);

  // Records the viewport in logical pixels and applies it to every tab with a
  // browser. Creates the active tab's browser if it has none yet. Empty
  // viewports are ignored.
  void SetViewport(int width, int height, float scale_factor);

  // Activates the tab at |index|. Returns false if |index| is out of range.
  bool SwitchToTab(size_t index);

  // Closes the tab at |index|. Pinned tabs are not closed. At least one tab
  // always remains. Returns true if a tab was closed.
  bool CloseTab(size_t index);

  // Closes every unpinned tab except the one at |index|.
  void CloseOtherTabs(size_t index);

  // Reopens the most recently closed tab. Returns false if there is none.
  bool ReopenClosedTab();

  void PinTab(size_t index);
  void UnpinTab(size_t index);

  void SuspendTab(size_t index);
  void ResumeTab(size_t index);

  // Drains the events of every tab. Returns the total number drained.
  size_t DrainAllTabs();

  // Closes every tab's browser and then every browser still in the registry.
  // Call before shutting down the engine.
  void CloseAllBrowsers();

  size_t tab_count() const { return tabs_.size(); }
  Tab* tab_at(size_t index) const;
  Tab* active_tab() const;
  size_t active_index() const { return active_index_; }
  size_t closed_tab_count() const { return closed_tabs_.size(); }
  bool has_viewport() const { return has_viewport_; }
  bool pump_started() const { return scheduler_.get() != nullptr; }
  MessagePumpScheduler* scheduler() const { return scheduler_.get(); }

  base::WeakPtr<TabController> GetWeakPtr();

 private:
  // Tab::Delegate methods:
  void OnTabEvent(Tab* tab, const TabEvent& event) override;

  // Creates a new tab at the end of the unpinned section.
  Tab* InsertTab();

  // Creates the browser for |tab| using the current viewport. Returns false if
  // no viewport is known or creation failed.
  bool CreateBrowserForTab(Tab* tab);

  // Creates the active tab's browser if it has none and a viewport is known.
  void MaybeCreateActiveBrowser();

  // Shows, focuses and if needed creates the browser for the active tab.
  void ActivateCurrentTab();

  // Returns the index of |tab|, or tab_count() if it is not owned here.
  size_t IndexOf(const Tab* tab) const;

  // Removes the tab at |index|. The tab is destroyed now, or later on the main
  // message loop if a tab event is being dispatched.
  void RemoveTab(size_t index);

  // Destroys the tabs removed during event dispatch.
  void DeleteRemovedTabs();

  // Moves pinned tabs in front while keeping the relative order otherwise.
  void SortPinnedFirst();

  void RememberClosedTab(const Tab& tab);
  void StartPump();
  void NotifyTabsChanged();

  const AppConfig config_;
  Engine* const engine_;
  BrowserRegistry* const registry_;
  Observer* observer_ = nullptr;

  std::vector<std::unique_ptr<Tab>> tabs_;
  size_t active_index_ = 0;

  // Depth of nested DrainAllTabs() and OnTabEvent() calls.
  int dispatch_depth_ = 0;

  // Closed tabs waiting for DeleteRemovedTabs().
  std::vector<std::unique_ptr<Tab>> removed_tabs_;
  int next_tab_id_ = 1;

  bool has_viewport_ = false;
  int viewport_width_ = 0;
  int viewport_height_ = 0;
  float viewport_scale_factor_ = 1.0f;

  // True while browser creation for the active tab waits for the engine.
  bool creation_deferred_ = false;

  // URLs of recently closed tabs, oldest first.
  std::deque<std::string> closed_tabs_;

  scoped_refptr<MessagePumpScheduler> scheduler_;

  // Must be the last member.
  base::WeakPtrFactory<TabController> weak_ptr_factory_{this};
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_TAB_CONTROLLER_H_
