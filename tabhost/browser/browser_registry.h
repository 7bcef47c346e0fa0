// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_BROWSER_REGISTRY_H_
#define TABHOST_BROWSER_BROWSER_REGISTRY_H_
#pragma once

#include <map>

#include "include/base/cef_lock.h"
#include "include/base/cef_ref_counted.h"
#include "tabhost/browser/native_browser.h"

namespace tabhost {

// Owns every live NativeBrowser, keyed by browser identifier. A browser is
// present if and only if it is open and not yet closed by the host. The lock
// only protects the map; browser methods are never called while it is held.
//
// This object is thread safe.
class BrowserRegistry {
 public:
  // Returns the process-wide registry.
  static BrowserRegistry* Get();

  BrowserRegistry();
  ~BrowserRegistry();

  BrowserRegistry(const BrowserRegistry&) = delete;
  BrowserRegistry& operator=(const BrowserRegistry&) = delete;

  // Takes ownership of |browser| under |browser_id|. Returns false and logs an
  // error if |browser| is null or |browser_id| is already registered.
  bool Insert(int browser_id, scoped_refptr<NativeBrowser> browser);

  // Removes |browser_id| and force-closes the browser. Returns false if no
  // such browser was registered. Safe to call more than once.
  bool RemoveAndClose(int browser_id);

  // Removes and force-closes every registered browser. The registry is empty
  // when this returns. Returns the number of browsers closed.
  size_t CloseAll();

  // Calls |fn| with the browser registered under |browser_id|. The lock is
  // released before |fn| runs and |fn| must not keep the pointer. Returns
  // false if no such browser is registered.
  template <typename Fn>
  bool WithBrowser(int browser_id, Fn&& fn) const {
    scoped_refptr<NativeBrowser> browser = Find(browser_id);
    if (!browser) {
      return false;
    }
    fn(browser.get());
    return true;
  }

  bool Contains(int browser_id) const;
  size_t size() const;

 private:
  using BrowserMap = std::map<int, scoped_refptr<NativeBrowser>>;

  scoped_refptr<NativeBrowser> Find(int browser_id) const;

  mutable base::Lock lock_;

  // Must be protected by |lock_|.
  BrowserMap browsers_;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_BROWSER_REGISTRY_H_
