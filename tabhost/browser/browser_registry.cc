// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/browser_registry.h"

#include "include/base/cef_logging.h"

namespace tabhost {

// static
BrowserRegistry* BrowserRegistry::Get() {
  // Never destroyed. Engine callbacks may still arrive during process exit.
  static BrowserRegistry* registry = new BrowserRegistry();
  return registry;
}

BrowserRegistry::BrowserRegistry() = default;

BrowserRegistry::~BrowserRegistry() {
  base::AutoLock lock_scope(lock_);
  LOG_IF(WARNING, !browsers_.empty())
      << browsers_.size() << " browser(s) still registered at destruction";
}

bool BrowserRegistry::Insert(int browser_id,
                             scoped_refptr<NativeBrowser> browser) {
  if (!browser) {
    LOG(ERROR) << "Refusing to register a null browser for id " << browser_id;
    return false;
  }

  base::AutoLock lock_scope(lock_);
  const auto result = browsers_.emplace(browser_id, std::move(browser));
  if (!result.second) {
    LOG(ERROR) << "Browser id " << browser_id << " is already registered";
    return false;
  }
  return true;
}

bool BrowserRegistry::RemoveAndClose(int browser_id) {
  scoped_refptr<NativeBrowser> browser;

  {
    base::AutoLock lock_scope(lock_);
    auto it = browsers_.find(browser_id);
    if (it == browsers_.end()) {
      return false;
    }
    browser = std::move(it->second);
    browsers_.erase(it);
  }

  // Closing may call back into the registry.
  browser->CloseBrowser(true);
  return true;
}

size_t BrowserRegistry::CloseAll() {
  BrowserMap browsers;

  {
    base::AutoLock lock_scope(lock_);
    browsers.swap(browsers_);
  }

  for (auto& entry : browsers) {
    entry.second->CloseBrowser(true);
  }

  VLOG(1) << "Closed " << browsers.size() << " browser(s)";
  return browsers.size();
}

bool BrowserRegistry::Contains(int browser_id) const {
  base::AutoLock lock_scope(lock_);
  return browsers_.find(browser_id) != browsers_.end();
}

size_t BrowserRegistry::size() const {
  base::AutoLock lock_scope(lock_);
  return browsers_.size();
}

scoped_refptr<NativeBrowser> BrowserRegistry::Find(int browser_id) const {
  base::AutoLock lock_scope(lock_);
  auto it = browsers_.find(browser_id);
  if (it == browsers_.end()) {
    return nullptr;
  }
  return it->second;
}

}  // namespace tabhost
