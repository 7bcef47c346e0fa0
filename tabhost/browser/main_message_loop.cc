// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/main_message_loop.h"

#include "include/base/cef_logging.h"
#include "include/wrapper/cef_closure_task.h"

namespace tabhost {

namespace {

MainMessageLoop* g_main_message_loop = nullptr;

}  // namespace

MainMessageLoop::MainMessageLoop() {
  DCHECK(!g_main_message_loop);
  g_main_message_loop = this;
}

MainMessageLoop::~MainMessageLoop() {
  g_main_message_loop = nullptr;
}

// static
MainMessageLoop* MainMessageLoop::Get() {
  DCHECK(g_main_message_loop);
  return g_main_message_loop;
}

void MainMessageLoop::PostClosure(base::OnceClosure closure) {
  PostTask(CefCreateClosureTask(std::move(closure)));
}

void MainMessageLoop::PostDelayedClosure(base::OnceClosure closure,
                                         int64_t delay_us) {
  PostDelayedTask(CefCreateClosureTask(std::move(closure)), delay_us);
}

}  // namespace tabhost
