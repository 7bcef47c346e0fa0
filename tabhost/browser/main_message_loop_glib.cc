// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/main_message_loop_glib.h"

#include <algorithm>

#include "include/base/cef_callback.h"
#include "include/base/cef_logging.h"
#include "include/wrapper/cef_closure_task.h"

namespace tabhost {

namespace {

// GSource that runs a single CefTask once its ready time is reached.
struct TaskSource {
  GSource source;
  CefTask* task;
};

gboolean TaskSourceDispatch(GSource* source,
                            GSourceFunc callback,
                            gpointer user_data) {
  TaskSource* task_source = reinterpret_cast<TaskSource*>(source);
  task_source->task->Execute();
  return G_SOURCE_REMOVE;
}

void TaskSourceFinalize(GSource* source) {
  TaskSource* task_source = reinterpret_cast<TaskSource*>(source);
  task_source->task->Release();
  task_source->task = nullptr;
}

// Ready time handling is done by GLib, so no prepare or check is needed.
GSourceFuncs g_task_source_funcs = {
    nullptr, nullptr, TaskSourceDispatch, TaskSourceFinalize,
};

}  // namespace

MainMessageLoopGlib::MainMessageLoopGlib()
    : thread_id_(base::PlatformThread::CurrentId()),
      main_context_(g_main_context_default()) {}

MainMessageLoopGlib::~MainMessageLoopGlib() {
  DCHECK(RunsTasksOnCurrentThread());
  DCHECK(!main_loop_);
}

int MainMessageLoopGlib::Run() {
  DCHECK(RunsTasksOnCurrentThread());

  main_loop_ = g_main_loop_new(main_context_, TRUE);

  // Block until g_main_loop_quit().
  g_main_loop_run(main_loop_);

  // Release GLib resources.
  g_main_loop_unref(main_loop_);
  main_loop_ = nullptr;

  return 0;
}

void MainMessageLoopGlib::Quit() {
  PostTask(CefCreateClosureTask(
      base::BindOnce(&MainMessageLoopGlib::DoQuit, base::Unretained(this))));
}

void MainMessageLoopGlib::PostTask(CefRefPtr<CefTask> task) {
  PostDelayedTask(task, 0);
}

void MainMessageLoopGlib::PostDelayedTask(CefRefPtr<CefTask> task,
                                          int64_t delay_us) {
  GSource* source = g_source_new(&g_task_source_funcs, sizeof(TaskSource));
  TaskSource* task_source = reinterpret_cast<TaskSource*>(source);

  // Released in TaskSourceFinalize.
  task->AddRef();
  task_source->task = task.get();

  const int64_t delay = std::max<int64_t>(delay_us, 0);
  g_source_set_ready_time(source, g_get_monotonic_time() + delay);
  g_source_set_priority(source, G_PRIORITY_DEFAULT);

  // Attaching is thread safe and wakes up the context.
  g_source_attach(source, main_context_);
  g_source_unref(source);
}

bool MainMessageLoopGlib::RunsTasksOnCurrentThread() const {
  return (thread_id_ == base::PlatformThread::CurrentId());
}

void MainMessageLoopGlib::DoQuit() {
  DCHECK(RunsTasksOnCurrentThread());
  if (main_loop_) {
    g_main_loop_quit(main_loop_);
  }
}

}  // namespace tabhost
