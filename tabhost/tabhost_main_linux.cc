// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include <glib-unix.h>
#include <signal.h>
#include <unistd.h>

#include <memory>

#include "include/base/cef_logging.h"
#include "include/cef_app.h"
#include "include/cef_command_line.h"
#include "tabhost/browser/browser_registry.h"
#include "tabhost/browser/download_util.h"
#include "tabhost/browser/engine_cef.h"
#include "tabhost/browser/engine_context.h"
#include "tabhost/browser/main_message_loop_glib.h"
#include "tabhost/browser/tab_controller.h"
#include "tabhost/common/app_config.h"

namespace tabhost {

namespace {

// Off-screen viewport used until a presentation layer reports its own.
const int kViewportWidth = 1280;
const int kViewportHeight = 800;

// Rounds of engine work given to closing browsers before shutdown.
const int kShutdownPumpRounds = 10;

// Logs tab notifications. Stands in for a presentation layer.
class LoggingObserver : public TabController::Observer {
 public:
  LoggingObserver() = default;

  LoggingObserver(const LoggingObserver&) = delete;
  LoggingObserver& operator=(const LoggingObserver&) = delete;

  void OnTabEvent(Tab* tab, const TabEvent& event) override {
    switch (event.type) {
      case TabEvent::Type::kAddressChanged:
        LOG(INFO) << "Tab " << tab->id() << " address: " << event.url;
        break;
      case TabEvent::Type::kTitleChanged:
        LOG(INFO) << "Tab " << tab->id() << " title: " << event.title;
        break;
      case TabEvent::Type::kLoadError:
        LOG(WARNING) << "Tab " << tab->id() << " load error "
                     << event.error_code << " for " << event.url;
        break;
      case TabEvent::Type::kDownloadUpdated:
        if (event.download.is_complete) {
          LOG(INFO) << "Download complete: " << event.download.full_path;
        }
        break;
      default:
        break;
    }
  }

  void OnTabsChanged() override {}
};

gboolean OnTerminationSignal(gpointer user_data) {
  LOG(INFO) << "Termination requested";
  static_cast<MainMessageLoop*>(user_data)->Quit();
  return G_SOURCE_REMOVE;
}

int RunMain(int argc, char* argv[]) {
  CefMainArgs main_args(argc, argv);

  // Parse command-line arguments.
  CefRefPtr<CefCommandLine> command_line = CefCommandLine::CreateCommandLine();
  command_line->InitFromArgv(argc, argv);

  AppConfig config = AppConfig::FromCommandLine(command_line);
  EngineContext context(config);

  // Execute the sub-process logic, if any. This will either return
  // immediately for the browser process or block until the sub-process
  // should exit.
  const int exit_code = context.ExecuteSubprocess(main_args);
  if (exit_code >= 0) {
    return exit_code;
  }

  // Downloads are started on the engine's UI thread, which must not block on
  // creating directories.
  config.download_dir = download_util::GetDownloadDirectory(
      config.download_dir, config.cache_path);
  LOG(INFO) << "Downloads are saved to " << config.download_dir;

  // Create the main message loop object.
  std::unique_ptr<MainMessageLoop> message_loop(new MainMessageLoopGlib);

  if (!context.Initialize(main_args)) {
    return CefGetExitCode();
  }

  if (!context.WaitUntilReady(500)) {
    context.Shutdown();
    return 1;
  }

  EngineCef engine(&context);
  LoggingObserver observer;

  {
    TabController controller(config, &engine, BrowserRegistry::Get());
    controller.set_observer(&observer);

    if (config.initial_urls.empty()) {
      controller.AddTab();
    } else {
      for (const auto& url : config.initial_urls) {
        controller.OpenUrl(url);
      }
    }
    controller.SetViewport(kViewportWidth, kViewportHeight, 1.0f);

    g_unix_signal_add(SIGINT, OnTerminationSignal, message_loop.get());
    g_unix_signal_add(SIGTERM, OnTerminationSignal, message_loop.get());

    // Run the message loop. This will block until Quit() is called.
    message_loop->Run();

    controller.CloseAllBrowsers();
  }

  // Give the engine a chance to finish closing the browsers.
  for (int i = 0; i < kShutdownPumpRounds; ++i) {
    context.PumpMessages();
    usleep(50000);
  }

  context.Shutdown();

  // Release objects in reverse order of creation.
  message_loop.reset();

  return 0;
}

}  // namespace

}  // namespace tabhost

// Program entry point function.
int main(int argc, char* argv[]) {
  return tabhost::RunMain(argc, argv);
}
