// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include <stdint.h>

#include <vector>

#include "gtest/gtest.h"
#include "tabhost/browser/event_channel.h"
#include "tabhost/browser/render_state.h"
#include "tabhost/browser/tab_client.h"

using namespace tabhost;

namespace {

class TestMediaAccessCallback : public CefMediaAccessCallback {
 public:
  TestMediaAccessCallback() = default;

  void Continue(uint32_t allowed_permissions) override {
    ++continue_count;
    allowed = allowed_permissions;
  }
  void Cancel() override { ++cancel_count; }

  int continue_count = 0;
  int cancel_count = 0;
  uint32_t allowed = 0;

 private:
  IMPLEMENT_REFCOUNTING(TestMediaAccessCallback);
};

class TestPermissionPromptCallback : public CefPermissionPromptCallback {
 public:
  TestPermissionPromptCallback() = default;

  void Continue(cef_permission_request_result_t result) override {
    ++continue_count;
    last_result = result;
  }

  int continue_count = 0;
  cef_permission_request_result_t last_result = CEF_PERMISSION_RESULT_IGNORE;

 private:
  IMPLEMENT_REFCOUNTING(TestPermissionPromptCallback);
};

// Owns a TabClient and the receiving end of its channel. Only callbacks that
// do not need a live browser or the engine's UI thread are exercised.
class TabClientTest : public testing::Test {
 protected:
  TabClientTest()
      : receiver_(16),
        render_state_(base::MakeRefCounted<RenderState>()),
        client_(new TabClient(receiver_.CreateSender(),
                              render_state_,
                              std::string())) {}

  std::vector<BrowserEvent> Drain() { return receiver_.Drain(); }

  EventReceiver receiver_;
  scoped_refptr<RenderState> render_state_;
  CefRefPtr<TabClient> client_;
};

}  // namespace

TEST_F(TabClientTest, AddressChange) {
  client_->OnAddressChange(nullptr, nullptr, "https://a.test/");
  // Empty addresses are not reported.
  client_->OnAddressChange(nullptr, nullptr, CefString());

  const std::vector<BrowserEvent>& events = Drain();
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(BrowserEvent::Type::kAddressChanged, events[0].type);
  EXPECT_STREQ("https://a.test/", events[0].url.c_str());
}

TEST_F(TabClientTest, DisplayNotifications) {
  client_->OnTitleChange(nullptr, "Title");
  client_->OnFaviconURLChange(
      nullptr, {CefString("https://a.test/favicon.ico"),
                CefString("https://a.test/icon.png")});
  client_->OnLoadingProgressChange(nullptr, 0.25);

  const std::vector<BrowserEvent>& events = Drain();
  ASSERT_EQ(3U, events.size());
  EXPECT_EQ(BrowserEvent::Type::kTitleChanged, events[0].type);
  EXPECT_STREQ("Title", events[0].title.c_str());
  EXPECT_EQ(BrowserEvent::Type::kFaviconUrlChanged, events[1].type);
  ASSERT_EQ(2U, events[1].favicon_urls.size());
  EXPECT_STREQ("https://a.test/favicon.ico",
               events[1].favicon_urls[0].c_str());
  EXPECT_EQ(BrowserEvent::Type::kLoadingProgress, events[2].type);
  EXPECT_EQ(0.25, events[2].progress);
}

TEST_F(TabClientTest, ConsoleMessageIsNotConsumed) {
  EXPECT_FALSE(client_->OnConsoleMessage(nullptr, LOGSEVERITY_INFO, "hello",
                                         "https://a.test/app.js", 12));
  EXPECT_TRUE(Drain().empty());
}

TEST_F(TabClientTest, LoadingStateChange) {
  client_->OnLoadingStateChange(nullptr, true, true, false);

  const std::vector<BrowserEvent>& events = Drain();
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(BrowserEvent::Type::kLoadingStateChanged, events[0].type);
  EXPECT_TRUE(events[0].is_loading);
  EXPECT_TRUE(events[0].can_go_back);
  EXPECT_FALSE(events[0].can_go_forward);
}

TEST_F(TabClientTest, LoadErrorIgnoresAbort) {
  client_->OnLoadError(nullptr, nullptr, ERR_ABORTED, "aborted",
                       "https://a.test/");
  client_->OnLoadError(nullptr, nullptr, ERR_NAME_NOT_RESOLVED,
                       "net::ERR_NAME_NOT_RESOLVED", "https://missing.test/");

  const std::vector<BrowserEvent>& events = Drain();
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(BrowserEvent::Type::kLoadError, events[0].type);
  EXPECT_EQ(static_cast<int>(ERR_NAME_NOT_RESOLVED), events[0].error_code);
  EXPECT_STREQ("https://missing.test/", events[0].url.c_str());
}

TEST_F(TabClientTest, ViewRectFollowsRenderState) {
  render_state_->SetViewSize(1280, 720);
  render_state_->SetScaleFactor(2.0f);

  CefRect rect;
  client_->GetViewRect(nullptr, rect);
  EXPECT_EQ(0, rect.x);
  EXPECT_EQ(0, rect.y);
  EXPECT_EQ(1280, rect.width);
  EXPECT_EQ(720, rect.height);

  CefScreenInfo screen_info;
  EXPECT_TRUE(client_->GetScreenInfo(nullptr, screen_info));
  EXPECT_EQ(2.0f, screen_info.device_scale_factor);
  EXPECT_EQ(1280, screen_info.rect.width);

  int screen_x = 0;
  int screen_y = 0;
  EXPECT_TRUE(client_->GetScreenPoint(nullptr, 10, 20, screen_x, screen_y));
  EXPECT_EQ(10, screen_x);
  EXPECT_EQ(20, screen_y);
}

TEST_F(TabClientTest, PaintStoresViewFrames) {
  const int kWidth = 4;
  const int kHeight = 2;
  std::vector<uint8_t> pixels(kWidth * kHeight * 4, 0x7f);
  CefRenderHandler::RectList dirty;
  dirty.push_back(CefRect(0, 0, kWidth, kHeight));

  // Popup widgets are not composited.
  client_->OnPaint(nullptr, PET_POPUP, dirty, pixels.data(), kWidth, kHeight);
  EXPECT_FALSE(render_state_->GetFrame());
  EXPECT_TRUE(Drain().empty());

  client_->OnPaint(nullptr, PET_VIEW, dirty, pixels.data(), kWidth, kHeight);
  std::shared_ptr<const FrameBuffer> frame = render_state_->GetFrame();
  ASSERT_TRUE(frame);
  EXPECT_EQ(kWidth, frame->width);
  EXPECT_EQ(kHeight, frame->height);
  ASSERT_EQ(pixels.size(), frame->pixels.size());
  EXPECT_EQ(0x7f, frame->pixels[0]);

  const std::vector<BrowserEvent>& events = Drain();
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(BrowserEvent::Type::kFrameReady, events[0].type);
}

TEST_F(TabClientTest, OpenUrlFromTab) {
  // Navigations in the same tab proceed normally.
  EXPECT_FALSE(client_->OnOpenURLFromTab(nullptr, nullptr, "https://a.test/",
                                         CEF_WOD_CURRENT_TAB, true));

  EXPECT_TRUE(client_->OnOpenURLFromTab(nullptr, nullptr, "https://b.test/",
                                        CEF_WOD_NEW_BACKGROUND_TAB, true));
  EXPECT_TRUE(client_->OnOpenURLFromTab(nullptr, nullptr, "https://c.test/",
                                        CEF_WOD_NEW_FOREGROUND_TAB, true));

  const std::vector<BrowserEvent>& events = Drain();
  ASSERT_EQ(2U, events.size());
  EXPECT_EQ(BrowserEvent::Type::kOpenNewTab, events[0].type);
  EXPECT_STREQ("https://b.test/", events[0].url.c_str());
  EXPECT_FALSE(events[0].foreground);
  EXPECT_EQ(BrowserEvent::Type::kOpenNewTab, events[1].type);
  EXPECT_STREQ("https://c.test/", events[1].url.c_str());
  EXPECT_TRUE(events[1].foreground);
}

TEST_F(TabClientTest, FindResult) {
  client_->OnFindResult(nullptr, 3, 12, CefRect(), 4, true);

  const std::vector<BrowserEvent>& events = Drain();
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(BrowserEvent::Type::kFindResult, events[0].type);
  EXPECT_EQ(3, events[0].find_result.identifier);
  EXPECT_EQ(12, events[0].find_result.count);
  EXPECT_EQ(4, events[0].find_result.active_match_ordinal);
  EXPECT_TRUE(events[0].find_result.final_update);
}

TEST_F(TabClientTest, EventsAfterTabGoneAreDropped) {
  CefRefPtr<TabClient> client;
  {
    EventReceiver receiver(4);
    client =
        new TabClient(receiver.CreateSender(), render_state_, std::string());
  }

  // The client may outlive its tab. Callbacks must stay harmless.
  client->OnTitleChange(nullptr, "Late");
  client->OnLoadingStateChange(nullptr, false, false, false);
}

TEST_F(TabClientTest, MediaAccessIsGranted) {
  EXPECT_EQ(client_.get(), client_->GetPermissionHandler().get());

  CefRefPtr<TestMediaAccessCallback> callback = new TestMediaAccessCallback();
  const uint32_t requested = CEF_MEDIA_PERMISSION_DEVICE_AUDIO_CAPTURE |
                             CEF_MEDIA_PERMISSION_DEVICE_VIDEO_CAPTURE;
  EXPECT_TRUE(client_->OnRequestMediaAccessPermission(
      nullptr, nullptr, "https://meet.test", requested, callback.get()));

  // Exactly the requested permissions are allowed.
  EXPECT_EQ(1, callback->continue_count);
  EXPECT_EQ(0, callback->cancel_count);
  EXPECT_EQ(requested, callback->allowed);
  EXPECT_TRUE(Drain().empty());
}

TEST_F(TabClientTest, ProtectedMediaPromptIsAccepted) {
  CefRefPtr<TestPermissionPromptCallback> callback =
      new TestPermissionPromptCallback();
  EXPECT_TRUE(client_->OnShowPermissionPrompt(
      nullptr, 7, "https://video.test",
      CEF_PERMISSION_TYPE_PROTECTED_MEDIA_IDENTIFIER |
          CEF_PERMISSION_TYPE_NOTIFICATIONS,
      callback.get()));
  EXPECT_EQ(1, callback->continue_count);
  EXPECT_EQ(CEF_PERMISSION_RESULT_ACCEPT, callback->last_result);

  client_->OnDismissPermissionPrompt(nullptr, 7, CEF_PERMISSION_RESULT_ACCEPT);
  EXPECT_TRUE(Drain().empty());
}

TEST_F(TabClientTest, OtherPromptsUseDefaultHandling) {
  CefRefPtr<TestPermissionPromptCallback> callback =
      new TestPermissionPromptCallback();
  EXPECT_FALSE(client_->OnShowPermissionPrompt(
      nullptr, 8, "https://a.test", CEF_PERMISSION_TYPE_GEOLOCATION,
      callback.get()));
  EXPECT_EQ(0, callback->continue_count);
}
