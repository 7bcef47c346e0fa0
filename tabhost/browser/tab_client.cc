// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/tab_client.h"

#include <string.h>

#include <ios>

#include "include/base/cef_logging.h"
#include "include/wrapper/cef_helpers.h"
#include "tabhost/browser/download_util.h"

namespace tabhost {

namespace {

int GetEditFlags(cef_context_menu_edit_state_flags_t flags) {
  int result = 0;
  if (flags & CM_EDITFLAG_CAN_UNDO) {
    result |= CONTEXT_MENU_CAN_UNDO;
  }
  if (flags & CM_EDITFLAG_CAN_REDO) {
    result |= CONTEXT_MENU_CAN_REDO;
  }
  if (flags & CM_EDITFLAG_CAN_CUT) {
    result |= CONTEXT_MENU_CAN_CUT;
  }
  if (flags & CM_EDITFLAG_CAN_COPY) {
    result |= CONTEXT_MENU_CAN_COPY;
  }
  if (flags & CM_EDITFLAG_CAN_PASTE) {
    result |= CONTEXT_MENU_CAN_PASTE;
  }
  if (flags & CM_EDITFLAG_CAN_DELETE) {
    result |= CONTEXT_MENU_CAN_DELETE;
  }
  if (flags & CM_EDITFLAG_CAN_SELECT_ALL) {
    result |= CONTEXT_MENU_CAN_SELECT_ALL;
  }
  return result;
}

DownloadInfo GetDownloadInfo(CefRefPtr<CefDownloadItem> item) {
  DownloadInfo info;
  info.id = item->GetId();
  info.url = item->GetURL().ToString();
  info.original_url = item->GetOriginalUrl().ToString();
  info.suggested_file_name = item->GetSuggestedFileName().ToString();
  info.full_path = item->GetFullPath().ToString();
  info.current_speed = item->GetCurrentSpeed();
  info.percent_complete = item->GetPercentComplete();
  info.total_bytes = item->GetTotalBytes();
  info.received_bytes = item->GetReceivedBytes();
  info.is_in_progress = item->IsInProgress();
  info.is_complete = item->IsComplete();
  info.is_canceled = item->IsCanceled();
  info.is_interrupted = item->IsInterrupted();
  return info;
}

}  // namespace

TabClient::TabClient(EventSender sender,
                     scoped_refptr<RenderState> render_state,
                     const std::string& download_dir)
    : sender_(std::move(sender)),
      render_state_(std::move(render_state)),
      download_dir_(download_dir) {
  DCHECK(render_state_);
}

void TabClient::OnAddressChange(CefRefPtr<CefBrowser> browser,
                                CefRefPtr<CefFrame> frame,
                                const CefString& url) {
  if (frame && !frame->IsMain()) {
    return;
  }
  if (url.empty()) {
    return;
  }
  sender_.Send(BrowserEvent::AddressChanged(url));
}

void TabClient::OnTitleChange(CefRefPtr<CefBrowser> browser,
                              const CefString& title) {
  sender_.Send(BrowserEvent::TitleChanged(title));
}

void TabClient::OnFaviconURLChange(CefRefPtr<CefBrowser> browser,
                                   const std::vector<CefString>& icon_urls) {
  std::vector<std::string> urls;
  urls.reserve(icon_urls.size());
  for (const auto& icon_url : icon_urls) {
    urls.push_back(icon_url);
  }
  sender_.Send(BrowserEvent::FaviconUrlChanged(urls));
}

void TabClient::OnLoadingProgressChange(CefRefPtr<CefBrowser> browser,
                                        double progress) {
  sender_.Send(BrowserEvent::LoadingProgress(progress));
}

bool TabClient::OnConsoleMessage(CefRefPtr<CefBrowser> browser,
                                 cef_log_severity_t level,
                                 const CefString& message,
                                 const CefString& source,
                                 int line) {
  VLOG(1) << "console: " << message.ToString() << " (" << source.ToString()
          << ":" << line << ")";
  // Allow the engine to log the message as well.
  return false;
}

void TabClient::OnLoadingStateChange(CefRefPtr<CefBrowser> browser,
                                     bool isLoading,
                                     bool canGoBack,
                                     bool canGoForward) {
  sender_.Send(
      BrowserEvent::LoadingStateChanged(isLoading, canGoBack, canGoForward));
}

void TabClient::OnLoadError(CefRefPtr<CefBrowser> browser,
                            CefRefPtr<CefFrame> frame,
                            CefLoadHandler::ErrorCode errorCode,
                            const CefString& errorText,
                            const CefString& failedUrl) {
  // Aborted navigations are replaced by another navigation and are not shown.
  if (errorCode == ERR_ABORTED) {
    return;
  }
  if (frame && !frame->IsMain()) {
    return;
  }
  sender_.Send(BrowserEvent::LoadError(failedUrl, static_cast<int>(errorCode),
                                       errorText));
}

void TabClient::GetViewRect(CefRefPtr<CefBrowser> browser, CefRect& rect) {
  int width = 0;
  int height = 0;
  render_state_->GetViewSize(&width, &height);
  rect = CefRect(0, 0, width, height);
}

bool TabClient::GetScreenPoint(CefRefPtr<CefBrowser> browser,
                               int viewX,
                               int viewY,
                               int& screenX,
                               int& screenY) {
  // The view is the whole screen from the engine's point of view.
  screenX = viewX;
  screenY = viewY;
  return true;
}

bool TabClient::GetScreenInfo(CefRefPtr<CefBrowser> browser,
                              CefScreenInfo& screen_info) {
  CefRect view_rect;
  GetViewRect(browser, view_rect);

  screen_info.device_scale_factor = render_state_->GetScaleFactor();
  screen_info.rect = view_rect;
  screen_info.available_rect = view_rect;
  return true;
}

void TabClient::OnPaint(CefRefPtr<CefBrowser> browser,
                        CefRenderHandler::PaintElementType type,
                        const CefRenderHandler::RectList& dirtyRects,
                        const void* buffer,
                        int width,
                        int height) {
  // Select and dropdown widgets are not composited.
  if (type != PET_VIEW) {
    return;
  }
  if (!buffer || width <= 0 || height <= 0) {
    return;
  }

  auto frame = std::make_shared<FrameBuffer>();
  frame->width = width;
  frame->height = height;
  frame->scale_factor = render_state_->GetScaleFactor();
  const size_t size = static_cast<size_t>(width) * height * 4;
  frame->pixels.resize(size);
  memcpy(frame->pixels.data(), buffer, size);

  render_state_->SetFrame(std::move(frame));
  sender_.Send(BrowserEvent::FrameReady());
}

bool TabClient::OnBeforePopup(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefFrame> frame,
    int popup_id,
    const CefString& target_url,
    const CefString& target_frame_name,
    CefLifeSpanHandler::WindowOpenDisposition target_disposition,
    bool user_gesture,
    const CefPopupFeatures& popupFeatures,
    CefWindowInfo& windowInfo,
    CefRefPtr<CefClient>& client,
    CefBrowserSettings& settings,
    CefRefPtr<CefDictionaryValue>& extra_info,
    bool* no_javascript_access) {
  CEF_REQUIRE_UI_THREAD();

  const std::string url = target_url;
  if (url.empty()) {
    return true;
  }

  // Popups never become separate browsers. They are opened as tabs instead.
  switch (target_disposition) {
    case CEF_WOD_CURRENT_TAB:
      sender_.Send(BrowserEvent::PopupRequested(url));
      break;
    case CEF_WOD_NEW_BACKGROUND_TAB:
      sender_.Send(BrowserEvent::OpenNewTab(url, false));
      break;
    default:
      sender_.Send(BrowserEvent::OpenNewTab(url, true));
      break;
  }
  return true;
}

void TabClient::OnAfterCreated(CefRefPtr<CefBrowser> browser) {
  CEF_REQUIRE_UI_THREAD();
  sender_.Send(BrowserEvent::BrowserCreated(browser->GetIdentifier()));
}

void TabClient::OnBeforeClose(CefRefPtr<CefBrowser> browser) {
  CEF_REQUIRE_UI_THREAD();
  VLOG(1) << "Browser " << browser->GetIdentifier() << " closed";
}

bool TabClient::OnOpenURLFromTab(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefFrame> frame,
    const CefString& target_url,
    CefRequestHandler::WindowOpenDisposition target_disposition,
    bool user_gesture) {
  if (target_disposition == CEF_WOD_NEW_FOREGROUND_TAB ||
      target_disposition == CEF_WOD_NEW_BACKGROUND_TAB) {
    sender_.Send(BrowserEvent::OpenNewTab(
        target_url, target_disposition == CEF_WOD_NEW_FOREGROUND_TAB));
    // Cancel the navigation in this tab.
    return true;
  }
  return false;
}

bool TabClient::RunContextMenu(CefRefPtr<CefBrowser> browser,
                               CefRefPtr<CefFrame> frame,
                               CefRefPtr<CefContextMenuParams> params,
                               CefRefPtr<CefMenuModel> model,
                               CefRefPtr<CefRunContextMenuCallback> callback) {
  ContextMenuInfo info;
  info.x = params->GetXCoord();
  info.y = params->GetYCoord();
  info.link_url = params->GetLinkUrl();
  info.selection_text = params->GetSelectionText();
  info.page_url = params->GetPageUrl();
  info.is_editable = params->IsEditable();
  info.edit_flags = GetEditFlags(params->GetEditStateFlags());
  sender_.Send(BrowserEvent::ContextMenuRequested(info));

  // The host draws its own menu.
  callback->Cancel();
  return true;
}

void TabClient::OnFindResult(CefRefPtr<CefBrowser> browser,
                             int identifier,
                             int count,
                             const CefRect& selectionRect,
                             int activeMatchOrdinal,
                             bool finalUpdate) {
  FindResultInfo info;
  info.identifier = identifier;
  info.count = count;
  info.active_match_ordinal = activeMatchOrdinal;
  info.final_update = finalUpdate;
  sender_.Send(BrowserEvent::FindResult(info));
}

bool TabClient::OnBeforeDownload(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefDownloadItem> download_item,
    const CefString& suggested_name,
    CefRefPtr<CefBeforeDownloadCallback> callback) {
  CEF_REQUIRE_UI_THREAD();

  const std::string file_name = download_util::ChooseFileName(
      suggested_name, download_item->GetSuggestedFileName(),
      download_item->GetURL());
  const std::string path =
      download_util::GetUniquePath(download_dir_, file_name);

  LOG(INFO) << "Downloading " << download_item->GetURL().ToString() << " to "
            << path;
  callback->Continue(path, false);
  return true;
}

void TabClient::OnDownloadUpdated(CefRefPtr<CefBrowser> browser,
                                  CefRefPtr<CefDownloadItem> download_item,
                                  CefRefPtr<CefDownloadItemCallback> callback) {
  CEF_REQUIRE_UI_THREAD();
  sender_.Send(BrowserEvent::DownloadUpdated(GetDownloadInfo(download_item)));
}

bool TabClient::OnRequestMediaAccessPermission(
    CefRefPtr<CefBrowser> browser,
    CefRefPtr<CefFrame> frame,
    const CefString& requesting_origin,
    uint32_t requested_permissions,
    CefRefPtr<CefMediaAccessCallback> callback) {
  LOG(INFO) << "Granting media access to " << requesting_origin.ToString()
            << " (permissions 0x" << std::hex << requested_permissions << ")";
  callback->Continue(requested_permissions);
  return true;
}

bool TabClient::OnShowPermissionPrompt(
    CefRefPtr<CefBrowser> browser,
    uint64_t prompt_id,
    const CefString& requesting_origin,
    uint32_t requested_permissions,
    CefRefPtr<CefPermissionPromptCallback> callback) {
  // Required for Widevine playback.
  if (requested_permissions & CEF_PERMISSION_TYPE_PROTECTED_MEDIA_IDENTIFIER) {
    LOG(INFO) << "Granting protected media identifier to "
              << requesting_origin.ToString() << " (prompt " << prompt_id
              << ")";
    callback->Continue(CEF_PERMISSION_RESULT_ACCEPT);
    return true;
  }

  // Everything else gets the engine's default handling.
  VLOG(1) << "Permission prompt from " << requesting_origin.ToString()
          << " (permissions 0x" << std::hex << requested_permissions
          << std::dec << ", prompt " << prompt_id << ")";
  return false;
}

void TabClient::OnDismissPermissionPrompt(
    CefRefPtr<CefBrowser> browser,
    uint64_t prompt_id,
    cef_permission_request_result_t result) {
  VLOG(1) << "Permission prompt " << prompt_id << " dismissed with result "
          << result;
}

}  // namespace tabhost
