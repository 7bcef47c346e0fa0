// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_RENDER_STATE_H_
#define TABHOST_BROWSER_RENDER_STATE_H_
#pragma once

#include <stdint.h>

#include <memory>
#include <vector>

#include "include/base/cef_lock.h"
#include "include/base/cef_ref_counted.h"

namespace tabhost {

// A painted view frame in BGRA order, |width| * |height| * 4 bytes, top-down.
struct FrameBuffer {
  std::vector<uint8_t> pixels;
  int width = 0;
  int height = 0;
  // Device scale factor the frame was painted at.
  float scale_factor = 1.0f;
};

// State shared between a tab on the host thread and its render handler on
// the engine's UI thread. Every value is latest-wins.
//
// This object is thread safe.
class RenderState : public base::RefCountedThreadSafe<RenderState> {
 public:
  static constexpr int kDefaultWidth = 800;
  static constexpr int kDefaultHeight = 600;

  RenderState();

  RenderState(const RenderState&) = delete;
  RenderState& operator=(const RenderState&) = delete;

  // View size in logical (DIP) pixels. Non-positive values are clamped to 1.
  void SetViewSize(int width, int height);
  void GetViewSize(int* width, int* height) const;

  // Non-positive values reset the scale to 1.
  void SetScaleFactor(float scale_factor);
  float GetScaleFactor() const;

  // Replaces the current frame.
  void SetFrame(std::shared_ptr<const FrameBuffer> frame);
  std::shared_ptr<const FrameBuffer> GetFrame() const;
  void ClearFrame();

 private:
  friend class base::RefCountedThreadSafe<RenderState>;

  ~RenderState();

  mutable base::Lock lock_;

  // Must be protected by |lock_|.
  int width_ = kDefaultWidth;
  int height_ = kDefaultHeight;
  float scale_factor_ = 1.0f;
  std::shared_ptr<const FrameBuffer> frame_;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_RENDER_STATE_H_
