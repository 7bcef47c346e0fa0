// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/render_state.h"

#include <algorithm>

namespace tabhost {

RenderState::RenderState() = default;

RenderState::~RenderState() = default;

void RenderState::SetViewSize(int width, int height) {
  base::AutoLock lock_scope(lock_);
  width_ = std::max(width, 1);
  height_ = std::max(height, 1);
}

void RenderState::GetViewSize(int* width, int* height) const {
  base::AutoLock lock_scope(lock_);
  *width = width_;
  *height = height_;
}

void RenderState::SetScaleFactor(float scale_factor) {
  base::AutoLock lock_scope(lock_);
  scale_factor_ = scale_factor > 0.0f ? scale_factor : 1.0f;
}

float RenderState::GetScaleFactor() const {
  base::AutoLock lock_scope(lock_);
  return scale_factor_;
}

void RenderState::SetFrame(std::shared_ptr<const FrameBuffer> frame) {
  std::shared_ptr<const FrameBuffer> old_frame;

  {
    base::AutoLock lock_scope(lock_);
    old_frame.swap(frame_);
    frame_ = std::move(frame);
  }

  // |old_frame| is released outside the lock.
}

std::shared_ptr<const FrameBuffer> RenderState::GetFrame() const {
  base::AutoLock lock_scope(lock_);
  return frame_;
}

void RenderState::ClearFrame() {
  SetFrame(nullptr);
}

}  // namespace tabhost
