// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include "tabhost/browser/event_channel.h"

#include <iterator>

#include "include/base/cef_logging.h"

namespace tabhost {

EventChannel::EventChannel(size_t capacity) : capacity_(capacity) {
  DCHECK_GT(capacity_, 0U);
}

EventChannel::~EventChannel() = default;

bool EventChannel::Push(BrowserEvent event) {
  const BrowserEvent::Type type = event.type;
  size_t dropped = 0;

  {
    base::AutoLock lock_scope(lock_);
    if (closed_) {
      VLOG(1) << "Dropping " << BrowserEventTypeName(type)
              << " event for a closed tab";
      return false;
    }
    if (events_.size() < capacity_) {
      events_.push_back(std::move(event));
      return true;
    }
    dropped = ++dropped_;
  }

  LOG(WARNING) << "Event queue full (" << capacity_ << "), dropping "
               << BrowserEventTypeName(type) << " event (" << dropped
               << " dropped so far)";
  return false;
}

bool EventChannel::Pop(BrowserEvent* event) {
  base::AutoLock lock_scope(lock_);
  if (events_.empty()) {
    return false;
  }
  *event = std::move(events_.front());
  events_.pop_front();
  return true;
}

std::vector<BrowserEvent> EventChannel::TakeAll() {
  std::deque<BrowserEvent> events;

  {
    base::AutoLock lock_scope(lock_);
    events.swap(events_);
  }

  return std::vector<BrowserEvent>(std::make_move_iterator(events.begin()),
                                   std::make_move_iterator(events.end()));
}

void EventChannel::Close() {
  base::AutoLock lock_scope(lock_);
  closed_ = true;
  events_.clear();
}

bool EventChannel::IsClosed() const {
  base::AutoLock lock_scope(lock_);
  return closed_;
}

size_t EventChannel::size() const {
  base::AutoLock lock_scope(lock_);
  return events_.size();
}

EventSender::EventSender(scoped_refptr<EventChannel> channel)
    : channel_(std::move(channel)) {}

bool EventSender::Send(BrowserEvent event) const {
  if (!channel_) {
    return false;
  }
  return channel_->Push(std::move(event));
}

bool EventSender::is_connected() const {
  return channel_ && !channel_->IsClosed();
}

EventReceiver::EventReceiver(size_t capacity)
    : channel_(base::MakeRefCounted<EventChannel>(capacity)) {}

EventReceiver::~EventReceiver() {
  channel_->Close();
}

EventSender EventReceiver::CreateSender() const {
  return EventSender(channel_);
}

bool EventReceiver::TryReceive(BrowserEvent* event) {
  return channel_->Pop(event);
}

std::vector<BrowserEvent> EventReceiver::Drain() {
  return channel_->TakeAll();
}

}  // namespace tabhost
