// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#ifndef TABHOST_BROWSER_EVENT_CHANNEL_H_
#define TABHOST_BROWSER_EVENT_CHANNEL_H_
#pragma once

#include <deque>
#include <vector>

#include "include/base/cef_lock.h"
#include "include/base/cef_ref_counted.h"
#include "tabhost/browser/browser_event.h"

namespace tabhost {

// Bounded FIFO queue of BrowserEvents shared by any number of EventSenders
// and exactly one EventReceiver. Pushing never blocks: events are dropped
// once the queue is full or closed.
//
// This object is thread safe.
class EventChannel : public base::RefCountedThreadSafe<EventChannel> {
 public:
  explicit EventChannel(size_t capacity);

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  // Appends |event|. Returns false if the event was dropped.
  bool Push(BrowserEvent event);

  // Removes the oldest event into |event|. Returns false if empty.
  bool Pop(BrowserEvent* event);

  // Removes and returns every queued event, oldest first.
  std::vector<BrowserEvent> TakeAll();

  // Discards queued events and rejects future pushes.
  void Close();

  bool IsClosed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }

 private:
  friend class base::RefCountedThreadSafe<EventChannel>;

  ~EventChannel();

  const size_t capacity_;

  mutable base::Lock lock_;

  // Must be protected by |lock_|.
  std::deque<BrowserEvent> events_;
  bool closed_ = false;
  size_t dropped_ = 0;
};

// Producer end of an EventChannel. Cheap to copy and safe to use from any
// thread, including after the receiver is gone.
class EventSender {
 public:
  EventSender() = default;
  explicit EventSender(scoped_refptr<EventChannel> channel);

  // Queues |event| without blocking. Returns false if the event was dropped
  // because the receiver is gone or the queue is full.
  bool Send(BrowserEvent event) const;

  bool is_connected() const;

 private:
  scoped_refptr<EventChannel> channel_;
};

// Consumer end of an EventChannel. Destroying the receiver closes the
// channel so that senders start dropping events.
class EventReceiver {
 public:
  explicit EventReceiver(size_t capacity);
  ~EventReceiver();

  EventReceiver(const EventReceiver&) = delete;
  EventReceiver& operator=(const EventReceiver&) = delete;

  // Returns a new sender for this channel.
  EventSender CreateSender() const;

  // Removes the oldest event into |event|. Returns false if none is queued.
  bool TryReceive(BrowserEvent* event);

  // Removes and returns every queued event, oldest first.
  std::vector<BrowserEvent> Drain();

 private:
  scoped_refptr<EventChannel> channel_;
};

}  // namespace tabhost

#endif  // TABHOST_BROWSER_EVENT_CHANNEL_H_
