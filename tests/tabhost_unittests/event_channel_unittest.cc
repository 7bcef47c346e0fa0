// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include <memory>
#include <thread>
#include <vector>

#include "gtest/gtest.h"
#include "tabhost/browser/event_channel.h"

using namespace tabhost;

TEST(EventChannel, DeliversInOrder) {
  EventReceiver receiver(16);
  EventSender sender = receiver.CreateSender();
  EXPECT_TRUE(sender.is_connected());

  EXPECT_TRUE(sender.Send(BrowserEvent::AddressChanged("https://a.test/")));
  EXPECT_TRUE(sender.Send(BrowserEvent::TitleChanged("A")));
  EXPECT_TRUE(sender.Send(BrowserEvent::LoadingProgress(0.5)));

  BrowserEvent event;
  EXPECT_TRUE(receiver.TryReceive(&event));
  EXPECT_EQ(BrowserEvent::Type::kAddressChanged, event.type);
  EXPECT_STREQ("https://a.test/", event.url.c_str());

  const std::vector<BrowserEvent>& rest = receiver.Drain();
  ASSERT_EQ(2U, rest.size());
  EXPECT_EQ(BrowserEvent::Type::kTitleChanged, rest[0].type);
  EXPECT_STREQ("A", rest[0].title.c_str());
  EXPECT_EQ(BrowserEvent::Type::kLoadingProgress, rest[1].type);
  EXPECT_EQ(0.5, rest[1].progress);

  EXPECT_FALSE(receiver.TryReceive(&event));
  EXPECT_TRUE(receiver.Drain().empty());
}

TEST(EventChannel, DropsWhenFull) {
  EventReceiver receiver(2);
  EventSender sender = receiver.CreateSender();

  EXPECT_TRUE(sender.Send(BrowserEvent::TitleChanged("1")));
  EXPECT_TRUE(sender.Send(BrowserEvent::TitleChanged("2")));
  EXPECT_FALSE(sender.Send(BrowserEvent::TitleChanged("3")));

  // The oldest events are kept.
  const std::vector<BrowserEvent>& events = receiver.Drain();
  ASSERT_EQ(2U, events.size());
  EXPECT_STREQ("1", events[0].title.c_str());
  EXPECT_STREQ("2", events[1].title.c_str());

  // Space is available again once drained.
  EXPECT_TRUE(sender.Send(BrowserEvent::TitleChanged("4")));
}

TEST(EventChannel, SendAfterReceiverDestroyed) {
  EventSender sender;
  {
    EventReceiver receiver(4);
    sender = receiver.CreateSender();
    EXPECT_TRUE(sender.Send(BrowserEvent::FrameReady()));
  }

  EXPECT_FALSE(sender.is_connected());
  EXPECT_FALSE(sender.Send(BrowserEvent::FrameReady()));
}

TEST(EventChannel, DefaultSenderIsDisconnected) {
  EventSender sender;
  EXPECT_FALSE(sender.is_connected());
  EXPECT_FALSE(sender.Send(BrowserEvent::FrameReady()));
}

TEST(EventChannel, CloseDiscardsQueuedEvents) {
  scoped_refptr<EventChannel> channel =
      base::MakeRefCounted<EventChannel>(4);
  EXPECT_TRUE(channel->Push(BrowserEvent::FrameReady()));
  EXPECT_EQ(1U, channel->size());

  channel->Close();
  EXPECT_TRUE(channel->IsClosed());
  EXPECT_EQ(0U, channel->size());
  EXPECT_FALSE(channel->Push(BrowserEvent::FrameReady()));
}

TEST(EventChannel, MultipleProducers) {
  const int kProducers = 4;
  const int kEventsPerProducer = 250;

  EventReceiver receiver(kProducers * kEventsPerProducer);

  std::vector<std::unique_ptr<std::thread>> threads;
  for (int i = 0; i < kProducers; ++i) {
    EventSender sender = receiver.CreateSender();
    threads.push_back(std::make_unique<std::thread>([sender, i]() {
      for (int j = 0; j < kEventsPerProducer; ++j) {
        sender.Send(BrowserEvent::BrowserCreated(i * kEventsPerProducer + j));
      }
    }));
  }
  for (auto& thread : threads) {
    thread->join();
  }

  const std::vector<BrowserEvent>& events = receiver.Drain();
  ASSERT_EQ(static_cast<size_t>(kProducers * kEventsPerProducer),
            events.size());

  // Each producer's events arrive in the order they were sent.
  std::vector<int> last(kProducers, -1);
  for (const auto& event : events) {
    const int producer = event.browser_id / kEventsPerProducer;
    EXPECT_LT(last[producer], event.browser_id);
    last[producer] = event.browser_id;
  }
}
