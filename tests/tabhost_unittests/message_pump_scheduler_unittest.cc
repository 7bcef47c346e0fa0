// Copyright (c) 2026 The Chromium Embedded Framework Authors. All rights
// reserved. Use of this source code is governed by a BSD-style license that
// can be found in the LICENSE file.

#include <limits>
#include <memory>

#include "gtest/gtest.h"
#include "tabhost/browser/browser_registry.h"
#include "tabhost/browser/message_pump_scheduler.h"
#include "tabhost/browser/tab_controller.h"
#include "tests/tabhost_unittests/fake_engine.h"
#include "tests/tabhost_unittests/fake_main_message_loop.h"

using namespace tabhost;

namespace {

const int64_t kMinDelayUs = 500;
const int64_t kMaxDelayUs = 4000;

class MessagePumpSchedulerTest : public testing::Test {
 protected:
  MessagePumpSchedulerTest()
      : controller_(new TabController(config_, &engine_, &registry_)) {}

  scoped_refptr<MessagePumpScheduler> Start() {
    return MessagePumpScheduler::Start(&engine_, controller_->GetWeakPtr(),
                                       kMinDelayUs, kMaxDelayUs);
  }

  FakeMainMessageLoop loop_;
  AppConfig config_;
  FakeEngine engine_;
  BrowserRegistry registry_;
  std::unique_ptr<TabController> controller_;
};

}  // namespace

TEST(MessagePumpSchedulerClamp, ClampDelayUs) {
  EXPECT_EQ(kMinDelayUs,
            MessagePumpScheduler::ClampDelayUs(0, kMinDelayUs, kMaxDelayUs));
  EXPECT_EQ(kMinDelayUs,
            MessagePumpScheduler::ClampDelayUs(-100, kMinDelayUs, kMaxDelayUs));
  EXPECT_EQ(1500,
            MessagePumpScheduler::ClampDelayUs(1500, kMinDelayUs, kMaxDelayUs));
  EXPECT_EQ(kMaxDelayUs, MessagePumpScheduler::ClampDelayUs(
                             std::numeric_limits<int64_t>::max(), kMinDelayUs,
                             kMaxDelayUs));
  EXPECT_EQ(kMinDelayUs, MessagePumpScheduler::ClampDelayUs(
                             std::numeric_limits<int64_t>::min(), kMinDelayUs,
                             kMaxDelayUs));
}

TEST_F(MessagePumpSchedulerTest, StartPostsFirstCycle) {
  scoped_refptr<MessagePumpScheduler> scheduler = Start();
  EXPECT_EQ(1U, loop_.pending_task_count());
  EXPECT_EQ(0U, scheduler->cycle_count());

  EXPECT_EQ(1U, loop_.RunPendingTasks());
  EXPECT_EQ(1U, scheduler->cycle_count());

  // Each cycle posts exactly one follow-up.
  EXPECT_EQ(1U, loop_.pending_task_count());
}

TEST_F(MessagePumpSchedulerTest, PumpsOnlyWhenDue) {
  scoped_refptr<MessagePumpScheduler> scheduler = Start();

  engine_.should_pump = false;
  engine_.time_until_next_us = 2000;
  loop_.RunPendingTasks();
  EXPECT_EQ(0, engine_.pump_count);
  EXPECT_EQ(2000, loop_.last_delay_us());

  engine_.should_pump = true;
  engine_.time_until_next_us = 0;
  loop_.RunPendingTasks();
  EXPECT_EQ(1, engine_.pump_count);
  EXPECT_EQ(1U, scheduler->pump_count());
  EXPECT_EQ(kMinDelayUs, loop_.last_delay_us());

  // Never pumps before the engine is ready.
  engine_.ready = false;
  loop_.RunPendingTasks();
  EXPECT_EQ(1, engine_.pump_count);
  EXPECT_EQ(3U, scheduler->cycle_count());
}

TEST_F(MessagePumpSchedulerTest, DelayIsClamped) {
  scoped_refptr<MessagePumpScheduler> scheduler = Start();

  // Nothing scheduled.
  engine_.time_until_next_us = std::numeric_limits<uint64_t>::max();
  loop_.RunPendingTasks();
  EXPECT_EQ(kMaxDelayUs, loop_.last_delay_us());

  engine_.time_until_next_us = 10;
  loop_.RunPendingTasks();
  EXPECT_EQ(kMinDelayUs, loop_.last_delay_us());
}

TEST_F(MessagePumpSchedulerTest, StopsWhenOwnerDestroyed) {
  scoped_refptr<MessagePumpScheduler> scheduler = Start();
  loop_.RunPendingTasks();
  EXPECT_FALSE(scheduler->is_stopped());
  EXPECT_EQ(1U, loop_.pending_task_count());

  controller_.reset();

  engine_.should_pump = true;
  loop_.RunPendingTasks();
  EXPECT_TRUE(scheduler->is_stopped());
  EXPECT_EQ(0U, loop_.pending_task_count());
  EXPECT_EQ(0, engine_.pump_count);
  EXPECT_EQ(1U, scheduler->cycle_count());
  EXPECT_EQ(-1, scheduler->DoCycle());
}

TEST_F(MessagePumpSchedulerTest, DrainsTabsEveryCycle) {
  controller_->SetViewport(800, 600, 1.0f);
  Tab* tab = controller_->AddTab();
  ASSERT_TRUE(tab->has_browser());

  // Creating the first browser starts the controller's own scheduler.
  ASSERT_TRUE(controller_->pump_started());
  MessagePumpScheduler* scheduler = controller_->scheduler();

  engine_.should_pump = false;
  engine_.create_params.back().client->GetDisplayHandler()->OnTitleChange(
      nullptr, "Drained");
  loop_.RunPendingTasks();

  EXPECT_EQ(1U, scheduler->cycle_count());
  EXPECT_EQ(0U, scheduler->pump_count());
  EXPECT_STREQ("Drained", tab->title().c_str());

  engine_.create_params.back().client->GetDisplayHandler()->OnTitleChange(
      nullptr, "Again");
  loop_.RunPendingTasks();
  EXPECT_STREQ("Again", tab->title().c_str());
}
