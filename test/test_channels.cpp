#include <gtest/gtest.h>
#include <CommandChannel.hpp>
#include <EventQueue.hpp>
#include <FakeLock.hpp>

namespace {

AlarmEvent stateEvent(AlarmStateKind k) {
  AlarmEvent ev;
  ev.type  = AlarmEventType::AlarmStateChanged;
  ev.state = k;
  return ev;
}

AlarmEvent motionEvent(bool detected) {
  AlarmEvent ev;
  ev.type = detected ? AlarmEventType::MotionDetected : AlarmEventType::MotionCleared;
  return ev;
}

} // namespace

TEST(EventQueue, FifoOrder) {
  FakeLock   lock;
  EventQueue q(lock, 4);
  q.push(stateEvent(AlarmStateKind::Arming));
  q.push(stateEvent(AlarmStateKind::Armed));

  AlarmEvent ev;
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.state, AlarmStateKind::Arming);
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.state, AlarmStateKind::Armed);
  EXPECT_EQ(q.tryPop(ev), PopStatus::Empty);
  EXPECT_EQ(lock.depth, 0);
}

TEST(EventQueue, OverflowDropsOldest) {
  FakeLock   lock;
  EventQueue q(lock, 2);
  q.push(stateEvent(AlarmStateKind::Arming));
  q.push(stateEvent(AlarmStateKind::Armed));
  q.push(stateEvent(AlarmStateKind::Pending));

  EXPECT_EQ(q.size(), 2u);
  EXPECT_EQ(q.dropped(), 1u);

  AlarmEvent ev;
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.state, AlarmStateKind::Armed);
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.state, AlarmStateKind::Pending);
}

TEST(EventQueue, MotionFloodKeepsTheAnnouncedState) {
  FakeLock   lock;
  EventQueue q(lock);
  q.push(stateEvent(AlarmStateKind::Disarmed));
  for (int i = 0; i < 64; ++i) q.push(motionEvent(i % 2 == 0));

  EXPECT_EQ(q.size(), q.capacity());
  EXPECT_EQ(q.dropped(), 64u - (uint32_t)(q.capacity() - 1));

  AlarmEvent ev;
  size_t states = 0, edges = 0;
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.type, AlarmEventType::AlarmStateChanged);
  EXPECT_EQ(ev.state, AlarmStateKind::Disarmed);
  ++states;
  while (q.tryPop(ev) == PopStatus::Popped) {
    if (ev.type == AlarmEventType::AlarmStateChanged) ++states;
    else ++edges;
  }
  EXPECT_EQ(states, 1u);
  EXPECT_EQ(edges, q.capacity() - 1);
}

TEST(EventQueue, OverflowEvictsEdgesBeforeStates) {
  FakeLock   lock;
  EventQueue q(lock, 3);
  q.push(stateEvent(AlarmStateKind::Arming));
  q.push(motionEvent(true));
  q.push(stateEvent(AlarmStateKind::Armed));
  q.push(motionEvent(false));        // evicts the edge, not a state

  AlarmEvent ev;
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.state, AlarmStateKind::Arming);
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.state, AlarmStateKind::Armed);
  ASSERT_EQ(q.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.type, AlarmEventType::MotionCleared);
  EXPECT_EQ(q.tryPop(ev), PopStatus::Empty);

  // only the latest state is queued: an incoming edge is the one dropped
  EventQueue one(lock, 1);
  one.push(stateEvent(AlarmStateKind::Triggered));
  one.push(motionEvent(true));
  EXPECT_EQ(one.dropped(), 1u);
  ASSERT_EQ(one.tryPop(ev), PopStatus::Popped);
  EXPECT_EQ(ev.state, AlarmStateKind::Triggered);
}

TEST(EventQueue, BusyLockDoesNotBlock) {
  FakeLock   lock;
  EventQueue q(lock, 2);
  q.push(stateEvent(AlarmStateKind::Armed));

  lock.busy = true;
  AlarmEvent ev;
  EXPECT_EQ(q.tryPop(ev), PopStatus::Busy);
  lock.busy = false;
  EXPECT_EQ(q.tryPop(ev), PopStatus::Popped);
}

TEST(CommandChannel, DeliversInOrder) {
  FakeLock       lock;
  CommandChannel ch(lock, 4);
  ch.attachSender();

  ASSERT_TRUE(ch.send(AlarmCommand::of(AlarmCommandType::Arm)));
  AlarmSettings s = defaultAlarmSettings();
  s.pendingTimeout = 3;
  ASSERT_TRUE(ch.send(AlarmCommand::update(s)));

  AlarmCommand c;
  ASSERT_EQ(ch.tryReceive(c), RecvStatus::Received);
  EXPECT_EQ(c.type, AlarmCommandType::Arm);
  ASSERT_EQ(ch.tryReceive(c), RecvStatus::Received);
  EXPECT_EQ(c.type, AlarmCommandType::UpdateSettings);
  EXPECT_EQ(c.settings.pendingTimeout, 3);
  EXPECT_EQ(ch.tryReceive(c), RecvStatus::Empty);
}

TEST(CommandChannel, FullChannelRejects) {
  FakeLock       lock;
  CommandChannel ch(lock, 1);
  ch.attachSender();
  EXPECT_TRUE(ch.send(AlarmCommand::of(AlarmCommandType::Arm)));
  EXPECT_FALSE(ch.send(AlarmCommand::of(AlarmCommandType::Disarm)));
}

TEST(CommandChannel, DisconnectedOnlyOnceDrained) {
  FakeLock       lock;
  CommandChannel ch(lock, 4);
  AlarmCommand   c;
  EXPECT_EQ(ch.tryReceive(c), RecvStatus::Disconnected);

  ch.attachSender();
  ch.attachSender();
  EXPECT_EQ(ch.senders(), 2);
  ASSERT_TRUE(ch.send(AlarmCommand::of(AlarmCommandType::ManualTrigger)));
  ch.detachSender();
  ch.detachSender();
  ch.detachSender();
  EXPECT_EQ(ch.senders(), 0);

  ASSERT_EQ(ch.tryReceive(c), RecvStatus::Received);
  EXPECT_EQ(c.type, AlarmCommandType::ManualTrigger);
  EXPECT_EQ(ch.tryReceive(c), RecvStatus::Disconnected);
}

TEST(CommandChannel, ClosedReceiverFailsSends) {
  FakeLock       lock;
  CommandChannel ch(lock, 4);
  ch.attachSender();
  ASSERT_TRUE(ch.send(AlarmCommand::of(AlarmCommandType::Arm)));
  ch.closeReceiver();
  EXPECT_FALSE(ch.send(AlarmCommand::of(AlarmCommandType::Disarm)));
  EXPECT_EQ(lock.depth, 0);
}
