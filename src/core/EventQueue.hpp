/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef EVENT_QUEUE_H
#define EVENT_QUEUE_H
/**
 * @file EventQueue.h
 * @brief Bounded ring of outbound alarm events.
 *
 * - Producer (alarm task) takes the lock and pushes. A full ring drops the
 *   oldest motion edge; a state change is only dropped once a newer one is
 *   queued, so the last announced state always reaches the consumer.
 * - Consumer (scheduler) only try-locks: Busy means "skip this cycle".
 */

#include <AlarmTypes.hpp>
#include <Config.hpp>
#include <Lockable.hpp>
#include <vector>

enum class PopStatus : uint8_t {
  Popped = 0,
  Empty  = 1,
  Busy   = 2,
};

class EventQueue {
public:
  EventQueue(Lockable& lock, size_t capacity = EVENT_QUEUE_DEPTH);

  void      push(const AlarmEvent& ev);
  PopStatus tryPop(AlarmEvent& out);

  size_t   size();
  size_t   capacity() const { return ring_.size(); }
  uint32_t dropped();      // events lost to overflow since boot

private:
  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  long victim_(const AlarmEvent& incoming) const;
  void eraseAt_(size_t offset);

  Lockable&               lock_;
  std::vector<AlarmEvent> ring_;
  size_t   head_    = 0;
  size_t   tail_    = 0;
  size_t   count_   = 0;
  uint32_t dropped_ = 0;
  bool     notifiedDrop_ = false;
};

#endif // EVENT_QUEUE_H
