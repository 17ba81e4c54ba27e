#include <EventQueue.hpp>
#include <Utils.hpp>

EventQueue::EventQueue(Lockable& lock, size_t capacity)
: lock_(lock), ring_(capacity ? capacity : 1) {}

namespace {
  bool isMotion_(const AlarmEvent& ev) {
    return ev.type == AlarmEventType::MotionDetected || ev.type == AlarmEventType::MotionCleared;
  }
}

// Overflow victim, as an offset from head_: the oldest motion edge, else the
// oldest state change that a newer one supersedes. -1 if nothing qualifies.
long EventQueue::victim_(const AlarmEvent& incoming) const {
    const size_t cap = ring_.size();
    long firstState = -1;
    for (size_t i = 0; i < count_; ++i) {
        const AlarmEvent& ev = ring_[(head_ + i) % cap];
        if (isMotion_(ev)) return (long)i;
        if (firstState < 0) {
            firstState = (long)i;
        } else {
            return firstState;   // a second state change is queued
        }
    }
    if (firstState >= 0 && !isMotion_(incoming)) return firstState;
    return -1;
}

void EventQueue::eraseAt_(size_t offset) {
    const size_t cap = ring_.size();
    for (size_t i = offset; i + 1 < count_; ++i) {
        ring_[(head_ + i) % cap] = ring_[(head_ + i + 1) % cap];
    }
    tail_ = (tail_ + cap - 1) % cap;
    count_--;
}

void EventQueue::push(const AlarmEvent& ev) {
    LockGuard g(lock_);
    const size_t cap = ring_.size();

    if (count_ == cap) {
        dropped_++;
        if (!notifiedDrop_) {
            DBG_PRINTLN("[Events] queue full -> dropping motion edges first.");
            notifiedDrop_ = true;
        }
        const long at = victim_(ev);
        if (at < 0) return;            // queue holds only the latest state: drop the edge
        eraseAt_((size_t)at);
    }

    ring_[tail_] = ev;
    tail_ = (tail_ + 1) % cap;
    count_++;
}

PopStatus EventQueue::tryPop(AlarmEvent& out) {
    if (!lock_.tryLock()) return PopStatus::Busy;

    PopStatus st = PopStatus::Empty;
    if (count_ > 0) {
        out   = ring_[head_];
        head_ = (head_ + 1) % ring_.size();
        count_--;
        st = PopStatus::Popped;
        if (count_ == 0) notifiedDrop_ = false;
    }
    lock_.unlock();
    return st;
}

size_t EventQueue::size() {
    LockGuard g(lock_);
    return count_;
}

uint32_t EventQueue::dropped() {
    LockGuard g(lock_);
    return dropped_;
}
