#ifndef FAKE_LOCK_H
#define FAKE_LOCK_H

#include <Lockable.hpp>

// Single-threaded Lockable: counts calls, can pretend another task owns it.
class FakeLock : public Lockable {
public:
  void lock() override    { ++locks; ++depth; }
  void unlock() override  { --depth; }
  bool tryLock() override {
    if (busy) return false;
    ++locks;
    ++depth;
    return true;
  }

  bool busy  = false;
  int  locks = 0;
  int  depth = 0;
};

#endif // FAKE_LOCK_H
