/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#pragma once
/**
 * @file Lockable.h
 * @brief Minimal lock seam shared by the settings store, event queue and
 *        command channel.
 *
 * The panel build hands these classes an RtosMutex (FreeRTOS recursive
 * semaphore). Nothing in here knows about FreeRTOS.
 */

class Lockable {
public:
  virtual ~Lockable() = default;

  virtual void lock()    = 0;   // blocks until owned
  virtual void unlock()  = 0;
  virtual bool tryLock() = 0;   // never blocks; false if someone else owns it
};

// Scoped owner: lock on construction, unlock on scope exit.
class LockGuard {
public:
  explicit LockGuard(Lockable& l) : lock_(l) { lock_.lock(); }
  ~LockGuard() { lock_.unlock(); }

private:
  LockGuard(const LockGuard&) = delete;
  LockGuard& operator=(const LockGuard&) = delete;

  Lockable& lock_;
};
