/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef COMMAND_CHANNEL_H
#define COMMAND_CHANNEL_H
/**
 * @file CommandChannel.h
 * @brief Inbound alarm commands: many senders, one receiver (the alarm).
 *
 * Senders register with attachSender() and leave with detachSender().
 * Once every sender is gone and the queue is drained, tryReceive()
 * reports Disconnected: the alarm has lost its control path.
 */

#include <AlarmTypes.hpp>
#include <Config.hpp>
#include <Lockable.hpp>
#include <vector>

enum class RecvStatus : uint8_t {
  Received     = 0,
  Empty        = 1,
  Disconnected = 2,
};

class CommandChannel {
public:
  CommandChannel(Lockable& lock, size_t capacity = COMMAND_QUEUE_DEPTH);

  void attachSender();
  void detachSender();
  uint16_t senders();

  // false when the queue is full or nobody is listening anymore
  bool send(const AlarmCommand& cmd);

  RecvStatus tryReceive(AlarmCommand& out);

  // Receiver side gone (alarm task exited): further sends fail.
  void closeReceiver();

private:
  CommandChannel(const CommandChannel&) = delete;
  CommandChannel& operator=(const CommandChannel&) = delete;

  Lockable&                 lock_;
  std::vector<AlarmCommand> ring_;
  size_t   head_     = 0;
  size_t   tail_     = 0;
  size_t   count_    = 0;
  uint16_t senders_  = 0;
  bool     rxClosed_ = false;
};

#endif // COMMAND_CHANNEL_H
