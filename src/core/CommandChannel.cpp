#include <CommandChannel.hpp>
#include <Utils.hpp>

CommandChannel::CommandChannel(Lockable& lock, size_t capacity)
: lock_(lock), ring_(capacity ? capacity : 1) {}

void CommandChannel::attachSender() {
    LockGuard g(lock_);
    senders_++;
}

void CommandChannel::detachSender() {
    LockGuard g(lock_);
    if (senders_ > 0) senders_--;
}

uint16_t CommandChannel::senders() {
    LockGuard g(lock_);
    return senders_;
}

bool CommandChannel::send(const AlarmCommand& cmd) {
    LockGuard g(lock_);
    if (rxClosed_) return false;
    if (count_ == ring_.size()) {
        DBG_PRINTF("[Commands] queue full, dropping %s\n", alarmCommandName(cmd.type));
        return false;
    }
    ring_[tail_] = cmd;
    tail_ = (tail_ + 1) % ring_.size();
    count_++;
    return true;
}

RecvStatus CommandChannel::tryReceive(AlarmCommand& out) {
    LockGuard g(lock_);
    if (count_ == 0) {
        return senders_ == 0 ? RecvStatus::Disconnected : RecvStatus::Empty;
    }
    out   = ring_[head_];
    head_ = (head_ + 1) % ring_.size();
    count_--;
    return RecvStatus::Received;
}

void CommandChannel::closeReceiver() {
    LockGuard g(lock_);
    rxClosed_ = true;
    count_ = head_ = tail_ = 0;
}
