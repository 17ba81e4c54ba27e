/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ALARM_H
#define ALARM_H

/**
 * @file Alarm.h
 * @brief Security state machine of the panel.
 *
 *   Disarmed --Arm--> Arming --arming_timeout--> Armed --motion--> Pending
 *   Disarmed --ArmInstantly--> Armed --ManualTrigger--> Triggered
 *   Pending --pending_timeout--> Triggered
 *   Pending/Triggered --Untrigger--> Armed,   any --Disarm--> Disarmed
 *
 * One tick (every ALARM_LOOP_PERIOD_MS):
 *   motion edges -> one command -> timeout/motion guard -> siren -> persist
 *
 * begin() rebuilds the last state from the settings partition after a
 * restart. Time is passed in (ms, wrapping u32) so the task owns the clock.
 */

#include <AlarmTypes.hpp>
#include <CommandChannel.hpp>
#include <Config.hpp>
#include <EventQueue.hpp>
#include <Journal.hpp>
#include <MotionSensor.hpp>
#include <SharedSettings.hpp>
#include <Siren.hpp>
#include <vector>

class Alarm {
public:
  Alarm(SharedSettings& settings,
        EventQueue& events,
        CommandChannel& commands,
        DigitalIo& io,
        uint8_t sirenPin,
        const Entity* alarmEntity);

  // Entity must outlive the alarm; gpioPin selects the input.
  bool addMotionSensor(const Entity* entity);
  void setJournal(Journal* journal) { journal_ = journal; }

  // Restore settings + state, drive the siren, announce the state once.
  void begin(uint32_t nowMs);

  // One loop iteration. false = command channel disconnected.
  bool tick(uint32_t nowMs);

  const AlarmState&    state() const      { return state_; }
  const AlarmSettings& settings() const   { return settings_; }
  bool                 sirenOn() const    { return siren_.isOn(); }
  size_t               motionSensors() const { return motion_.size(); }

private:
  // ---- Alarm_recovery.cpp ----
  void loadSettings_();
  void recoverState_(uint32_t nowMs);

  // ---- Alarm_state.cpp ----
  void applyCommand_(const AlarmCommand& cmd, uint32_t nowMs);
  void evaluateGuards_(uint32_t nowMs, bool motionThisTick);
  void persistState_();
  void persistSettings_();
  static bool timedOut_(uint32_t sinceMs, uint32_t nowMs, uint16_t timeoutS);

  // ---- Alarm_core.cpp ----
  bool pollMotion_();
  void driveSiren_();
  void emitState_();

  SharedSettings&  store_;
  EventQueue&      events_;
  CommandChannel&  commands_;
  DigitalIo&       io_;
  const Entity*    entity_;
  Journal*         journal_ = nullptr;

  Siren                     siren_;
  std::vector<MotionSensor> motion_;

  AlarmSettings    settings_;
  AlarmState       state_;
  bool             started_ = false;
};

#endif // ALARM_H
