/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef PANEL_H
#define PANEL_H

#include <Arduino.h>
#include <AlarmTypes.hpp>
#include <ArduinoIo.hpp>
#include <Config.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <vector>

class Alarm;
class CommandChannel;
class EspFlash;
class EventQueue;
class RtosMutex;
class Scheduler;
class SerialUplink;
class SettingsStore;

/**
 * Composition root of the alarm panel.
 *
 * begin():  settings partition -> hardware description -> alarm/scheduler
 *           objects -> worker tasks (alarm on core 1, scheduler on core 0).
 * loop():   supervisor. A worker that exits, or a queued reset request,
 *           restarts the whole device.
 */
class Panel {
public:
  Panel();
  ~Panel();

  void begin();
  void loop();

  // Central entrypoint for restart requests (ResetManager, REBOOT command).
  void requestReset(const char* reason = nullptr);

private:
  // ==== Owned objects ====
  EspFlash*       flash_        = nullptr;
  SettingsStore*  store_        = nullptr;
  RtosMutex*      settingsLock_ = nullptr;
  RtosMutex*      eventLock_    = nullptr;
  RtosMutex*      commandLock_  = nullptr;
  EventQueue*     events_       = nullptr;
  CommandChannel* commands_     = nullptr;
  SerialUplink*   uplink_       = nullptr;
  Scheduler*      scheduler_    = nullptr;
  Alarm*          alarm_        = nullptr;
  ArduinoIo       io_;

  // ==== Hardware description (from settings, lives forever) ====
  uint8_t             sirenPin_ = 0;
  Entity              alarmEntity_;
  std::vector<Entity> motionEntities_;

  // ==== Workers ====
  TaskHandle_t  alarmTask_        = nullptr;
  TaskHandle_t  schedulerTask_    = nullptr;
  volatile bool alarmExited_      = false;
  volatile bool schedulerExited_  = false;

  // ==== Reset handling ====
  volatile bool resetRequested_   = false;
  bool          resetInProgress_  = false;
  const char*   resetReason_      = nullptr;

  // ==== Panel_init.cpp ====
  void initSettings_();
  void loadHardware_();
  void initWorkers_();

  // ==== Panel_tasks.cpp ====
  void startTasks_();
  static void alarmTaskEntry_(void* arg);
  static void schedulerTaskEntry_(void* arg);
  void alarmTaskLoop_();
  void schedulerTaskLoop_();
  void supervise_();

  // ==== Panel_reset.cpp ====
  static void onRebootCommand_(void* ctx);
  void processResetIfNeeded_();
  void performSafeReset_();

  Panel(const Panel&) = delete;
  Panel& operator=(const Panel&) = delete;
};

#endif // PANEL_H
