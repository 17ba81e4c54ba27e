#include <Panel.hpp>
#include <Alarm.hpp>
#include <CommandChannel.hpp>
#include <Logger.hpp>
#include <ResetManager.hpp>
#include <Scheduler.hpp>
#include <SerialUplink.hpp>
#include <Utils.hpp>

// =========================
// Task creation
// =========================
void Panel::startTasks_() {
  BaseType_t ok = xTaskCreatePinnedToCore(
      &Panel::alarmTaskEntry_, "Alarm", ALARM_TASK_STACK_SIZE,
      this, ALARM_TASK_PRIORITY, &alarmTask_, ALARM_TASK_CORE);
  if (ok != pdPASS) ResetManager::Fatal("tasks", "alarm task");

  ok = xTaskCreatePinnedToCore(
      &Panel::schedulerTaskEntry_, "Scheduler", SCHEDULER_TASK_STACK_SIZE,
      this, SCHEDULER_TASK_PRIORITY, &schedulerTask_, SCHEDULER_TASK_CORE);
  if (ok != pdPASS) ResetManager::Fatal("tasks", "scheduler task");
}

void Panel::alarmTaskEntry_(void* arg) {
  static_cast<Panel*>(arg)->alarmTaskLoop_();
}

void Panel::schedulerTaskEntry_(void* arg) {
  static_cast<Panel*>(arg)->schedulerTaskLoop_();
}

// =========================
// Alarm: poll-and-delay cycle
// =========================
void Panel::alarmTaskLoop_() {
  alarm_->begin(millis());

  TickType_t last = xTaskGetTickCount();
  for (;;) {
    if (!alarm_->tick(millis())) break;
    vTaskDelayUntil(&last, pdMS_TO_TICKS(ALARM_LOOP_PERIOD_MS));
  }

  commands_->closeReceiver();
  alarmExited_ = true;
  alarmTask_   = nullptr;
  vTaskDelete(NULL);
}

// =========================
// Scheduler: uplink in/out
// =========================
void Panel::schedulerTaskLoop_() {
  scheduler_->onUplinkConnected();

  // nothing left to schedule for once the alarm is gone
  while (!alarmExited_) {
    uplink_->poll();
    scheduler_->service();
    vTaskDelay(pdMS_TO_TICKS(SCHEDULER_PERIOD_MS));
  }

  scheduler_->end();
  schedulerExited_ = true;
  schedulerTask_   = nullptr;
  vTaskDelete(NULL);
}

// =========================
// Supervisor
// =========================
void Panel::supervise_() {
  if (resetRequested_ || resetInProgress_) return;

  if (alarmExited_) {
    DBG_PRINTLN("[Panel] alarm task exited");
    if (Logger* l = Logger::TryGet()) l->logFault("supervisor", "alarm task exited");
    requestReset("alarm task exited");
  } else if (schedulerExited_) {
    DBG_PRINTLN("[Panel] scheduler task exited");
    if (Logger* l = Logger::TryGet()) l->logFault("supervisor", "scheduler task exited");
    requestReset("scheduler task exited");
  }
}
