#include <Panel.hpp>
#include <NVSManager.hpp>
#include <ResetManager.hpp>
#include <Scheduler.hpp>
#include <Utils.hpp>

// =========================
// Reset coordination
// =========================
void Panel::requestReset(const char* reason) {
  if (resetInProgress_) return;
  resetReason_    = reason ? reason : "unspecified";
  resetRequested_ = true;
}

void Panel::onRebootCommand_(void* ctx) {
  static_cast<Panel*>(ctx)->requestReset("remote reboot");
}

void Panel::processResetIfNeeded_() {
  if (!resetRequested_) return;
  performSafeReset_();
}

void Panel::performSafeReset_() {
  if (resetInProgress_) return;
  resetInProgress_ = true;
  resetRequested_  = false;

  DBG_PRINTLN("[Panel] Reset requested -> orderly shutdown");
  DBG_PRINTF ("[Panel] Reason: %s\n", resetReason_);

  // Stop the workers so nothing writes flash during the countdown.
  if (schedulerTask_) { vTaskDelete(schedulerTask_); schedulerTask_ = nullptr; }
  if (alarmTask_)     { vTaskDelete(alarmTask_);     alarmTask_     = nullptr; }

  CONF->RestartSysDelay(RESTART_COUNTDOWN_MS, resetReason_);
}
