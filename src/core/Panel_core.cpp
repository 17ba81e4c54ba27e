#include <Panel.hpp>
#include <Alarm.hpp>
#include <CommandChannel.hpp>
#include <EspFlash.hpp>
#include <EventQueue.hpp>
#include <ResetManager.hpp>
#include <RtosMutex.hpp>
#include <Scheduler.hpp>
#include <SerialUplink.hpp>
#include <SettingsStore.hpp>
#include <Utils.hpp>

// =========================
// Construction / teardown
// =========================
Panel::Panel() {}

// The panel lives until esp_restart(); nothing here runs in practice.
Panel::~Panel() {
  delete alarm_;
  delete scheduler_;
  delete uplink_;
  delete commands_;
  delete events_;
  delete commandLock_;
  delete eventLock_;
  delete store_;
  delete flash_;
  // settingsLock_ is still referenced by SharedSettings.
}

// =========================
// begin()
// =========================
void Panel::begin() {
  ResetManager::Init(this);

  initSettings_();     // fatal on failure
  loadHardware_();     // fatal on missing keys
  initWorkers_();
  startTasks_();

  DBG_PRINTLN("[Panel] begin() complete");
}

// =========================
// loop(): supervisor
// =========================
void Panel::loop() {
  supervise_();
  processResetIfNeeded_();
}
