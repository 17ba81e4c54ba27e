#include <Alarm.hpp>
#include <SettingsKeys.hpp>
#include <Utils.hpp>

// =========================
// Settings: defaults on absence or any error
// =========================
void Alarm::loadSettings_() {
  AlarmSettings loaded;
  SettingsResult r = store_.getStructured(KEY_ALARM_SETTINGS, loaded);

  if (r.ok() && r.found) {
    settings_ = loaded;
  } else {
    settings_ = defaultAlarmSettings();
    if (!r.ok()) {
      DBG_PRINTF("[Alarm] reading %s failed (%s), using defaults\n",
                 KEY_ALARM_SETTINGS, settingsErrorName(r.error));
      if (journal_) journal_->logFault(KEY_ALARM_SETTINGS, settingsErrorName(r.error));
    }
  }

  DBG_PRINTF("[Alarm] settings: initial=%s arming=%us pending=%us%s\n",
             persistedName(settings_.initialState),
             (unsigned)settings_.armingTimeout,
             (unsigned)settings_.pendingTimeout,
             (r.ok() && r.found) ? "" : " (defaults)");
}

// =========================
// State after restart
//   stored    -> stored (Armed restarts its clock)
//   absent    -> settings.initial_state
//   error     -> Disarmed
// =========================
void Alarm::recoverState_(uint32_t nowMs) {
  PersistedAlarmState p = PersistedAlarmState::Disarmed;
  SettingsResult r = store_.getStructured(KEY_PERSISTED_ALARM_STATE, p);

  if (r.ok() && r.found) {
    DBG_PRINTF("[Alarm] recovered persisted state %s\n", persistedName(p));
  } else if (r.ok()) {
    p = settings_.initialState;
    DBG_PRINTF("[Alarm] no persisted state, initial state %s\n", persistedName(p));
  } else {
    p = PersistedAlarmState::Disarmed;
    DBG_PRINTF("[Alarm] reading persisted state failed (%s), Disarmed\n", settingsErrorName(r.error));
    if (journal_) journal_->logFault(KEY_PERSISTED_ALARM_STATE, settingsErrorName(r.error));
  }

  state_ = recoverFrom(p, nowMs);
}
