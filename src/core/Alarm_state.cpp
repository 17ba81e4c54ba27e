#include <Alarm.hpp>
#include <SettingsKeys.hpp>
#include <Utils.hpp>

// =========================
// Commands
// =========================
void Alarm::applyCommand_(const AlarmCommand& cmd, uint32_t nowMs) {
  const AlarmStateKind k = state_.kind;
  bool applied = true;

  switch (cmd.type) {
    case AlarmCommandType::Arm:
      if (k == AlarmStateKind::Disarmed) state_ = AlarmState::arming(nowMs);
      else applied = false;
      break;

    case AlarmCommandType::ArmInstantly:
      if (k == AlarmStateKind::Disarmed) state_ = AlarmState::armed(nowMs);
      else applied = false;
      break;

    case AlarmCommandType::Disarm:
      state_ = AlarmState::disarmed();
      break;

    case AlarmCommandType::ManualTrigger:
      if (k == AlarmStateKind::Armed) state_ = AlarmState::triggered();
      else applied = false;
      break;

    case AlarmCommandType::Untrigger:
      if (k == AlarmStateKind::Pending || k == AlarmStateKind::Triggered) {
        state_ = AlarmState::armed(nowMs);
      } else {
        applied = false;
      }
      break;

    case AlarmCommandType::UpdateSettings:
      settings_ = cmd.settings;
      DBG_PRINTF("[Alarm] settings: initial=%s arming=%us pending=%us\n",
                 persistedName(settings_.initialState),
                 (unsigned)settings_.armingTimeout,
                 (unsigned)settings_.pendingTimeout);
      persistSettings_();
      break;
  }

  if (!applied) {
    DBG_PRINTF("[Alarm] %s ignored in %s\n", alarmCommandName(cmd.type), alarmStateName(k));
  }
  if (journal_) journal_->logCommand(alarmCommandName(cmd.type), applied);
}

// =========================
// Timeouts / motion
// =========================
bool Alarm::timedOut_(uint32_t sinceMs, uint32_t nowMs, uint16_t timeoutS) {
  // unsigned subtraction survives millis() wrap
  return (uint32_t)(nowMs - sinceMs) >= (uint32_t)timeoutS * 1000u;
}

void Alarm::evaluateGuards_(uint32_t nowMs, bool motionThisTick) {
  switch (state_.kind) {
    case AlarmStateKind::Arming:
      if (timedOut_(state_.startedAtMs, nowMs, settings_.armingTimeout)) {
        state_ = AlarmState::armed(nowMs);
      }
      break;

    case AlarmStateKind::Armed:
      if (motionThisTick) state_ = AlarmState::pending(nowMs);
      break;

    case AlarmStateKind::Pending:
      if (timedOut_(state_.startedAtMs, nowMs, settings_.pendingTimeout)) {
        state_ = AlarmState::triggered();
      }
      break;

    case AlarmStateKind::Disarmed:
    case AlarmStateKind::Triggered:
      break;
  }
}

// =========================
// Persistence (failures are logged, memory stays authoritative)
// =========================
void Alarm::persistState_() {
  uint8_t buf[SETTINGS_WRITE_BUF_SIZE];
  const PersistedAlarmState p = persistedFrom(state_);
  SettingsResult r = store_.setStructured(KEY_PERSISTED_ALARM_STATE, p, buf, sizeof(buf));
  if (!r.ok()) {
    DBG_PRINTF("[Alarm] persisting state %s failed: %s\n", persistedName(p), settingsErrorName(r.error));
    if (journal_) journal_->logFault(KEY_PERSISTED_ALARM_STATE, settingsErrorName(r.error));
  }
}

void Alarm::persistSettings_() {
  uint8_t buf[SETTINGS_WRITE_BUF_SIZE];
  SettingsResult r = store_.setStructured(KEY_ALARM_SETTINGS, settings_, buf, sizeof(buf));
  if (!r.ok()) {
    DBG_PRINTF("[Alarm] persisting settings failed: %s\n", settingsErrorName(r.error));
    if (journal_) journal_->logFault(KEY_ALARM_SETTINGS, settingsErrorName(r.error));
  }
}
