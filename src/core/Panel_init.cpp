#include <Panel.hpp>
#include <Alarm.hpp>
#include <CommandChannel.hpp>
#include <EspFlash.hpp>
#include <EventQueue.hpp>
#include <Logger.hpp>
#include <ResetManager.hpp>
#include <RtosMutex.hpp>
#include <Scheduler.hpp>
#include <SerialUplink.hpp>
#include <SettingsKeys.hpp>
#include <SettingsStore.hpp>
#include <SharedSettings.hpp>
#include <Utils.hpp>

namespace {
// Record buffer of the settings store (largest value + headers).
uint8_t s_settingsBuf[SETTINGS_BUFFER_SIZE];
}

// =========================
// Settings partition
// =========================
void Panel::initSettings_() {
  flash_ = new EspFlash();
  if (!flash_->begin()) {
    ResetManager::Fatal("settings", "partition not found");
  }

  SettingsStore::Options opts;
  opts.keyGuard = SETTINGS_KEY_GUARD != 0;
  store_ = new SettingsStore(*flash_, flash_->partitionStart(), flash_->partitionEnd(),
                             s_settingsBuf, sizeof(s_settingsBuf), opts);

  settingsLock_ = new RtosMutex();
  SharedSettings::Init(*store_, *settingsLock_);

  SettingsResult r = SETTINGS->init();
  if (!r.ok()) {
    DBG_PRINTF("[Panel] settings init: %s (flash %s)\n",
               settingsErrorName(r.error), flashErrorName(r.flash));
    ResetManager::Fatal("settings", settingsErrorName(r.error));
  }
}

// =========================
// Hardware description
// =========================
void Panel::loadHardware_() {
  std::vector<uint8_t> raw;
  SettingsResult r = SETTINGS->get(KEY_SIREN_PIN, raw);
  if (!r.ok() || !r.found || raw.size() != 1) {
    ResetManager::Fatal(KEY_SIREN_PIN, r.ok() ? "missing" : settingsErrorName(r.error));
  }
  sirenPin_ = raw[0];

  r = SETTINGS->getStructured(KEY_MOTION_ENTITIES, motionEntities_);
  if (!r.ok() || !r.found) {
    ResetManager::Fatal(KEY_MOTION_ENTITIES, r.ok() ? "missing" : settingsErrorName(r.error));
  }

  r = SETTINGS->getStructured(KEY_ALARM_ENTITY, alarmEntity_);
  if (!r.ok() || !r.found) {
    ResetManager::Fatal(KEY_ALARM_ENTITY, r.ok() ? "missing" : settingsErrorName(r.error));
  }

  DBGSTR();
  DBG_PRINTLN("###########################################################");
  DBG_PRINTLN("#                  Panel hardware                         #");
  DBG_PRINTLN("###########################################################");
  DBG_PRINTF ("Siren GPIO     : %u\n", (unsigned)sirenPin_);
  DBG_PRINTF ("Alarm entity   : %s -> %s\n", alarmEntity_.name.c_str(), alarmEntity_.stateTopic.c_str());
  for (size_t i = 0; i < motionEntities_.size(); ++i) {
    DBG_PRINTF("Motion %-8u: %s (GPIO %d)\n", (unsigned)i,
               motionEntities_[i].name.c_str(), (int)motionEntities_[i].gpioPin);
  }
  DBGSTP();
}

// =========================
// Alarm / scheduler objects
// =========================
void Panel::initWorkers_() {
  eventLock_   = new RtosMutex();
  commandLock_ = new RtosMutex();
  events_      = new EventQueue(*eventLock_);
  commands_    = new CommandChannel(*commandLock_);

  alarm_ = new Alarm(*SETTINGS, *events_, *commands_, io_, sirenPin_, &alarmEntity_);
  alarm_->setJournal(Logger::TryGet());
  for (size_t i = 0; i < motionEntities_.size(); ++i) {
    alarm_->addMotionSensor(&motionEntities_[i]);
  }

  uplink_    = new SerialUplink(Serial);
  scheduler_ = new Scheduler(*SETTINGS, *events_, *commands_, *uplink_, &alarmEntity_, &motionEntities_);
  scheduler_->setRebootHandler(&Panel::onRebootCommand_, this);
  uplink_->attach(scheduler_);

  // Sender attached before the alarm runs: an empty channel must not read
  // as disconnected on the first tick.
  scheduler_->begin();
}
