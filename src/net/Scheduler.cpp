#include <Scheduler.hpp>
#include <CommandAPI.hpp>
#include <Config.hpp>
#include <SettingsKeys.hpp>
#include <Utils.hpp>
#include <string.h>

Scheduler::Scheduler(SharedSettings& settings,
                     EventQueue& events,
                     CommandChannel& commands,
                     Uplink& uplink,
                     const Entity* alarmEntity,
                     const std::vector<Entity>* motionEntities)
: settings_(settings),
  events_(events),
  commands_(commands),
  uplink_(uplink),
  alarmEntity_(alarmEntity),
  motionEntities_(motionEntities) {}

Scheduler::~Scheduler() {
  end();
}

// ======================================================
// lifecycle
// ======================================================
void Scheduler::begin() {
  if (!attached_) {
    commands_.attachSender();
    attached_ = true;
  }

  std::string prefix;
  SettingsResult r = settings_.getString(KEY_AVAILABILITY_TOPIC, availabilityTopic_);
  if (!r.ok()) DBG_PRINTF("[Scheduler] %s: %s\n", KEY_AVAILABILITY_TOPIC, settingsErrorName(r.error));

  r = settings_.getString(KEY_SETTINGS_TOPIC_PREFIX, prefix);
  if (!r.ok()) DBG_PRINTF("[Scheduler] %s: %s\n", KEY_SETTINGS_TOPIC_PREFIX, settingsErrorName(r.error));
  settingsSetTopic_ = prefix.empty() ? std::string() : prefix + SETTINGS_SET_SUFFIX;

  DBG_PRINTF("[Scheduler] availability='%s' settings='%s'\n",
             availabilityTopic_.c_str(), settingsSetTopic_.c_str());
}

void Scheduler::end() {
  if (attached_) {
    commands_.detachSender();
    attached_ = false;
  }
}

// ======================================================
// outbound
// ======================================================
bool Scheduler::service() {
  if (!uplink_.isOnline()) return false;

  AlarmEvent ev;
  const PopStatus st = events_.tryPop(ev);
  if (st != PopStatus::Popped) return false;   // Empty, or Busy: retry next cycle

  return publishEvent_(ev);
}

void Scheduler::onUplinkConnected() {
  if (availabilityTopic_.empty()) return;

  if (motionEntities_) {
    for (size_t i = 0; i < motionEntities_->size(); ++i) {
      publishDiscovery_((*motionEntities_)[i], ENTITY_VARIANT_BINARY_SENSOR);
    }
  }
  if (alarmEntity_) publishDiscovery_(*alarmEntity_, ENTITY_VARIANT_SENSOR);

  publishText_(availabilityTopic_, PAYLOAD_ONLINE);
}

bool Scheduler::publishDiscovery_(const Entity& e, const char* defaultVariant) {
  const std::string variant = e.variant.empty() ? std::string(defaultVariant) : e.variant;
  const std::string topic   = std::string(DISCOVERY_PREFIX) + "/" + variant + "/" + e.uniqueId + "/config";

  DynamicJsonDocument doc(DISCOVERY_DOC_CAPACITY);
  doc["name"]        = e.name;
  doc["unique_id"]   = e.uniqueId;
  doc["state_topic"] = e.stateTopic;
  if (!e.commandTopic.empty()) doc["command_topic"] = e.commandTopic;

  JsonObject avail = doc.createNestedArray("availability").createNestedObject();
  avail["topic"]                 = availabilityTopic_;
  avail["payload_available"]     = PAYLOAD_ONLINE;
  avail["payload_not_available"] = PAYLOAD_OFFLINE;

  if (doc.overflowed()) {
    DBG_PRINTF("[Scheduler] discovery for %s does not fit\n", e.uniqueId.c_str());
    return false;
  }

  std::string payload;
  serializeJson(doc, payload);
  if (!uplink_.publish(topic.c_str(), reinterpret_cast<const uint8_t*>(payload.data()), payload.size(), /*retain=*/true)) {
    DBG_PRINTF("[Scheduler] discovery %s failed\n", topic.c_str());
    return false;
  }
  DBG_PRINTF("[Scheduler] published config for %s\n", e.name.c_str());
  return true;
}

bool Scheduler::publishEvent_(const AlarmEvent& ev) {
  if (!ev.entity) return false;

  const char* payload = nullptr;
  switch (ev.type) {
    case AlarmEventType::MotionDetected:    payload = PAYLOAD_MOTION_ON;  break;
    case AlarmEventType::MotionCleared:     payload = PAYLOAD_MOTION_OFF; break;
    case AlarmEventType::AlarmStateChanged: payload = alarmStatePayload(ev.state); break;
  }
  if (!payload) return false;

  return publishText_(ev.entity->stateTopic, payload);
}

bool Scheduler::publishText_(const std::string& topic, const char* text) {
  if (!uplink_.publish(topic.c_str(), reinterpret_cast<const uint8_t*>(text), strlen(text), /*retain=*/true)) {
    DBG_PRINTF("[Scheduler] publish %s -> %s failed\n", text, topic.c_str());
    return false;
  }
  published_++;
  return true;
}

// ======================================================
// inbound
// ======================================================
void Scheduler::onMessage(const char* topic, const uint8_t* payload, size_t len) {
  if (!topic) return;

  if (alarmEntity_ && !alarmEntity_->commandTopic.empty() && alarmEntity_->commandTopic == topic) {
    onAlarmCommand(reinterpret_cast<const char*>(payload), len);
    return;
  }
  if (settingsSetTopic_.empty()) return;

  const size_t plen = settingsSetTopic_.size();
  if (settingsSetTopic_ == topic) {
    onSetSetting(payload, len);
  } else if (strncmp(topic, settingsSetTopic_.c_str(), plen) == 0 && topic[plen] == '/') {
    onSetSetting(topic + plen + 1, payload, len);
  }
}

bool Scheduler::onAlarmCommand(const char* payload, size_t len) {
  const char* args    = nullptr;
  size_t      argsLen = 0;
  const CommandWord w = parseCommandWord(payload, len, &args, &argsLen);

  AlarmCommand cmd;
  switch (w) {
    case CommandWord::Unknown:
      DBG_PRINTF("[Scheduler] unknown command: %.*s\n", (int)len, payload ? payload : "");
      return false;

    case CommandWord::Reboot:
      DBG_PRINTLN("[Scheduler] reboot requested");
      if (rebootFn_) rebootFn_(rebootCtx_);
      return true;

    case CommandWord::Settings: {
      AlarmSettings s;
      if (!parseSettingsJson(args, argsLen, s)) {
        DBG_PRINTF("[Scheduler] bad settings payload: %.*s\n", (int)argsLen, args);
        return false;
      }
      cmd = AlarmCommand::update(s);
      break;
    }

    default:
      commandFromWord(w, cmd);
      break;
  }

  if (!commands_.send(cmd)) {
    DBG_PRINTF("[Scheduler] %s not queued\n", alarmCommandName(cmd.type));
    return false;
  }
  return true;
}

bool Scheduler::onSetSetting(const uint8_t* payload, size_t len) {
  const uint8_t* nul = payload ? static_cast<const uint8_t*>(memchr(payload, 0, len)) : nullptr;
  if (!nul) {
    DBG_PRINTLN("[Scheduler] set setting: no NUL between key and value");
    return false;
  }
  const size_t keyLen = (size_t)(nul - payload);
  if (keyLen > SETTING_KEY_MAX) {
    DBG_PRINTF("[Scheduler] set setting: key too large (%u > %u)\n",
               (unsigned)keyLen, (unsigned)SETTING_KEY_MAX);
    return false;
  }
  if (!SettingsStore::validUtf8(payload, keyLen)) {
    DBG_PRINTLN("[Scheduler] set setting: key is not UTF-8");
    return false;
  }

  const std::string key(reinterpret_cast<const char*>(payload), keyLen);
  return onSetSetting(key.c_str(), nul + 1, len - keyLen - 1);
}

bool Scheduler::onSetSetting(const char* key, const uint8_t* value, size_t len) {
  if (!key || !*key || strlen(key) > SETTING_KEY_MAX) {
    DBG_PRINTLN("[Scheduler] set setting: bad key");
    return false;
  }

  if (SettingsStore::validUtf8(value, len)) {
    DBG_PRINTF("[Scheduler] set setting %s to %.*s\n", key, (int)len, reinterpret_cast<const char*>(value));
  } else {
    DBG_PRINTF("[Scheduler] set setting %s to <binary of %u byte(s)>\n", key, (unsigned)len);
  }

  SettingsResult r = settings_.set(key, value, len);
  if (!r.ok()) {
    DBG_PRINTF("[Scheduler] set setting %s failed: %s\n", key, settingsErrorName(r.error));
    return false;
  }
  return true;
}
