#include <AlarmTypes.hpp>
#include <SettingsKeys.hpp>
#include <string.h>

// ======================================================
// names
// ======================================================
const char* alarmStateName(AlarmStateKind k) {
  switch (k) {
    case AlarmStateKind::Disarmed:  return "Disarmed";
    case AlarmStateKind::Arming:    return "Arming";
    case AlarmStateKind::Armed:     return "Armed";
    case AlarmStateKind::Pending:   return "Pending";
    case AlarmStateKind::Triggered: return "Triggered";
  }
  return "?";
}

const char* alarmCommandName(AlarmCommandType t) {
  switch (t) {
    case AlarmCommandType::Arm:            return "Arm";
    case AlarmCommandType::ArmInstantly:   return "ArmInstantly";
    case AlarmCommandType::Disarm:         return "Disarm";
    case AlarmCommandType::ManualTrigger:  return "ManualTrigger";
    case AlarmCommandType::Untrigger:      return "Untrigger";
    case AlarmCommandType::UpdateSettings: return "UpdateSettings";
  }
  return "?";
}

// ======================================================
// persisted state
// ======================================================
PersistedAlarmState persistedFrom(const AlarmState& s) {
  switch (s.kind) {
    case AlarmStateKind::Disarmed:  return PersistedAlarmState::Disarmed;
    case AlarmStateKind::Arming:
    case AlarmStateKind::Armed:     return PersistedAlarmState::Armed;
    case AlarmStateKind::Pending:
    case AlarmStateKind::Triggered: return PersistedAlarmState::Triggered;
  }
  return PersistedAlarmState::Disarmed;
}

AlarmState recoverFrom(PersistedAlarmState p, uint32_t nowMs) {
  switch (p) {
    case PersistedAlarmState::Disarmed:  return AlarmState::disarmed();
    case PersistedAlarmState::Armed:     return AlarmState::armed(nowMs);
    case PersistedAlarmState::Triggered: return AlarmState::triggered();
  }
  return AlarmState::disarmed();
}

const char* persistedName(PersistedAlarmState p) {
  switch (p) {
    case PersistedAlarmState::Disarmed:  return "Disarmed";
    case PersistedAlarmState::Armed:     return "Armed";
    case PersistedAlarmState::Triggered: return "Triggered";
  }
  return "Disarmed";
}

bool persistedFromName(const char* s, PersistedAlarmState& out) {
  if (!s) return false;
  if (!strcmp(s, "Disarmed"))  { out = PersistedAlarmState::Disarmed;  return true; }
  if (!strcmp(s, "Armed"))     { out = PersistedAlarmState::Armed;     return true; }
  if (!strcmp(s, "Triggered")) { out = PersistedAlarmState::Triggered; return true; }
  return false;
}

bool encodeSetting(const PersistedAlarmState& v, JsonVariant dst) {
  return dst.set(persistedName(v));
}

bool decodeSetting(JsonVariantConst src, PersistedAlarmState& v) {
  if (!src.is<const char*>()) return false;
  return persistedFromName(src.as<const char*>(), v);
}

// ======================================================
// settings
// ======================================================
AlarmSettings defaultAlarmSettings() {
  AlarmSettings s;
  s.initialState   = ALARM_INITIAL_STATE_DEFAULT;
  s.armingTimeout  = ALARM_ARMING_TIMEOUT_DEFAULT;
  s.pendingTimeout = ALARM_PENDING_TIMEOUT_DEFAULT;
  return s;
}

bool encodeSetting(const AlarmSettings& v, JsonVariant dst) {
  JsonObject o = dst.to<JsonObject>();
  if (o.isNull()) return false;
  bool ok = true;
  ok = o["initial_state"].set(persistedName(v.initialState)) && ok;
  ok = o["arming_timeout"].set(v.armingTimeout) && ok;
  ok = o["pending_timeout"].set(v.pendingTimeout) && ok;
  return ok;
}

namespace {
  bool readU16_(JsonVariantConst v, uint16_t& out) {
    if (!v.is<unsigned long>()) return false;
    unsigned long n = v.as<unsigned long>();
    if (n > 0xFFFFul) return false;
    out = (uint16_t)n;
    return true;
  }

  bool readString_(JsonVariantConst v, std::string& out) {
    if (!v.is<const char*>()) return false;
    out = v.as<const char*>();
    return true;
  }
}

bool decodeSetting(JsonVariantConst src, AlarmSettings& v) {
  if (!src.is<JsonObjectConst>()) return false;
  JsonObjectConst o = src.as<JsonObjectConst>();

  AlarmSettings s;
  if (!decodeSetting(o["initial_state"], s.initialState)) return false;
  if (!readU16_(o["arming_timeout"], s.armingTimeout))    return false;
  if (!readU16_(o["pending_timeout"], s.pendingTimeout))  return false;
  v = s;
  return true;
}

// ======================================================
// entities
// ======================================================
bool encodeSetting(const Entity& v, JsonVariant dst) {
  JsonObject o = dst.to<JsonObject>();
  if (o.isNull()) return false;
  bool ok = true;
  ok = o["name"].set(v.name.c_str()) && ok;
  if (!v.variant.empty()) ok = o["variant"].set(v.variant.c_str()) && ok;
  ok = o["unique_id"].set(v.uniqueId.c_str()) && ok;
  ok = o["state_topic"].set(v.stateTopic.c_str()) && ok;
  ok = o["command_topic"].set(v.commandTopic.c_str()) && ok;
  if (v.gpioPin >= 0) ok = o["gpio_pin"].set(v.gpioPin) && ok;
  return ok;
}

bool decodeSetting(JsonVariantConst src, Entity& v) {
  if (!src.is<JsonObjectConst>()) return false;
  JsonObjectConst o = src.as<JsonObjectConst>();

  Entity e;
  if (!readString_(o["name"], e.name))               return false;
  if (!o["variant"].isNull()) {
    if (!readString_(o["variant"], e.variant)) return false;
    if (e.variant != ENTITY_VARIANT_BINARY_SENSOR && e.variant != ENTITY_VARIANT_SENSOR) return false;
  }
  if (!readString_(o["unique_id"], e.uniqueId))      return false;
  if (!readString_(o["state_topic"], e.stateTopic))  return false;
  // alarm entity has a command topic, motion sensors don't
  if (!o["command_topic"].isNull() && !readString_(o["command_topic"], e.commandTopic)) return false;

  JsonVariantConst pin = o["gpio_pin"];
  if (!pin.isNull()) {
    if (!pin.is<int>()) return false;
    int p = pin.as<int>();
    if (p < 0 || p > 0x7FFF) return false;
    e.gpioPin = (int16_t)p;
  }
  v = e;
  return true;
}

bool encodeSetting(const std::vector<Entity>& v, JsonVariant dst) {
  JsonArray a = dst.to<JsonArray>();
  if (a.isNull()) return false;
  for (size_t i = 0; i < v.size(); ++i) {
    if (!encodeSetting(v[i], a.add())) return false;
  }
  return true;
}

bool decodeSetting(JsonVariantConst src, std::vector<Entity>& v) {
  if (!src.is<JsonArrayConst>()) return false;
  JsonArrayConst a = src.as<JsonArrayConst>();

  std::vector<Entity> out;
  out.reserve(a.size());
  for (JsonVariantConst item : a) {
    Entity e;
    if (!decodeSetting(item, e)) return false;
    out.push_back(e);
  }
  v.swap(out);
  return true;
}
