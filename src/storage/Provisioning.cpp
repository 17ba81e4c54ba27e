#include <Provisioning.hpp>
#include <AlarmTypes.hpp>
#include <SettingsKeys.hpp>
#include <Utils.hpp>
#include <ctype.h>
#include <stdlib.h>
#include <string.h>

bool parseMacAddress(const char* text, uint8_t out[6]) {
  if (!text) return false;
  const char* p = text;
  for (int i = 0; i < 6; ++i) {
    char* endp = nullptr;
    if (!isxdigit((unsigned char)*p)) return false;
    unsigned long v = strtoul(p, &endp, 16);
    if (endp == p || endp - p > 2 || v > 0xFF) return false;
    out[i] = (uint8_t)v;
    p = endp;
    if (i < 5) {
      if (*p != ':') return false;
      ++p;
    }
  }
  return *p == '\0';
}

namespace {
  bool fail_(std::string& err, const char* what, SettingsResult r) {
    err = std::string(what) + ": " + settingsErrorName(r.error);
    return false;
  }

  bool setText_(SettingsStore& store, JsonObjectConst cfg, const char* field,
                const char* key, std::string& err) {
    JsonVariantConst v = cfg[field];
    if (!v.is<const char*>()) {
      err = std::string(field) + ": missing or not a string";
      return false;
    }
    const char* s = v.as<const char*>();
    SettingsResult r = store.set(key, reinterpret_cast<const uint8_t*>(s), strlen(s));
    return r.ok() ? true : fail_(err, key, r);
  }

  // absent fields keep the firmware defaults
  bool alarmSettingsFrom_(JsonVariantConst v, AlarmSettings& out) {
    if (!v.is<JsonObjectConst>()) return false;
    JsonObjectConst o = v.as<JsonObjectConst>();
    AlarmSettings s = defaultAlarmSettings();

    if (!o["initial_state"].isNull() && !decodeSetting(o["initial_state"], s.initialState)) return false;
    if (!o["arming_timeout"].isNull()) {
      if (!o["arming_timeout"].is<unsigned long>() || o["arming_timeout"].as<unsigned long>() > 0xFFFFul) return false;
      s.armingTimeout = (uint16_t)o["arming_timeout"].as<unsigned long>();
    }
    if (!o["pending_timeout"].isNull()) {
      if (!o["pending_timeout"].is<unsigned long>() || o["pending_timeout"].as<unsigned long>() > 0xFFFFul) return false;
      s.pendingTimeout = (uint16_t)o["pending_timeout"].as<unsigned long>();
    }
    out = s;
    return true;
  }
}

bool provisionSettings(SettingsStore& store, const char* json, size_t len, std::string& err) {
  DynamicJsonDocument doc(PROVISION_DOC_CAPACITY);
  DeserializationError de = deserializeJson(doc, json, len);
  if (de) {
    err = std::string("config: ") + de.c_str();
    return false;
  }
  if (!doc.is<JsonObject>()) {
    err = "config: top level must be an object";
    return false;
  }
  JsonObjectConst cfg = doc.as<JsonObjectConst>();

  // Decode everything before touching the image.
  uint8_t mac[6];
  if (!parseMacAddress(cfg["mac_address"] | "", mac)) {
    err = "mac_address: expected six hex octets aa:bb:cc:dd:ee:ff";
    return false;
  }

  const char* const textFields[] = {
    "hostname", "mqtt_endpoint", "availability_topic", "ota_topic", "settings_topic_prefix",
  };
  for (size_t i = 0; i < sizeof(textFields) / sizeof(textFields[0]); ++i) {
    if (!cfg[textFields[i]].is<const char*>()) {
      err = std::string(textFields[i]) + ": missing or not a string";
      return false;
    }
  }

  JsonVariantConst pin = cfg["siren_pin"];
  if (!pin.is<unsigned int>() || pin.as<unsigned int>() > 0xFF) {
    err = "siren_pin: expected 0..255";
    return false;
  }
  const uint8_t sirenPin = (uint8_t)pin.as<unsigned int>();

  Entity alarmEntity;
  if (!decodeSetting(cfg["alarm_entity"], alarmEntity)) {
    err = "alarm_entity: expected { name, unique_id, state_topic, command_topic }";
    return false;
  }

  std::vector<Entity> motion;
  if (!decodeSetting(cfg["motion_entities"], motion)) {
    err = "motion_entities: expected an array of entities";
    return false;
  }

  bool hasSettings = !cfg["alarm_settings"].isNull();
  AlarmSettings settings;
  if (hasSettings && !alarmSettingsFrom_(cfg["alarm_settings"], settings)) {
    err = "alarm_settings: bad initial_state / timeout";
    return false;
  }

  SettingsResult r = store.reset();
  if (!r.ok()) return fail_(err, "reset", r);

  r = store.set(KEY_MAC_ADDRESS, mac, sizeof(mac));
  if (!r.ok()) return fail_(err, KEY_MAC_ADDRESS, r);

  if (!setText_(store, cfg, "hostname",              KEY_HOSTNAME, err))              return false;
  if (!setText_(store, cfg, "mqtt_endpoint",         KEY_MQTT_ENDPOINT, err))         return false;
  if (!setText_(store, cfg, "availability_topic",    KEY_AVAILABILITY_TOPIC, err))    return false;
  if (!setText_(store, cfg, "ota_topic",             KEY_OTA_TOPIC, err))             return false;
  if (!setText_(store, cfg, "settings_topic_prefix", KEY_SETTINGS_TOPIC_PREFIX, err)) return false;

  r = store.set(KEY_SIREN_PIN, &sirenPin, 1);
  if (!r.ok()) return fail_(err, KEY_SIREN_PIN, r);

  std::vector<uint8_t> buf(4096);
  r = store.setStructured(KEY_ALARM_ENTITY, alarmEntity, buf.data(), 1024);
  if (!r.ok()) return fail_(err, KEY_ALARM_ENTITY, r);

  if (hasSettings) {
    r = store.setStructured(KEY_ALARM_SETTINGS, settings, buf.data(), 1024);
    if (!r.ok()) return fail_(err, KEY_ALARM_SETTINGS, r);
  }

  r = store.setStructured(KEY_MOTION_ENTITIES, motion, buf.data(), buf.size());
  if (!r.ok()) return fail_(err, KEY_MOTION_ENTITIES, r);

  DBG_PRINTF("[Provision] %u motion sensor(s), siren GPIO %u%s\n",
             (unsigned)motion.size(), (unsigned)sirenPin,
             hasSettings ? ", alarm settings" : "");
  return true;
}
