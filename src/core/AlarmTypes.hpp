/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ALARM_TYPES_H
#define ALARM_TYPES_H
/**
 * @file AlarmTypes.h
 * @brief Alarm state, settings, commands, events and entity descriptions.
 *
 * Structured values stored in the settings partition provide
 * encodeSetting()/decodeSetting() (MessagePack through ArduinoJson):
 *   PersistedAlarmState -> "Disarmed" | "Armed" | "Triggered"
 *   AlarmSettings       -> { initial_state, arming_timeout, pending_timeout }
 *   Entity              -> { name, variant, unique_id, state_topic, command_topic, gpio_pin }
 *   std::vector<Entity> -> [ Entity, ... ]
 */

#include <ArduinoJson.h>
#include <stdint.h>
#include <string>
#include <vector>

// ---------------------------
// Runtime state
// ---------------------------
enum class AlarmStateKind : uint8_t {
  Disarmed  = 0,
  Arming    = 1,
  Armed     = 2,
  Pending   = 3,
  Triggered = 4,
};

struct AlarmState {
  AlarmStateKind kind        = AlarmStateKind::Disarmed;
  uint32_t       startedAtMs = 0;     // Arming / Armed / Pending only

  static AlarmState disarmed()              { return AlarmState(AlarmStateKind::Disarmed, 0); }
  static AlarmState arming(uint32_t now)    { return AlarmState(AlarmStateKind::Arming, now); }
  static AlarmState armed(uint32_t now)     { return AlarmState(AlarmStateKind::Armed, now); }
  static AlarmState pending(uint32_t now)   { return AlarmState(AlarmStateKind::Pending, now); }
  static AlarmState triggered()             { return AlarmState(AlarmStateKind::Triggered, 0); }

  AlarmState() = default;
  AlarmState(AlarmStateKind k, uint32_t t) : kind(k), startedAtMs(t) {}

  bool operator==(const AlarmState& o) const { return kind == o.kind && startedAtMs == o.startedAtMs; }
  bool operator!=(const AlarmState& o) const { return !(*this == o); }
};

const char* alarmStateName(AlarmStateKind k);

// ---------------------------
// Persisted state (survives restarts)
// ---------------------------
enum class PersistedAlarmState : uint8_t {
  Disarmed  = 0,
  Armed     = 1,
  Triggered = 2,
};

PersistedAlarmState persistedFrom(const AlarmState& s);
AlarmState          recoverFrom(PersistedAlarmState p, uint32_t nowMs);
const char*         persistedName(PersistedAlarmState p);
bool                persistedFromName(const char* s, PersistedAlarmState& out);

bool encodeSetting(const PersistedAlarmState& v, JsonVariant dst);
bool decodeSetting(JsonVariantConst src, PersistedAlarmState& v);

// ---------------------------
// Settings
// ---------------------------
struct AlarmSettings {
  PersistedAlarmState initialState   = PersistedAlarmState::Disarmed;
  uint16_t            armingTimeout  = 90;   // s
  uint16_t            pendingTimeout = 30;   // s

  bool operator==(const AlarmSettings& o) const {
    return initialState == o.initialState && armingTimeout == o.armingTimeout &&
           pendingTimeout == o.pendingTimeout;
  }
  bool operator!=(const AlarmSettings& o) const { return !(*this == o); }
};

AlarmSettings defaultAlarmSettings();

bool encodeSetting(const AlarmSettings& v, JsonVariant dst);
bool decodeSetting(JsonVariantConst src, AlarmSettings& v);

// ---------------------------
// Entities (hardware / topic description)
// ---------------------------
#define ENTITY_VARIANT_BINARY_SENSOR   "binary_sensor"
#define ENTITY_VARIANT_SENSOR          "sensor"

struct Entity {
  std::string name;
  std::string variant;          // discovery component, empty when not provisioned
  std::string uniqueId;
  std::string stateTopic;
  std::string commandTopic;
  int16_t     gpioPin = -1;     // motion sensors only
};

bool encodeSetting(const Entity& v, JsonVariant dst);
bool decodeSetting(JsonVariantConst src, Entity& v);
bool encodeSetting(const std::vector<Entity>& v, JsonVariant dst);
bool decodeSetting(JsonVariantConst src, std::vector<Entity>& v);

// ---------------------------
// Commands (inbound) / events (outbound)
// ---------------------------
enum class AlarmCommandType : uint8_t {
  Arm            = 0,
  ArmInstantly   = 1,
  Disarm         = 2,
  ManualTrigger  = 3,
  Untrigger      = 4,
  UpdateSettings = 5,
};

struct AlarmCommand {
  AlarmCommandType type = AlarmCommandType::Disarm;
  AlarmSettings    settings;          // UpdateSettings only

  static AlarmCommand of(AlarmCommandType t) {
    AlarmCommand c;
    c.type = t;
    return c;
  }
  static AlarmCommand update(const AlarmSettings& s) {
    AlarmCommand c;
    c.type     = AlarmCommandType::UpdateSettings;
    c.settings = s;
    return c;
  }
};

const char* alarmCommandName(AlarmCommandType t);

enum class AlarmEventType : uint8_t {
  MotionDetected    = 0,
  MotionCleared     = 1,
  AlarmStateChanged = 2,
};

struct AlarmEvent {
  AlarmEventType type   = AlarmEventType::AlarmStateChanged;
  const Entity*  entity = nullptr;    // owned by the panel, lives forever
  AlarmStateKind state  = AlarmStateKind::Disarmed;   // AlarmStateChanged only
};

#endif // ALARM_TYPES_H
