/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SETTINGS_KEYS_H
#define SETTINGS_KEYS_H

// ============================================================================
//  SETTINGS PARTITION KEYS + Defaults
//  Groups: Alarm, Hardware description, Network
//  NOTE: every key used by the firmware must be listed in SETTINGS_KEY_LIST,
//        the registry test checks they hash to distinct non-zero values.
// ============================================================================

// ---------------------------
// Alarm (written by the panel)
// ---------------------------
#define KEY_ALARM_SETTINGS          "alarm-settings"         // msgpack map  : AlarmSettings
#define KEY_PERSISTED_ALARM_STATE   "persisted-alarm-state"  // msgpack str  : Disarmed|Armed|Triggered

#define ALARM_INITIAL_STATE_DEFAULT     PersistedAlarmState::Disarmed
#define ALARM_ARMING_TIMEOUT_DEFAULT    90     // s
#define ALARM_PENDING_TIMEOUT_DEFAULT   30     // s

// ---------------------------
// Hardware description (provisioned)
// ---------------------------
#define KEY_SIREN_PIN               "siren-pin"              // 1 raw byte   : GPIO number
#define KEY_MOTION_ENTITIES         "motion-entities"        // msgpack array: Entity[]
#define KEY_ALARM_ENTITY            "alarm-entity"           // msgpack map  : Entity

// ---------------------------
// Network (provisioned, consumed by the uplink)
// ---------------------------
#define KEY_MAC_ADDRESS             "mac-address"            // 6 raw bytes
#define KEY_HOSTNAME                "hostname"               // utf-8
#define KEY_MQTT_ENDPOINT           "mqtt-endpoint"          // utf-8 host:port
#define KEY_AVAILABILITY_TOPIC      "availability-topic"     // utf-8
#define KEY_OTA_TOPIC               "ota-topic"              // utf-8
#define KEY_SETTINGS_TOPIC_PREFIX   "settings-topic-prefix"  // utf-8

#define SETTINGS_KEY_LIST {          \
    KEY_ALARM_SETTINGS,              \
    KEY_PERSISTED_ALARM_STATE,       \
    KEY_SIREN_PIN,                   \
    KEY_MOTION_ENTITIES,             \
    KEY_ALARM_ENTITY,                \
    KEY_MAC_ADDRESS,                 \
    KEY_HOSTNAME,                    \
    KEY_MQTT_ENDPOINT,               \
    KEY_AVAILABILITY_TOPIC,          \
    KEY_OTA_TOPIC,                   \
    KEY_SETTINGS_TOPIC_PREFIX        \
}

#endif // SETTINGS_KEYS_H
