/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef COMMAND_API_H
#define COMMAND_API_H

#include <AlarmTypes.hpp>
#include <stddef.h>
#include <stdint.h>

/**
 * @file CommandAPI.h
 * @brief Text vocabulary between the panel and the home-automation side.
 *
 * NOTES:
 *  - Inbound words are matched case-insensitively.
 *  - "SETTINGS" carries a JSON object after one space:
 *        SETTINGS {"initial_state":"Armed","arming_timeout":60,"pending_timeout":5}
 *  - Outbound payloads are published retained to the entity state topic.
 */

// ============================================================================
// Inbound alarm command words (alarm entity command topic)
// ============================================================================

#define CMDW_ARM_AWAY           "ARM_AWAY"           // Arm with exit delay
#define CMDW_ARM_CUSTOM_BYPASS  "ARM_CUSTOM_BYPASS"  // Arm instantly
#define CMDW_DISARM             "DISARM"
#define CMDW_TRIGGER            "TRIGGER"            // Manual trigger (Armed only)
#define CMDW_UNTRIGGER          "UNTRIGGER"          // Pending/Triggered -> Armed
#define CMDW_SETTINGS           "SETTINGS"           // + JSON alarm settings
#define CMDW_REBOOT             "REBOOT"             // restart the panel

// ============================================================================
// Outbound payloads
// ============================================================================

#define PAYLOAD_MOTION_ON       "ON"
#define PAYLOAD_MOTION_OFF      "OFF"
#define PAYLOAD_ONLINE          "online"
#define PAYLOAD_OFFLINE         "offline"

#define PAYLOAD_DISARMED        "disarmed"
#define PAYLOAD_ARMING          "arming"
#define PAYLOAD_ARMED_AWAY      "armed_away"
#define PAYLOAD_PENDING         "pending"
#define PAYLOAD_TRIGGERED       "triggered"

// ============================================================================
// Topics
// ============================================================================

#define SETTINGS_SET_SUFFIX     "/set"               // <settings-topic-prefix>/set[/<key>]
#define DISCOVERY_PREFIX        "homeassistant"      // <prefix>/<variant>/<unique_id>/config

// ============================================================================
// Parsing helpers
// ============================================================================

enum class CommandWord : uint8_t {
  Unknown = 0,
  Arm,
  ArmInstantly,
  Disarm,
  Trigger,
  Untrigger,
  Settings,
  Reboot,
};

// Match the leading word of `payload`. `args` points past the word and
// its separating spaces (empty string when none).
CommandWord parseCommandWord(const char* payload, size_t len,
                             const char** args = nullptr, size_t* argsLen = nullptr);

// Word -> alarm command. false for Settings/Reboot/Unknown.
bool commandFromWord(CommandWord w, AlarmCommand& out);

// JSON object with initial_state / arming_timeout / pending_timeout.
bool parseSettingsJson(const char* json, size_t len, AlarmSettings& out);

const char* alarmStatePayload(AlarmStateKind k);

#endif // COMMAND_API_H
