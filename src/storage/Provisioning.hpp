/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef PROVISIONING_H
#define PROVISIONING_H
/**
 * @file Provisioning.h
 * @brief Build a settings partition from a JSON panel description.
 *
 * {
 *   "mac_address": "aa:bb:cc:dd:ee:ff",
 *   "hostname": "...", "mqtt_endpoint": "host:port",
 *   "availability_topic": "...", "ota_topic": "...",
 *   "settings_topic_prefix": "...",
 *   "siren_pin": 4,
 *   "alarm_entity":    { name, unique_id, state_topic, command_topic },
 *   "alarm_settings":  { initial_state, arming_timeout, pending_timeout },  (optional)
 *   "motion_entities": [ { name, unique_id, state_topic, gpio_pin }, ... ]
 * }
 *
 * Missing alarm_settings fields take the firmware defaults.
 */

#include <SettingsStore.hpp>
#include <string>

#ifndef PROVISION_DOC_CAPACITY
#define PROVISION_DOC_CAPACITY  8192
#endif

// "aa:bb:cc:dd:ee:ff" -> 6 bytes. Exactly six hex octets.
bool parseMacAddress(const char* text, uint8_t out[6]);

// reset() the store, then write every key of the description.
// On failure `err` names the key (or the JSON problem).
bool provisionSettings(SettingsStore& store, const char* json, size_t len, std::string& err);

#endif // PROVISIONING_H
