/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_H
#define CONFIG_H

/**
 * @file Config.h
 * @brief Central build-time configuration for the alarm panel.
 *
 * @details
 * What lives where:
 * 1) Hardware description (siren pin, motion sensors, entity names)
 *    - NOT here: read from the settings partition at boot
 *      (keys in SettingsKeys.hpp, image built by tools/settings_image).
 *
 * 2) Settings partition
 *    - SETTINGS_PARTITION_TYPE, SETTINGS_BUFFER_SIZE
 *    - Purpose: locate the raw flash range and size the record buffer.
 *
 * 3) Alarm loop timing
 *    - ALARM_LOOP_PERIOD_MS, EVENT_QUEUE_DEPTH, COMMAND_QUEUE_DEPTH
 *
 * 4) RTOS task layout (stacks, priorities, cores)
 *
 * 5) Boot bookkeeping in NVS (Preferences) + journal path.
 *
 * Notes:
 * - Every tunable can be overridden with -D at build time.
 * - No Arduino includes here: the host build (tests, tools) uses this file.
 */

// ---------------------------
// Storage helpers
// ---------------------------
#ifndef CONFIG_PARTITION
#define CONFIG_PARTITION        "config"       // Preferences namespace (boot bookkeeping)
#endif
#ifndef LOGFILE_PATH
#define LOGFILE_PATH            "/Log/log.json"
#endif

// ============================================================================
//  Settings partition (raw NOR range behind SettingsStore)
// ============================================================================
#ifndef SETTINGS_PARTITION_TYPE
#define SETTINGS_PARTITION_TYPE 0x9E           // custom data partition type
#endif
#ifndef SETTINGS_BUFFER_SIZE
#define SETTINGS_BUFFER_SIZE    4096           // record buffer, >= largest value + headers
#endif
#ifndef SETTINGS_WRITE_BUF_SIZE
#define SETTINGS_WRITE_BUF_SIZE 1024           // MessagePack encode buffer for alarm writes
#endif
#ifndef SETTINGS_KEY_GUARD
#define SETTINGS_KEY_GUARD      0              // 1 = store key strings with values (dev builds)
#endif

// ============================================================================
//  Alarm behaviour
// ============================================================================
#ifndef ALARM_LOOP_PERIOD_MS
#define ALARM_LOOP_PERIOD_MS    250
#endif
#ifndef EVENT_QUEUE_DEPTH
#define EVENT_QUEUE_DEPTH       32             // outbound events, motion edges dropped first when full
#endif
#ifndef COMMAND_QUEUE_DEPTH
#define COMMAND_QUEUE_DEPTH     8
#endif
#ifndef MAX_MOTION_SENSORS
#define MAX_MOTION_SENSORS      8
#endif

// ============================================================================
//  Scheduler / uplink
// ============================================================================
#ifndef SCHEDULER_PERIOD_MS
#define SCHEDULER_PERIOD_MS     50
#endif
#ifndef SETTING_KEY_MAX
#define SETTING_KEY_MAX         32             // remote "set setting" key limit (bytes)
#endif
#ifndef DISCOVERY_DOC_CAPACITY
#define DISCOVERY_DOC_CAPACITY  1024           // one entity's discovery config
#endif
#ifndef UPLINK_LINE_MAX
#define UPLINK_LINE_MAX         256            // bench serial uplink line buffer
#endif

// ============================================================================
//  RTOS Task Configuration (stacks, priorities, core assignment)
// ============================================================================
#define CORE_0                  0
#define CORE_1                  1

// Alarm state machine (sensor polling + siren)
#ifndef ALARM_TASK_STACK_SIZE
#define ALARM_TASK_STACK_SIZE           8192
#endif
#define ALARM_TASK_CORE                 CORE_1
#define ALARM_TASK_PRIORITY             2

// Scheduler (event drain + command routing)
#ifndef SCHEDULER_TASK_STACK_SIZE
#define SCHEDULER_TASK_STACK_SIZE       8192
#endif
#define SCHEDULER_TASK_CORE             CORE_0
#define SCHEDULER_TASK_PRIORITY         1

// Supervisor (watches the two workers)
#define SUPERVISOR_PERIOD_MS            500
#define RESTART_COUNTDOWN_MS            5000

// ============================================================================
//  Boot bookkeeping (NVS / Preferences). Keys <= 15 chars.
// ============================================================================
#define BOOT_COUNT_KEY                  "BOOTC"   // int    : boots since flash
#define LAST_RESET_REASON_KEY           "RSTRS"   // string : why we restarted last
#define LAST_RESET_REASON_DEFAULT       "power-on"

#endif // CONFIG_H
