#ifndef UTILS_H
#define UTILS_H
/**
 * @file Utils.h
 * @brief Synchronous debug printing with optional simple grouping.
 *
 * - DBG_PRINT/DBG_PRINTLN/DBG_PRINTF print directly to the console
 *   (Serial on the panel, stdout on the host build).
 * - DBGSTR/DBGSTP capture a burst into a static buffer and flush on STOP,
 *   so multi-line banners from different tasks don't interleave.
 * - No FreeRTOS usage: no tasks, no queues, no mutexes.
 */

#include <stdarg.h>
#include <stddef.h>
#include <stdint.h>
#ifdef ARDUINO
#include <Arduino.h>
#endif
// ===================== Global debug switch =====================

#ifndef DBGMD
#define DBGMD true
#endif

#define SERIAL_BAUD_RATE 115200

// Capacity for grouped-burst buffer (bytes). Safe to lower if RAM is tight.

#define DBG_GROUP_MAX 2048
#define DBG_LINE_MAX  256


namespace Debug {
  // Initialize the console on first use (idempotent)
  void begin(unsigned long baud = SERIAL_BAUD_RATE);

  // Strings
  void print(const char* s);
  void println(const char* s);
  void println(); // blank line
#ifdef ARDUINO
  void print(const String& s);
  void println(const String& s);
#endif

  // Numbers
  void print(int32_t v);
  void print(uint32_t v);
  void print(long v);
  void print(unsigned long v);
  void println(int32_t v);
  void println(uint32_t v);
  void println(long v);
  void println(unsigned long v);

  // printf-style (bounded)
  void printf(const char* fmt, ...);

  // ===== GROUPED PRINTING (simple, no locks) =====
  void groupStart();
  void groupStop(bool addTrailingNewline = false);
  void groupCancel();

  // Backend hook: raw console write (Serial or stdout).
  void write_(const char* data, size_t n);
}

// ===================== Debug macros =====================
#if DBGMD
  #define DBG_PRINT(...)     Debug::print(__VA_ARGS__)
  #define DBG_PRINTLN(...)   Debug::println(__VA_ARGS__)
  #define DBG_PRINTF(...)    Debug::printf(__VA_ARGS__)
  #ifndef DBGSTR
    #define DBGSTR()      Debug::groupStart()
  #endif
  #ifndef DBGSTP
    #define DBGSTP()       Debug::groupStop(false)
  #endif
#else
  #define DBG_PRINT(...)     do{}while(0)
  #define DBG_PRINTLN(...)   do{}while(0)
  #define DBG_PRINTF(...)    do{}while(0)
  #define DBGSTR()        do{}while(0)
  #define DBGSTP()         do{}while(0)
#endif
#endif
