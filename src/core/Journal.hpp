/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#pragma once
/**
 * @file Journal.h
 * @brief Persistent event journal seam.
 *
 * The panel plugs the SPIFFS Logger in; host builds leave it unset and
 * only the debug console sees these events.
 */

class Journal {
public:
  virtual ~Journal() = default;

  virtual void logAlarmState(const char* from, const char* to) = 0;
  virtual void logCommand(const char* command, bool applied) = 0;
  virtual void logFault(const char* where, const char* detail) = 0;
};
