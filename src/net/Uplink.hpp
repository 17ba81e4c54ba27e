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
 * @file Uplink.h
 * @brief Publish side of the home-automation link (pub/sub client).
 *
 * The inbound side calls Scheduler::onMessage() from the transport.
 */

#include <stddef.h>
#include <stdint.h>

class Uplink {
public:
  virtual ~Uplink() = default;

  virtual bool isOnline() = 0;
  virtual bool publish(const char* topic, const uint8_t* payload, size_t len, bool retain) = 0;
};
