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
 * @file DigitalIo.h
 * @brief GPIO seam used by MotionSensor and Siren.
 *
 * ArduinoIo implements it with pinMode/digitalRead/digitalWrite on the
 * panel. Pins are plain GPIO numbers as provisioned in the settings.
 */

#include <stdint.h>

class DigitalIo {
public:
  virtual ~DigitalIo() = default;

  virtual bool configureInput(uint8_t pin, bool pullDown) = 0;
  virtual bool configureOutput(uint8_t pin) = 0;
  virtual bool read(uint8_t pin) = 0;                 // true = high
  virtual bool write(uint8_t pin, bool high) = 0;     // false if the pin is unusable
};
