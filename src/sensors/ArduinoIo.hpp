/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ARDUINO_IO_H
#define ARDUINO_IO_H

#include <DigitalIo.hpp>

// DigitalIo on the Arduino-ESP32 core. Rejects numbers that are not a GPIO
// of this chip (or not output capable) instead of letting the core log.
class ArduinoIo : public DigitalIo {
public:
    bool configureInput(uint8_t pin, bool pullDown) override;
    bool configureOutput(uint8_t pin) override;
    bool read(uint8_t pin) override;
    bool write(uint8_t pin, bool high) override;
};

#endif // ARDUINO_IO_H
