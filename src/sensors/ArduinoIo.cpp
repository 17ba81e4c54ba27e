#include <ArduinoIo.hpp>
#include <Arduino.h>
#include <Utils.hpp>
#include <driver/gpio.h>

bool ArduinoIo::configureInput(uint8_t pin, bool pullDown) {
    if (!GPIO_IS_VALID_GPIO(pin)) {
        DBG_PRINTF("[IO] GPIO %u is not an input\n", (unsigned)pin);
        return false;
    }
    pinMode(pin, pullDown ? INPUT_PULLDOWN : INPUT);
    return true;
}

bool ArduinoIo::configureOutput(uint8_t pin) {
    if (!GPIO_IS_VALID_OUTPUT_GPIO(pin)) {
        DBG_PRINTF("[IO] GPIO %u is not an output\n", (unsigned)pin);
        return false;
    }
    pinMode(pin, OUTPUT);
    return true;
}

bool ArduinoIo::read(uint8_t pin) {
    return digitalRead(pin) == HIGH;
}

bool ArduinoIo::write(uint8_t pin, bool high) {
    if (!GPIO_IS_VALID_OUTPUT_GPIO(pin)) return false;
    digitalWrite(pin, high ? HIGH : LOW);
    return true;
}
