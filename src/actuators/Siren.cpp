#include <Siren.hpp>
#include <Utils.hpp>

Siren::Siren(uint8_t pin, DigitalIo& io)
: pin_(pin), io_(&io) {}

bool Siren::begin() {
    if (!io_->configureOutput(pin_)) {
        DBG_PRINTF("[Siren] pin %u could not be configured\n", (unsigned)pin_);
        return false;
    }
    on_ = true;          // force the first write
    return set(false);
}

bool Siren::set(bool on) {
    if (on == on_) return true;
    if (!io_->write(pin_, on)) {
        DBG_PRINTF("[Siren] write %s on pin %u failed\n", on ? "HIGH" : "LOW", (unsigned)pin_);
        return false;
    }
    on_ = on;
    DBG_PRINTF("[Siren] %s\n", on ? "ON" : "OFF");
    return true;
}
