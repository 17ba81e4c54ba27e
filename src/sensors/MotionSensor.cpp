#include <MotionSensor.hpp>
#include <Utils.hpp>

MotionSensor::MotionSensor(const Entity* entity, uint8_t pin, DigitalIo& io)
: entity_(entity), pin_(pin), io_(&io) {}

void MotionSensor::begin() {
    if (!io_->configureInput(pin_, /*pullDown=*/true)) {
        DBG_PRINTF("[Motion] pin %u could not be configured\n", (unsigned)pin_);
    }
}

MotionSensor::Edge MotionSensor::poll() {
    const bool lvl = io_->read(pin_);
    if (lvl == lastLevel_) return EDGE_NONE;

    lastLevel_ = lvl;
    DBG_PRINTF("[Motion] %s %s\n",
               entity_ ? entity_->name.c_str() : "?",
               lvl ? "detected" : "cleared");
    return lvl ? EDGE_RISING : EDGE_FALLING;
}
