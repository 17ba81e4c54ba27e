#include <EspFlash.hpp>
#include <Config.hpp>
#include <Utils.hpp>

EspFlash::EspFlash() {}

bool EspFlash::begin() {
    part_ = esp_partition_find_first((esp_partition_type_t)SETTINGS_PARTITION_TYPE,
                                     ESP_PARTITION_SUBTYPE_ANY, NULL);
    if (!part_) {
        DBG_PRINTF("[Flash] no partition of type 0x%02X\n", (unsigned)SETTINGS_PARTITION_TYPE);
        return false;
    }

    chip_ = part_->flash_chip;      // NULL = main chip for every esp_flash_* call
    if (esp_flash_get_size(chip_, &chipSize_) != ESP_OK) {
        DBG_PRINTLN("[Flash] cannot read chip size");
        return false;
    }

    start_ = part_->address;
    end_   = part_->address + part_->size;
    if ((start_ % ERASE_SIZE) || (end_ % ERASE_SIZE)) {
        DBG_PRINTF("[Flash] partition '%s' is not sector aligned\n", part_->label);
        return false;
    }

    DBG_PRINTF("[Flash] settings partition '%s' @0x%06lX, %lu bytes\n",
               part_->label, (unsigned long)start_, (unsigned long)(end_ - start_));
    return true;
}

bool EspFlash::inChip_(uint32_t offset, size_t len) const {
    return offset <= chipSize_ && len <= chipSize_ - offset;
}

bool EspFlash::inPartition_(uint32_t offset, size_t len) const {
    return offset >= start_ && offset <= end_ && len <= end_ - offset;
}

FlashError EspFlash::map_(esp_err_t err) {
    switch (err) {
        case ESP_OK:                    return FlashError::None;
        case ESP_ERR_FLASH_PROTECTED:   return FlashError::ReadOnly;
        case ESP_ERR_NOT_SUPPORTED:     return FlashError::NotSupported;
        case ESP_ERR_FLASH_OP_TIMEOUT:  return FlashError::Busy;
        default:
            lastCode_ = (int32_t)err;
            return FlashError::Other;
    }
}

FlashError EspFlash::read(uint32_t offset, uint8_t* out, size_t len) {
    if (!part_)                                      return FlashError::NotSupported;
    if ((offset % READ_SIZE) || (len % READ_SIZE))   return FlashError::NotAligned;
    if (!inChip_(offset, len))                       return FlashError::OutOfBounds;
    if (!len) return FlashError::None;
    return map_(esp_flash_read(chip_, out, offset, len));
}

FlashError EspFlash::write(uint32_t offset, const uint8_t* data, size_t len) {
    if (!part_)                                      return FlashError::NotSupported;
    if ((offset % WRITE_SIZE) || (len % WRITE_SIZE)) return FlashError::NotAligned;
    if (!inChip_(offset, len))                       return FlashError::OutOfBounds;
    if (!inPartition_(offset, len))                  return FlashError::ReadOnly;
    if (!len) return FlashError::None;
    return map_(esp_flash_write(chip_, data, offset, len));
}

FlashError EspFlash::erase(uint32_t from, uint32_t to) {
    if (!part_)                                      return FlashError::NotSupported;
    if (to < from)                                   return FlashError::OutOfBounds;
    if ((from % ERASE_SIZE) || (to % ERASE_SIZE))    return FlashError::NotAligned;
    if (!inChip_(from, to - from))                   return FlashError::OutOfBounds;
    if (!inPartition_(from, to - from))              return FlashError::ReadOnly;
    if (to == from) return FlashError::None;
    return map_(esp_flash_erase_region(chip_, from, to - from));
}
