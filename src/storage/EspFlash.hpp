/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ESP_FLASH_H
#define ESP_FLASH_H
/**
 * @file EspFlash.h
 * @brief NorFlash over the ESP32 SPI flash chip, writable only inside the
 *        settings partition.
 *
 * Offsets are absolute chip addresses, so the FlashMap range is
 * [partitionStart(), partitionEnd()). Writes/erases outside it fail with
 * FlashError::ReadOnly; the application image can never be touched.
 */

#include <NorFlash.hpp>
#include <esp_flash.h>
#include <esp_partition.h>

class EspFlash : public NorFlash {
public:
    static const size_t READ_SIZE  = 4;
    static const size_t WRITE_SIZE = 4;
    static const size_t ERASE_SIZE = 4096;

    EspFlash();

    // Locate the partition by type (SETTINGS_PARTITION_TYPE). false if absent.
    bool begin();

    FlashError read(uint32_t offset, uint8_t* out, size_t len) override;
    FlashError write(uint32_t offset, const uint8_t* data, size_t len) override;
    FlashError erase(uint32_t from, uint32_t to) override;

    size_t  readSize() const override  { return READ_SIZE; }
    size_t  writeSize() const override { return WRITE_SIZE; }
    size_t  eraseSize() const override { return ERASE_SIZE; }
    size_t  capacity() const override  { return chipSize_; }
    int32_t lastCode() const override  { return lastCode_; }

    uint32_t partitionStart() const { return start_; }
    uint32_t partitionEnd() const   { return end_; }

private:
    EspFlash(const EspFlash&) = delete;
    EspFlash& operator=(const EspFlash&) = delete;

    FlashError map_(esp_err_t err);
    bool       inPartition_(uint32_t offset, size_t len) const;
    bool       inChip_(uint32_t offset, size_t len) const;

    const esp_partition_t* part_  = nullptr;
    esp_flash_t*           chip_  = nullptr;
    uint32_t               chipSize_ = 0;
    uint32_t               start_ = 0;
    uint32_t               end_   = 0;
    int32_t                lastCode_ = 0;
};

#endif // ESP_FLASH_H
