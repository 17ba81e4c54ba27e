/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef MEM_FLASH_H
#define MEM_FLASH_H
/**
 * @file MemFlash.h
 * @brief RAM image of a NOR part with the same rules as the real one.
 *
 * - Erased state is 0xFF, programming ANDs the new bytes in.
 * - Alignment / bounds checked exactly like EspFlash.
 * - Optional power-cut injection: after N programmed bytes every further
 *   write fails and only the first part of the interrupted write lands.
 * - loadFile()/saveFile() turn the image into a flashable partition binary.
 */

#include <NorFlash.hpp>
#include <string>
#include <vector>

class MemFlash : public NorFlash {
public:
    MemFlash(size_t capacity,
             size_t readSize  = 4,
             size_t writeSize = 4,
             size_t eraseSize = 4096);

    FlashError read(uint32_t offset, uint8_t* out, size_t len) override;
    FlashError write(uint32_t offset, const uint8_t* data, size_t len) override;
    FlashError erase(uint32_t from, uint32_t to) override;

    size_t readSize() const override  { return readSize_; }
    size_t writeSize() const override { return writeSize_; }
    size_t eraseSize() const override { return eraseSize_; }
    size_t capacity() const override  { return image_.size(); }

    // ---- power-cut injection ----
    // Allow `bytes` more programmed bytes, then fail every write.
    void   armPowerCut(size_t bytes);
    void   disarmPowerCut();
    bool   powerCutTripped() const { return tripped_; }

    // ---- counters (wear / test observation) ----
    uint32_t eraseCount() const { return erases_; }
    uint32_t writeCount() const { return writes_; }

    // ---- image I/O ----
    bool loadFile(const std::string& path);
    bool saveFile(const std::string& path) const;

    const std::vector<uint8_t>& image() const { return image_; }
    std::vector<uint8_t>&       image()       { return image_; }

private:
    bool inRange_(uint32_t offset, size_t len) const;

    std::vector<uint8_t> image_;
    size_t readSize_;
    size_t writeSize_;
    size_t eraseSize_;

    bool   cutArmed_  = false;
    bool   tripped_   = false;
    size_t budget_    = 0;

    uint32_t erases_  = 0;
    uint32_t writes_  = 0;
};

#endif // MEM_FLASH_H
