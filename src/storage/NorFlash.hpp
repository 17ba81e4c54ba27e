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
 * @file NorFlash.h
 * @brief Raw NOR-flash primitive: read / erase / program over absolute offsets.
 *
 * Rules every implementation enforces:
 *  - read offset + length are multiples of readSize()
 *  - write offset + length are multiples of writeSize()
 *  - erase range [from, to) is aligned to eraseSize()
 *  - programming can only clear bits (1 -> 0); erase sets a block to 0xFF
 */

#include <cstddef>
#include <cstdint>

enum class FlashError : uint8_t {
  None          = 0,
  NotAligned    = 1,
  OutOfBounds   = 2,
  BadWrite      = 3,
  Busy          = 4,    // device in use by another client
  NotSupported  = 5,
  ReadOnly      = 6,    // region overlaps a protected range
  Other         = 7,    // see lastCode() for the device code
};

const char* flashErrorName(FlashError e);

class NorFlash {
public:
  virtual ~NorFlash() = default;

  virtual FlashError read(uint32_t offset, uint8_t* out, size_t len) = 0;
  virtual FlashError write(uint32_t offset, const uint8_t* data, size_t len) = 0;
  virtual FlashError erase(uint32_t from, uint32_t to) = 0;

  virtual size_t readSize() const  = 0;
  virtual size_t writeSize() const = 0;
  virtual size_t eraseSize() const = 0;
  virtual size_t capacity() const  = 0;

  // Raw device code of the last FlashError::Other (0 if none).
  virtual int32_t lastCode() const { return 0; }
};
