#include <Utils.hpp>
#include <stdio.h>

// stdout backend for the Debug helpers (host build: tests + tools).
namespace Debug {
  void begin(unsigned long) {}

  void write_(const char* data, size_t n) {
    fwrite(data, 1, n, stdout);
    fflush(stdout);
  }
} // namespace Debug
