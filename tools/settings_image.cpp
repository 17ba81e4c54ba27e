/**************************************************************
 *  settings_image: turn a JSON panel description into a flashable
 *  settings partition binary.
 *
 *    settings_image [--size N] <config.json> <out.bin>
 *
 *  Flash the result at the settings partition offset, e.g.
 *    esptool.py write_flash 0x3F0000 out.bin
 **************************************************************/
#include <MemFlash.hpp>
#include <Provisioning.hpp>
#include <SettingsStore.hpp>
#include <Utils.hpp>
#include <fstream>
#include <iterator>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

namespace {
  // Same geometry as EspFlash, so the image reads back on the panel.
  const size_t IMAGE_READ_SIZE  = 4;
  const size_t IMAGE_WRITE_SIZE = 4;
  const size_t IMAGE_ERASE_SIZE = 4096;
  const size_t IMAGE_DEFAULT    = 0x2000;

  void usage_(const char* argv0) {
    DBG_PRINTF("usage: %s [--size N] <config.json> <out.bin>\n", argv0);
    DBG_PRINTF("  --size N   partition size in bytes (default 0x%zX)\n", IMAGE_DEFAULT);
  }

  bool readFile_(const std::string& path, std::string& out) {
    std::ifstream in(path.c_str(), std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
  }
}

int main(int argc, char** argv) {
  size_t size = IMAGE_DEFAULT;
  std::vector<std::string> pos;

  for (int i = 1; i < argc; ++i) {
    if (!strcmp(argv[i], "--size") || !strcmp(argv[i], "-s")) {
      if (i + 1 >= argc) { usage_(argv[0]); return 2; }
      char* end = nullptr;
      unsigned long v = strtoul(argv[++i], &end, 0);
      if (!end || *end || v == 0) { usage_(argv[0]); return 2; }
      size = (size_t)v;
    } else if (!strcmp(argv[i], "--help") || !strcmp(argv[i], "-h")) {
      usage_(argv[0]);
      return 0;
    } else {
      pos.push_back(argv[i]);
    }
  }
  if (pos.size() != 2) { usage_(argv[0]); return 2; }

  if (size % IMAGE_ERASE_SIZE) {
    DBG_PRINTF("[Image] size must be a multiple of %zu\n", IMAGE_ERASE_SIZE);
    return 2;
  }

  std::string json;
  if (!readFile_(pos[0], json)) {
    DBG_PRINTF("[Image] cannot read %s\n", pos[0].c_str());
    return 1;
  }

  MemFlash flash(size, IMAGE_READ_SIZE, IMAGE_WRITE_SIZE, IMAGE_ERASE_SIZE);
  static uint8_t buf[4096];
  SettingsStore store(flash, 0, (uint32_t)size, buf, sizeof(buf));

  std::string err;
  if (!provisionSettings(store, json.data(), json.size(), err)) {
    DBG_PRINTF("[Image] %s\n", err.c_str());
    return 1;
  }

  if (!flash.saveFile(pos[1])) {
    DBG_PRINTF("[Image] cannot write %s\n", pos[1].c_str());
    return 1;
  }
  DBG_PRINTF("[Image] wrote %zu bytes to %s\n", size, pos[1].c_str());
  return 0;
}
