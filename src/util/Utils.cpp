#include <Utils.hpp>
#include <stdio.h>
#include <string.h>


// ===================== Internal state (no RTOS) =====================
namespace {
  bool     s_groupActive  = false;
  char     s_groupBuf[DBG_GROUP_MAX];
  size_t   s_groupLen     = 0;

  inline void groupReset_() {
    s_groupLen = 0;
    s_groupBuf[0] = '\0';
  }

  inline void groupAppend_(const char* data, size_t n) {
    if (!data || n == 0) return;
    size_t space = DBG_GROUP_MAX - 1 - s_groupLen;
    if (space == 0) return; // drop overflow (non-fatal)
    if (n > space) n = space;
    memcpy(s_groupBuf + s_groupLen, data, n);
    s_groupLen += n;
    s_groupBuf[s_groupLen] = '\0';
  }

  inline void emit_(const char* s, bool nl) {
    if (!s_groupActive) {
      if (s) Debug::write_(s, strnlen(s, DBG_LINE_MAX - 1));
      if (nl) Debug::write_("\n", 1);
    } else {
      if (s) groupAppend_(s, strnlen(s, DBG_LINE_MAX - 1));
      if (nl) groupAppend_("\n", 1);
    }
  }

  // bounded printf helper
  inline void vprintff_(const char* fmt, va_list ap, bool with_nl = false) {
    char buf[DBG_LINE_MAX];
    vsnprintf(buf, sizeof(buf), fmt ? fmt : "", ap);
    emit_(buf, with_nl);
  }

  inline void emitf_(bool nl, const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    vprintff_(fmt, ap, nl);
    va_end(ap);
  }
} // namespace

// ===================== Debug API (sync) =====================
namespace Debug {
  // strings
  void print(const char* s)                   { emit_(s ? s : "", false); }
  void println(const char* s)                 { emit_(s ? s : "", true); }
  void println()                              { emit_("", true); }
#ifdef ARDUINO
  void print(const String& s)                 { emit_(s.c_str(), false); }
  void println(const String& s)               { emit_(s.c_str(), true); }
#endif

  // numbers
  void print(int32_t v)          { emitf_(false, "%ld", (long)v); }
  void print(uint32_t v)         { emitf_(false, "%lu", (unsigned long)v); }
  void print(long v)             { emitf_(false, "%ld", v); }
  void print(unsigned long v)    { emitf_(false, "%lu", v); }
  void println(int32_t v)        { emitf_(true, "%ld", (long)v); }
  void println(uint32_t v)       { emitf_(true, "%lu", (unsigned long)v); }
  void println(long v)           { emitf_(true, "%ld", v); }
  void println(unsigned long v)  { emitf_(true, "%lu", v); }

  // printf
  void printf(const char* fmt, ...) {
    va_list ap; va_start(ap, fmt);
    vprintff_(fmt, ap, false);
    va_end(ap);
  }

  // grouping
  void groupStart() {
    s_groupActive = true;
    groupReset_();
  }

  void groupStop(bool addTrailingNewline) {
    if (s_groupActive && s_groupLen > 0) {
      write_(s_groupBuf, s_groupLen);
    }
    if (addTrailingNewline) write_("\n", 1);
    s_groupActive = false;
    groupReset_();
  }

  void groupCancel() {
    s_groupActive = false;
    groupReset_();
  }
} // namespace Debug
