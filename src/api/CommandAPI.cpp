#include <CommandAPI.hpp>
#include <ctype.h>
#include <string.h>

namespace {
  struct WordEntry {
    const char* text;
    CommandWord word;
  };

  const WordEntry kWords[] = {
    { CMDW_ARM_AWAY,          CommandWord::Arm          },
    { CMDW_ARM_CUSTOM_BYPASS, CommandWord::ArmInstantly },
    { CMDW_DISARM,            CommandWord::Disarm       },
    { CMDW_TRIGGER,           CommandWord::Trigger      },
    { CMDW_UNTRIGGER,         CommandWord::Untrigger    },
    { CMDW_SETTINGS,          CommandWord::Settings     },
    { CMDW_REBOOT,            CommandWord::Reboot       },
  };

  bool equalsNoCase_(const char* a, size_t alen, const char* b) {
    const size_t blen = strlen(b);
    if (alen != blen) return false;
    for (size_t i = 0; i < alen; i++) {
      if (toupper((unsigned char)a[i]) != (unsigned char)b[i]) return false;
    }
    return true;
  }
}

CommandWord parseCommandWord(const char* payload, size_t len,
                             const char** args, size_t* argsLen) {
  if (args)    *args = "";
  if (argsLen) *argsLen = 0;
  if (!payload) return CommandWord::Unknown;

  // trim surrounding whitespace
  size_t b = 0, e = len;
  while (b < e && isspace((unsigned char)payload[b])) b++;
  while (e > b && (isspace((unsigned char)payload[e - 1]) || payload[e - 1] == '\0')) e--;

  size_t w = b;
  while (w < e && !isspace((unsigned char)payload[w])) w++;

  CommandWord found = CommandWord::Unknown;
  for (size_t i = 0; i < sizeof(kWords) / sizeof(kWords[0]); i++) {
    if (equalsNoCase_(payload + b, w - b, kWords[i].text)) {
      found = kWords[i].word;
      break;
    }
  }
  if (found == CommandWord::Unknown) return found;

  size_t a = w;
  while (a < e && isspace((unsigned char)payload[a])) a++;

  // only SETTINGS takes arguments
  if (found != CommandWord::Settings && a != e) return CommandWord::Unknown;

  if (args)    *args = payload + a;
  if (argsLen) *argsLen = e - a;
  return found;
}

bool commandFromWord(CommandWord w, AlarmCommand& out) {
  switch (w) {
    case CommandWord::Arm:          out = AlarmCommand::of(AlarmCommandType::Arm);           return true;
    case CommandWord::ArmInstantly: out = AlarmCommand::of(AlarmCommandType::ArmInstantly);  return true;
    case CommandWord::Disarm:       out = AlarmCommand::of(AlarmCommandType::Disarm);        return true;
    case CommandWord::Trigger:      out = AlarmCommand::of(AlarmCommandType::ManualTrigger); return true;
    case CommandWord::Untrigger:    out = AlarmCommand::of(AlarmCommandType::Untrigger);     return true;
    case CommandWord::Settings:
    case CommandWord::Reboot:
    case CommandWord::Unknown:
      break;
  }
  return false;
}

bool parseSettingsJson(const char* json, size_t len, AlarmSettings& out) {
  if (!json || !len) return false;
  DynamicJsonDocument doc(512);
  DeserializationError err = deserializeJson(doc, json, len);
  if (err) return false;
  return decodeSetting(doc.as<JsonVariantConst>(), out);
}

const char* alarmStatePayload(AlarmStateKind k) {
  switch (k) {
    case AlarmStateKind::Disarmed:  return PAYLOAD_DISARMED;
    case AlarmStateKind::Arming:    return PAYLOAD_ARMING;
    case AlarmStateKind::Armed:     return PAYLOAD_ARMED_AWAY;
    case AlarmStateKind::Pending:   return PAYLOAD_PENDING;
    case AlarmStateKind::Triggered: return PAYLOAD_TRIGGERED;
  }
  return PAYLOAD_DISARMED;
}
