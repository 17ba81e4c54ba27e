#include <gtest/gtest.h>
#include <CommandAPI.hpp>
#include <string>

namespace {

CommandWord parse(const std::string& s, std::string* args = nullptr) {
  const char* a = nullptr;
  size_t      n = 0;
  CommandWord w = parseCommandWord(s.data(), s.size(), &a, &n);
  if (args) args->assign(a, n);
  return w;
}

} // namespace

TEST(CommandAPI, WordsAreCaseInsensitiveAndTrimmed) {
  EXPECT_EQ(parse("ARM_AWAY"), CommandWord::Arm);
  EXPECT_EQ(parse("arm_away"), CommandWord::Arm);
  EXPECT_EQ(parse("  Arm_Custom_Bypass\r\n"), CommandWord::ArmInstantly);
  EXPECT_EQ(parse("disarm"), CommandWord::Disarm);
  EXPECT_EQ(parse("TRIGGER"), CommandWord::Trigger);
  EXPECT_EQ(parse("untrigger"), CommandWord::Untrigger);
  EXPECT_EQ(parse("reboot"), CommandWord::Reboot);
  EXPECT_EQ(parse(std::string("DISARM\0", 7)), CommandWord::Disarm);
}

TEST(CommandAPI, UnknownOrMalformedWords) {
  EXPECT_EQ(parse(""), CommandWord::Unknown);
  EXPECT_EQ(parse("   "), CommandWord::Unknown);
  EXPECT_EQ(parse("ARM"), CommandWord::Unknown);
  EXPECT_EQ(parse("ARM_AWAYS"), CommandWord::Unknown);
  EXPECT_EQ(parse("DISARM now"), CommandWord::Unknown);   // only SETTINGS takes arguments
  EXPECT_EQ(parseCommandWord(nullptr, 4), CommandWord::Unknown);
}

TEST(CommandAPI, SettingsCarriesJson) {
  std::string args;
  EXPECT_EQ(parse("settings   {\"a\":1}  ", &args), CommandWord::Settings);
  EXPECT_EQ(args, "{\"a\":1}");

  EXPECT_EQ(parse("SETTINGS", &args), CommandWord::Settings);
  EXPECT_TRUE(args.empty());
}

TEST(CommandAPI, WordToCommand) {
  AlarmCommand c;
  ASSERT_TRUE(commandFromWord(CommandWord::Arm, c));
  EXPECT_EQ(c.type, AlarmCommandType::Arm);
  ASSERT_TRUE(commandFromWord(CommandWord::ArmInstantly, c));
  EXPECT_EQ(c.type, AlarmCommandType::ArmInstantly);
  ASSERT_TRUE(commandFromWord(CommandWord::Trigger, c));
  EXPECT_EQ(c.type, AlarmCommandType::ManualTrigger);
  ASSERT_TRUE(commandFromWord(CommandWord::Untrigger, c));
  EXPECT_EQ(c.type, AlarmCommandType::Untrigger);

  EXPECT_FALSE(commandFromWord(CommandWord::Settings, c));
  EXPECT_FALSE(commandFromWord(CommandWord::Reboot, c));
  EXPECT_FALSE(commandFromWord(CommandWord::Unknown, c));
}

TEST(CommandAPI, SettingsJson) {
  const std::string ok = "{\"initial_state\":\"Triggered\",\"arming_timeout\":60,\"pending_timeout\":5}";
  AlarmSettings s;
  ASSERT_TRUE(parseSettingsJson(ok.data(), ok.size(), s));
  EXPECT_EQ(s.initialState, PersistedAlarmState::Triggered);
  EXPECT_EQ(s.armingTimeout, 60);
  EXPECT_EQ(s.pendingTimeout, 5);

  const std::string bad = "{\"initial_state\":\"Triggered\",\"arming_timeout\":60";
  EXPECT_FALSE(parseSettingsJson(bad.data(), bad.size(), s));
  EXPECT_FALSE(parseSettingsJson("", 0, s));
  EXPECT_FALSE(parseSettingsJson(nullptr, 3, s));
  EXPECT_EQ(s.pendingTimeout, 5);
}

TEST(CommandAPI, StatePayloads) {
  EXPECT_STREQ(alarmStatePayload(AlarmStateKind::Disarmed),  "disarmed");
  EXPECT_STREQ(alarmStatePayload(AlarmStateKind::Arming),    "arming");
  EXPECT_STREQ(alarmStatePayload(AlarmStateKind::Armed),     "armed_away");
  EXPECT_STREQ(alarmStatePayload(AlarmStateKind::Pending),   "pending");
  EXPECT_STREQ(alarmStatePayload(AlarmStateKind::Triggered), "triggered");
}
