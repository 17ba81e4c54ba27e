#include <gtest/gtest.h>
#include <Alarm.hpp>
#include <FakeGpio.hpp>
#include <FakeLock.hpp>
#include <MemFlash.hpp>
#include <SettingsKeys.hpp>
#include <memory>
#include <string>
#include <vector>

namespace {

const uint8_t SIREN_PIN = 4;
const uint8_t HALL_PIN  = 27;
const uint8_t DOOR_PIN  = 26;

class RecordingJournal : public Journal {
public:
  void logAlarmState(const char* from, const char* to) override {
    states.push_back(std::string(from) + ">" + to);
  }
  void logCommand(const char* command, bool applied) override {
    commands.push_back(std::string(command) + (applied ? ":ok" : ":ignored"));
  }
  void logFault(const char* where, const char* detail) override {
    faults.push_back(std::string(where) + ":" + detail);
  }

  std::vector<std::string> states;
  std::vector<std::string> commands;
  std::vector<std::string> faults;
};

Entity makeEntity(const char* name, int16_t pin) {
  Entity e;
  e.name       = name;
  e.uniqueId   = std::string(name) + "_id";
  e.stateTopic = std::string("panel/") + name;
  e.gpioPin    = pin;
  return e;
}

struct AlarmTest : public ::testing::Test {
  AlarmTest()
  : flash(0x2000, 4, 4, 4096),
    store(flash, 0, 0x2000, buf, sizeof(buf)),
    shared(store, settingsLock),
    events(eventLock, 64),
    commands(commandLock, 8),
    alarmEntity(makeEntity("alarm", -1)),
    hall(makeEntity("hall", HALL_PIN)),
    door(makeEntity("door", DOOR_PIN)) {
    alarmEntity.commandTopic = "panel/alarm/set";
    EXPECT_TRUE(shared.reset().ok());
    commands.attachSender();
  }

  Alarm& start(uint32_t nowMs = 0) {
    alarm.reset(new Alarm(shared, events, commands, gpio, SIREN_PIN, &alarmEntity));
    alarm->addMotionSensor(&hall);
    alarm->addMotionSensor(&door);
    alarm->setJournal(&journal);
    alarm->begin(nowMs);
    return *alarm;
  }

  void send(AlarmCommandType t) { ASSERT_TRUE(commands.send(AlarmCommand::of(t))); }

  std::vector<AlarmEvent> drain() {
    std::vector<AlarmEvent> out;
    AlarmEvent ev;
    while (events.tryPop(ev) == PopStatus::Popped) out.push_back(ev);
    return out;
  }

  std::vector<AlarmStateKind> stateChanges() {
    std::vector<AlarmStateKind> out;
    std::vector<AlarmEvent> evs = drain();
    for (size_t i = 0; i < evs.size(); ++i) {
      if (evs[i].type == AlarmEventType::AlarmStateChanged) out.push_back(evs[i].state);
    }
    return out;
  }

  PersistedAlarmState persisted() {
    PersistedAlarmState p = PersistedAlarmState::Disarmed;
    SettingsResult r = shared.getStructured(KEY_PERSISTED_ALARM_STATE, p);
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(r.found);
    return p;
  }

  void storeState(PersistedAlarmState p) {
    uint8_t enc[64];
    ASSERT_TRUE(shared.setStructured(KEY_PERSISTED_ALARM_STATE, p, enc, sizeof(enc)).ok());
  }

  void storeSettings(const AlarmSettings& s) {
    uint8_t enc[128];
    ASSERT_TRUE(shared.setStructured(KEY_ALARM_SETTINGS, s, enc, sizeof(enc)).ok());
  }

  // Drive the alarm into Armed at t=0 and forget the events.
  void armNow() {
    send(AlarmCommandType::ArmInstantly);
    ASSERT_TRUE(alarm->tick(0));
    ASSERT_EQ(alarm->state().kind, AlarmStateKind::Armed);
    drain();
  }

  MemFlash         flash;
  uint8_t          buf[2048];
  SettingsStore    store;
  FakeLock         settingsLock;
  FakeLock         eventLock;
  FakeLock         commandLock;
  SharedSettings   shared;
  EventQueue       events;
  CommandChannel   commands;
  FakeGpio         gpio;
  RecordingJournal journal;
  Entity           alarmEntity;
  Entity           hall;
  Entity           door;
  std::unique_ptr<Alarm> alarm;
};

} // namespace

TEST_F(AlarmTest, BeginAnnouncesRecoveredStateExactlyOnce) {
  Alarm& a = start(0);
  EXPECT_EQ(a.state(), AlarmState::disarmed());
  EXPECT_EQ(a.settings(), defaultAlarmSettings());
  EXPECT_EQ(a.motionSensors(), 2u);

  std::vector<AlarmEvent> evs = drain();
  ASSERT_EQ(evs.size(), 1u);
  EXPECT_EQ(evs[0].type, AlarmEventType::AlarmStateChanged);
  EXPECT_EQ(evs[0].entity, &alarmEntity);
  EXPECT_EQ(evs[0].state, AlarmStateKind::Disarmed);

  // siren configured as output and held low, sensors as pulled-down inputs
  ASSERT_EQ(gpio.outputs.count(SIREN_PIN), 1u);
  EXPECT_FALSE(gpio.out(SIREN_PIN));
  EXPECT_TRUE(gpio.inputs[HALL_PIN]);
  EXPECT_TRUE(gpio.inputs[DOOR_PIN]);

  for (uint32_t t = 250; t <= 2500; t += 250) EXPECT_TRUE(a.tick(t));
  EXPECT_TRUE(drain().empty());
}

TEST_F(AlarmTest, ArmWaitsForArmingTimeout) {
  Alarm& a = start(0);
  drain();

  send(AlarmCommandType::Arm);
  ASSERT_TRUE(a.tick(1000));
  EXPECT_EQ(a.state(), AlarmState::arming(1000));
  EXPECT_EQ(persisted(), PersistedAlarmState::Armed);

  ASSERT_TRUE(a.tick(1000 + 90000 - 1));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Arming);

  ASSERT_TRUE(a.tick(1000 + 90000));
  EXPECT_EQ(a.state(), AlarmState::armed(91000));

  std::vector<AlarmStateKind> changes = stateChanges();
  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[0], AlarmStateKind::Arming);
  EXPECT_EQ(changes[1], AlarmStateKind::Armed);
}

TEST_F(AlarmTest, TimeoutsSurviveClockWrap) {
  const uint32_t t0 = 0xFFFFF000u;
  Alarm& a = start(t0);
  send(AlarmCommandType::Arm);
  ASSERT_TRUE(a.tick(t0));
  ASSERT_EQ(a.state().kind, AlarmStateKind::Arming);

  ASSERT_TRUE(a.tick(t0 + 60000u));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Arming);
  ASSERT_TRUE(a.tick(t0 + 90000u));
  EXPECT_EQ(a.state(), AlarmState::armed(t0 + 90000u));
}

TEST_F(AlarmTest, MotionWhileArmedLeadsToTriggeredAndSiren) {
  Alarm& a = start(0);
  armNow();

  gpio.set(HALL_PIN, true);
  ASSERT_TRUE(a.tick(500));
  EXPECT_EQ(a.state(), AlarmState::pending(500));
  EXPECT_FALSE(a.sirenOn());
  EXPECT_EQ(persisted(), PersistedAlarmState::Triggered);

  std::vector<AlarmEvent> evs = drain();
  ASSERT_EQ(evs.size(), 2u);
  EXPECT_EQ(evs[0].type, AlarmEventType::MotionDetected);
  EXPECT_EQ(evs[0].entity, &hall);
  EXPECT_EQ(evs[1].type, AlarmEventType::AlarmStateChanged);
  EXPECT_EQ(evs[1].state, AlarmStateKind::Pending);

  gpio.set(HALL_PIN, false);
  ASSERT_TRUE(a.tick(750));
  evs = drain();
  ASSERT_EQ(evs.size(), 1u);
  EXPECT_EQ(evs[0].type, AlarmEventType::MotionCleared);
  EXPECT_EQ(a.state().kind, AlarmStateKind::Pending);

  ASSERT_TRUE(a.tick(500 + 30000));
  EXPECT_EQ(a.state(), AlarmState::triggered());
  EXPECT_TRUE(a.sirenOn());
  EXPECT_TRUE(gpio.out(SIREN_PIN));

  // untrigger re-arms and silences in the same tick
  send(AlarmCommandType::Untrigger);
  ASSERT_TRUE(a.tick(31000));
  EXPECT_EQ(a.state(), AlarmState::armed(31000));
  EXPECT_FALSE(a.sirenOn());
  EXPECT_FALSE(gpio.out(SIREN_PIN));
  EXPECT_EQ(persisted(), PersistedAlarmState::Armed);
}

TEST_F(AlarmTest, MotionWhileDisarmedOnlyReportsEdges) {
  Alarm& a = start(0);
  drain();

  gpio.set(DOOR_PIN, true);
  ASSERT_TRUE(a.tick(250));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Disarmed);

  std::vector<AlarmEvent> evs = drain();
  ASSERT_EQ(evs.size(), 1u);
  EXPECT_EQ(evs[0].type, AlarmEventType::MotionDetected);
  EXPECT_EQ(evs[0].entity, &door);

  // level held high: no new edge
  ASSERT_TRUE(a.tick(500));
  EXPECT_TRUE(drain().empty());
}

TEST_F(AlarmTest, CommandIsAppliedBeforeMotionGuard) {
  Alarm& a = start(0);
  armNow();

  gpio.set(HALL_PIN, true);
  send(AlarmCommandType::ManualTrigger);
  ASSERT_TRUE(a.tick(250));
  EXPECT_EQ(a.state(), AlarmState::triggered());
  EXPECT_TRUE(a.sirenOn());

  std::vector<AlarmStateKind> changes = stateChanges();
  ASSERT_EQ(changes.size(), 1u);
  EXPECT_EQ(changes[0], AlarmStateKind::Triggered);
}

TEST_F(AlarmTest, DisarmFromEveryState) {
  Alarm& a = start(0);

  // Arming
  send(AlarmCommandType::Arm);
  ASSERT_TRUE(a.tick(0));
  send(AlarmCommandType::Disarm);
  ASSERT_TRUE(a.tick(250));
  EXPECT_EQ(a.state(), AlarmState::disarmed());

  // Armed
  send(AlarmCommandType::ArmInstantly);
  ASSERT_TRUE(a.tick(500));
  send(AlarmCommandType::Disarm);
  ASSERT_TRUE(a.tick(750));
  EXPECT_EQ(a.state(), AlarmState::disarmed());

  // Pending
  send(AlarmCommandType::ArmInstantly);
  ASSERT_TRUE(a.tick(1000));
  gpio.set(HALL_PIN, true);
  ASSERT_TRUE(a.tick(1250));
  ASSERT_EQ(a.state().kind, AlarmStateKind::Pending);
  send(AlarmCommandType::Disarm);
  ASSERT_TRUE(a.tick(1500));
  EXPECT_EQ(a.state(), AlarmState::disarmed());
  gpio.set(HALL_PIN, false);
  ASSERT_TRUE(a.tick(1750));

  // Triggered
  send(AlarmCommandType::ArmInstantly);
  ASSERT_TRUE(a.tick(2000));
  send(AlarmCommandType::ManualTrigger);
  ASSERT_TRUE(a.tick(2250));
  ASSERT_TRUE(a.sirenOn());
  send(AlarmCommandType::Disarm);
  ASSERT_TRUE(a.tick(2500));
  EXPECT_EQ(a.state(), AlarmState::disarmed());
  EXPECT_FALSE(a.sirenOn());
  EXPECT_EQ(persisted(), PersistedAlarmState::Disarmed);
}

TEST_F(AlarmTest, CommandsOutsideTheTableAreIgnored) {
  Alarm& a = start(0);

  send(AlarmCommandType::ManualTrigger);   // Disarmed
  ASSERT_TRUE(a.tick(0));
  send(AlarmCommandType::Untrigger);       // Disarmed
  ASSERT_TRUE(a.tick(250));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Disarmed);

  armNow();
  send(AlarmCommandType::Arm);             // Armed
  ASSERT_TRUE(a.tick(500));
  send(AlarmCommandType::Untrigger);       // Armed
  ASSERT_TRUE(a.tick(750));
  EXPECT_EQ(a.state(), AlarmState::armed(0));
  EXPECT_TRUE(drain().empty());

  ASSERT_EQ(journal.commands.size(), 5u);
  EXPECT_EQ(journal.commands[0], "ManualTrigger:ignored");
  EXPECT_EQ(journal.commands[2], "ArmInstantly:ok");
  EXPECT_EQ(journal.commands[3], "Arm:ignored");
}

TEST_F(AlarmTest, AtMostOneCommandPerTick) {
  Alarm& a = start(0);
  send(AlarmCommandType::Arm);
  send(AlarmCommandType::Disarm);

  ASSERT_TRUE(a.tick(250));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Arming);
  ASSERT_TRUE(a.tick(500));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Disarmed);
}

TEST_F(AlarmTest, UpdatedPendingTimeoutAppliesOnNextEvaluation) {
  Alarm& a = start(0);
  armNow();

  gpio.set(HALL_PIN, true);
  ASSERT_TRUE(a.tick(1000));
  ASSERT_EQ(a.state().kind, AlarmStateKind::Pending);

  AlarmSettings s = a.settings();
  s.pendingTimeout = 5;
  ASSERT_TRUE(commands.send(AlarmCommand::update(s)));
  ASSERT_TRUE(a.tick(6000));
  EXPECT_EQ(a.settings().pendingTimeout, 5);
  EXPECT_EQ(a.state(), AlarmState::triggered());

  AlarmSettings stored;
  SettingsResult r = shared.getStructured(KEY_ALARM_SETTINGS, stored);
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(r.found);
  EXPECT_EQ(stored, s);
}

TEST_F(AlarmTest, FailedWritesAreLoggedAndMemoryWins) {
  Alarm& a = start(0);

  AlarmSettings s = a.settings();
  s.armingTimeout = 1;
  ASSERT_TRUE(commands.send(AlarmCommand::update(s)));

  flash.armPowerCut(0);
  ASSERT_TRUE(a.tick(0));
  EXPECT_EQ(a.settings(), s);

  send(AlarmCommandType::Arm);
  ASSERT_TRUE(a.tick(250));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Arming);
  ASSERT_TRUE(a.tick(1250));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Armed);
  flash.disarmPowerCut();

  ASSERT_GE(journal.faults.size(), 2u);
  EXPECT_EQ(journal.faults[0].find(KEY_ALARM_SETTINGS), 0u);
  EXPECT_EQ(journal.faults[1].find(KEY_PERSISTED_ALARM_STATE), 0u);
}

TEST_F(AlarmTest, RecoversStoredStateAfterRestart) {
  start(0);
  armNow();
  EXPECT_EQ(persisted(), PersistedAlarmState::Armed);
  alarm.reset();

  // new alarm over the same settings, in-memory timers gone
  Alarm& b = start(123456);
  EXPECT_EQ(b.state(), AlarmState::armed(123456));
  std::vector<AlarmEvent> evs = drain();
  ASSERT_EQ(evs.size(), 1u);
  EXPECT_EQ(evs[0].type, AlarmEventType::AlarmStateChanged);
  EXPECT_EQ(evs[0].state, AlarmStateKind::Armed);

  ASSERT_TRUE(b.tick(123706));
  EXPECT_TRUE(drain().empty());
}

TEST_F(AlarmTest, PendingIsRecoveredAsTriggered) {
  storeState(persistedFrom(AlarmState::pending(42)));
  Alarm& a = start(0);
  EXPECT_EQ(a.state(), AlarmState::triggered());
  EXPECT_TRUE(a.sirenOn());
  EXPECT_TRUE(gpio.out(SIREN_PIN));
}

TEST_F(AlarmTest, AbsentStateUsesConfiguredInitialState) {
  AlarmSettings s = defaultAlarmSettings();
  s.initialState  = PersistedAlarmState::Armed;
  s.armingTimeout = 12;
  storeSettings(s);

  Alarm& a = start(77);
  EXPECT_EQ(a.settings(), s);
  EXPECT_EQ(a.state(), AlarmState::armed(77));
  EXPECT_TRUE(journal.faults.empty());
}

TEST_F(AlarmTest, UnreadableStoredValuesFallBackToSafeDefaults) {
  AlarmSettings s = defaultAlarmSettings();
  s.initialState = PersistedAlarmState::Triggered;
  storeSettings(s);
  const uint8_t junk[1] = { 0x07 };      // an integer, not a state name
  ASSERT_TRUE(shared.set(KEY_PERSISTED_ALARM_STATE, junk, sizeof(junk)).ok());

  Alarm& a = start(0);
  EXPECT_EQ(a.state(), AlarmState::disarmed());
  EXPECT_FALSE(a.sirenOn());
  ASSERT_EQ(journal.faults.size(), 1u);
  EXPECT_EQ(journal.faults[0], std::string(KEY_PERSISTED_ALARM_STATE) + ":" +
                               settingsErrorName(SettingsError::DecodeFailed));
}

// Store never initialised: every read fails with NotReady.
TEST(AlarmRecovery, UnreadyStoreStartsDisarmedWithDefaults) {
  MemFlash         flash(0x2000, 4, 4, 4096);
  uint8_t          buf[512];
  SettingsStore    store(flash, 0, 0x2000, buf, sizeof(buf));
  FakeLock         lock;
  SharedSettings   shared(store, lock);
  EventQueue       events(lock, 8);
  CommandChannel   commands(lock, 4);
  FakeGpio         gpio;
  RecordingJournal journal;
  Entity           entity = makeEntity("alarm", -1);

  commands.attachSender();
  Alarm a(shared, events, commands, gpio, SIREN_PIN, &entity);
  a.setJournal(&journal);
  a.begin(0);

  EXPECT_EQ(a.state(), AlarmState::disarmed());
  EXPECT_EQ(a.settings(), defaultAlarmSettings());
  EXPECT_EQ(events.size(), 1u);

  const std::string notReady = settingsErrorName(SettingsError::NotReady);
  ASSERT_EQ(journal.faults.size(), 2u);
  EXPECT_EQ(journal.faults[0], std::string(KEY_ALARM_SETTINGS) + ":" + notReady);
  EXPECT_EQ(journal.faults[1], std::string(KEY_PERSISTED_ALARM_STATE) + ":" + notReady);
}

TEST_F(AlarmTest, DisconnectedCommandChannelStopsTheLoop) {
  Alarm& a = start(0);
  send(AlarmCommandType::ArmInstantly);
  commands.detachSender();

  // queued command still delivered first
  EXPECT_TRUE(a.tick(0));
  EXPECT_EQ(a.state().kind, AlarmStateKind::Armed);

  EXPECT_FALSE(a.tick(250));
  ASSERT_FALSE(journal.faults.empty());
  EXPECT_EQ(journal.faults.back(), "alarm:command channel disconnected");
}

TEST_F(AlarmTest, JournalSeesTransitions) {
  Alarm& a = start(0);
  send(AlarmCommandType::Arm);
  ASSERT_TRUE(a.tick(0));
  ASSERT_TRUE(a.tick(90000));

  ASSERT_EQ(journal.states.size(), 2u);
  EXPECT_EQ(journal.states[0], "Disarmed>Arming");
  EXPECT_EQ(journal.states[1], "Arming>Armed");
  ASSERT_EQ(journal.commands.size(), 1u);
  EXPECT_EQ(journal.commands[0], "Arm:ok");
}

TEST_F(AlarmTest, MotionSensorRegistration) {
  Alarm a(shared, events, commands, gpio, SIREN_PIN, &alarmEntity);
  Entity noPin = makeEntity("nopin", -1);
  EXPECT_FALSE(a.addMotionSensor(&noPin));
  EXPECT_FALSE(a.addMotionSensor(nullptr));

  std::vector<Entity> many;
  for (int i = 0; i < MAX_MOTION_SENSORS + 1; ++i) many.push_back(makeEntity("pir", (int16_t)(10 + i)));
  for (int i = 0; i < MAX_MOTION_SENSORS; ++i) EXPECT_TRUE(a.addMotionSensor(&many[i]));
  EXPECT_FALSE(a.addMotionSensor(&many[MAX_MOTION_SENSORS]));
  EXPECT_EQ(a.motionSensors(), (size_t)MAX_MOTION_SENSORS);
}

TEST_F(AlarmTest, SirenFaultIsJournaled) {
  gpio.badPin = SIREN_PIN;
  start(0);
  ASSERT_FALSE(journal.faults.empty());
  EXPECT_EQ(journal.faults[0], "siren:configure failed");
}
