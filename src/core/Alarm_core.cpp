#include <Alarm.hpp>
#include <Utils.hpp>

Alarm::Alarm(SharedSettings& settings,
             EventQueue& events,
             CommandChannel& commands,
             DigitalIo& io,
             uint8_t sirenPin,
             const Entity* alarmEntity)
: store_(settings),
  events_(events),
  commands_(commands),
  io_(io),
  entity_(alarmEntity),
  siren_(sirenPin, io),
  settings_(defaultAlarmSettings()) {
  motion_.reserve(MAX_MOTION_SENSORS);
}

bool Alarm::addMotionSensor(const Entity* entity) {
  if (!entity || entity->gpioPin < 0 || entity->gpioPin > 0xFF) {
    DBG_PRINTF("[Alarm] motion entity '%s' has no usable gpio_pin\n",
               entity ? entity->name.c_str() : "?");
    return false;
  }
  if (motion_.size() >= MAX_MOTION_SENSORS) {
    DBG_PRINTLN("[Alarm] too many motion sensors, ignoring extra");
    return false;
  }
  motion_.push_back(MotionSensor(entity, (uint8_t)entity->gpioPin, io_));
  if (started_) motion_.back().begin();
  return true;
}

void Alarm::begin(uint32_t nowMs) {
  DBGSTR();
  DBG_PRINTLN("###########################################################");
  DBG_PRINTLN("#                    Starting Alarm                       #");
  DBG_PRINTLN("###########################################################");
  DBGSTP();

  for (size_t i = 0; i < motion_.size(); ++i) motion_[i].begin();
  if (!siren_.begin() && journal_) journal_->logFault("siren", "configure failed");

  loadSettings_();
  recoverState_(nowMs);

  driveSiren_();
  emitState_();
  started_ = true;
}

bool Alarm::tick(uint32_t nowMs) {
  const AlarmState entry = state_;

  const bool motion = pollMotion_();

  AlarmCommand cmd;
  const RecvStatus rs = commands_.tryReceive(cmd);
  if (rs == RecvStatus::Received) applyCommand_(cmd, nowMs);

  evaluateGuards_(nowMs, motion);
  driveSiren_();

  if (state_ != entry) {
    DBG_PRINTF("[Alarm] %s -> %s\n", alarmStateName(entry.kind), alarmStateName(state_.kind));
    if (journal_) journal_->logAlarmState(alarmStateName(entry.kind), alarmStateName(state_.kind));
    persistState_();
    emitState_();
  }

  if (rs == RecvStatus::Disconnected) {
    DBG_PRINTLN("[Alarm] command channel disconnected");
    if (journal_) journal_->logFault("alarm", "command channel disconnected");
    return false;
  }
  return true;
}

// Edges of every sensor; true when any went high this tick.
bool Alarm::pollMotion_() {
  bool detected = false;
  for (size_t i = 0; i < motion_.size(); ++i) {
    MotionSensor& s = motion_[i];
    const MotionSensor::Edge e = s.poll();
    if (e == MotionSensor::EDGE_NONE) continue;

    AlarmEvent ev;
    ev.entity = s.entity();
    ev.state  = state_.kind;
    if (e == MotionSensor::EDGE_RISING) {
      ev.type  = AlarmEventType::MotionDetected;
      detected = true;
    } else {
      ev.type  = AlarmEventType::MotionCleared;
    }
    events_.push(ev);
  }
  return detected;
}

void Alarm::driveSiren_() {
  const bool want = (state_.kind == AlarmStateKind::Triggered);
  if (!siren_.set(want) && journal_) {
    journal_->logFault("siren", want ? "set high failed" : "set low failed");
  }
}

void Alarm::emitState_() {
  AlarmEvent ev;
  ev.type   = AlarmEventType::AlarmStateChanged;
  ev.entity = entity_;
  ev.state  = state_.kind;
  events_.push(ev);
}
