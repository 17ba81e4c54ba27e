/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SCHEDULER_H
#define SCHEDULER_H

/**
 * @file Scheduler.h
 * @brief Network side of the panel.
 *
 * - service(): publish at most one alarm event per cycle, best effort,
 *   never blocking on the event queue.
 * - onMessage(): route inbound topics
 *     <alarm command topic>          -> onAlarmCommand()
 *     <settings prefix>/set          -> onSetSetting("key\0value")
 *     <settings prefix>/set/<key>    -> onSetSetting(key, value)
 * - onUplinkConnected(): retained discovery config for every entity
 *   (homeassistant/<variant>/<unique_id>/config), then the birth message.
 * - Owns one sender slot on the command channel between begin()/end().
 */

#include <AlarmTypes.hpp>
#include <CommandChannel.hpp>
#include <EventQueue.hpp>
#include <SharedSettings.hpp>
#include <Uplink.hpp>
#include <string>
#include <vector>

class Scheduler {
public:
  typedef void (*RebootFn)(void* ctx);

  Scheduler(SharedSettings& settings,
            EventQueue& events,
            CommandChannel& commands,
            Uplink& uplink,
            const Entity* alarmEntity,
            const std::vector<Entity>* motionEntities = nullptr);
  ~Scheduler();

  void begin();                 // attach sender, load topics from settings
  void end();                   // detach sender
  void setRebootHandler(RebootFn fn, void* ctx) { rebootFn_ = fn; rebootCtx_ = ctx; }

  // One scheduler cycle. true if an event went out.
  bool service();

  // Transport (re)connected: discovery configs, then birth message.
  void onUplinkConnected();

  void onMessage(const char* topic, const uint8_t* payload, size_t len);
  bool onAlarmCommand(const char* payload, size_t len);
  bool onSetSetting(const uint8_t* payload, size_t len);
  bool onSetSetting(const char* key, const uint8_t* value, size_t len);

  const std::string& availabilityTopic() const { return availabilityTopic_; }
  const std::string& settingsSetTopic() const  { return settingsSetTopic_; }
  uint32_t           published() const         { return published_; }

private:
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  bool publishEvent_(const AlarmEvent& ev);
  bool publishText_(const std::string& topic, const char* text);
  bool publishDiscovery_(const Entity& e, const char* defaultVariant);

  SharedSettings& settings_;
  EventQueue&     events_;
  CommandChannel& commands_;
  Uplink&         uplink_;
  const Entity*   alarmEntity_;
  const std::vector<Entity>* motionEntities_;

  RebootFn        rebootFn_  = nullptr;
  void*           rebootCtx_ = nullptr;
  bool            attached_  = false;

  std::string     availabilityTopic_;
  std::string     settingsSetTopic_;
  uint32_t        published_ = 0;
};

#endif // SCHEDULER_H
