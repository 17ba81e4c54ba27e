#include <ResetManager.hpp>
#include <Config.hpp>
#include <Logger.hpp>
#include <NVSManager.hpp>
#include <Panel.hpp>
#include <Utils.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
Panel* g_panel = nullptr;
}

void ResetManager::Init(Panel* panel) {
  g_panel = panel;
}

void ResetManager::RequestReset(const char* reason) {
  if (g_panel) {
    g_panel->requestReset(reason);
    return;
  }

  // Fallback: no panel registered; restart right away.
  DBG_PRINTLN("[Reset] No panel registered, performing immediate restart.");
  CONF->RestartSysDelay(0, reason ? reason : "reset");
}

void ResetManager::Fatal(const char* where, const char* reason) {
  DBG_PRINTF("[Reset] FATAL in %s: %s\n", where, reason);
  if (Logger* l = Logger::TryGet()) l->logFault(where, reason);
  CONF->RestartSysDelay(RESTART_COUNTDOWN_MS, where);
  while (true) { vTaskDelay(pdMS_TO_TICKS(1000)); }
}
