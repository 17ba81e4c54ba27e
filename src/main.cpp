#include <Panel.hpp>
#include <Logger.hpp>
#include <NVSManager.hpp>
#include <Utils.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

Panel panel;

void setup() {
    Debug::begin(SERIAL_BAUD_RATE);
    NVS::Init();         // guarantees singleton exists
    CONF->begin();       // counts this boot, reads why we restarted

    // Journal comes up before the settings partition so boot faults land in it
    Logger::Init(CONF->BootCount());
    LOGG->Begin();
    LOGG->logBoot(CONF->LastRestartReason().c_str());

    panel.begin();
}

void loop() {
    panel.loop();
    vTaskDelay(pdMS_TO_TICKS(SUPERVISOR_PERIOD_MS));
}
