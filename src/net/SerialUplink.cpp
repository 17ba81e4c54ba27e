#include <SerialUplink.hpp>
#include <Utils.hpp>
#include <string.h>

SerialUplink::SerialUplink(Stream& port) : port_(port) {}

bool SerialUplink::publish(const char* topic, const uint8_t* payload, size_t len, bool retain) {
    if (!topic) return false;
    port_.print(retain ? "PUB+ " : "PUB ");
    port_.print(topic);
    port_.print(' ');
    port_.write(payload, len);
    port_.print('\n');
    return true;
}

void SerialUplink::poll() {
    while (port_.available() > 0) {
        const int c = port_.read();
        if (c < 0) break;

        if (c == '\r') continue;
        if (c == '\n') {
            if (!overflow_ && len_ > 0) {
                line_[len_] = '\0';
                handleLine_(line_);
            } else if (overflow_) {
                DBG_PRINTLN("[Uplink] line too long, dropped");
            }
            len_ = 0;
            overflow_ = false;
            continue;
        }

        if (len_ + 1 < sizeof(line_)) line_[len_++] = (char)c;
        else overflow_ = true;
    }
}

void SerialUplink::handleLine_(char* line) {
    if (!scheduler_) return;

    char* rest = strchr(line, ' ');
    if (rest) *rest++ = '\0';
    else rest = line + strlen(line);

    if (strcasecmp(line, "CMD") == 0) {
        scheduler_->onAlarmCommand(rest, strlen(rest));
    } else if (strcasecmp(line, "SET") == 0) {
        char* value = strchr(rest, ' ');
        if (!value) {
            DBG_PRINTLN("[Uplink] usage: SET <key> <value>");
            return;
        }
        *value++ = '\0';
        scheduler_->onSetSetting(rest, reinterpret_cast<const uint8_t*>(value), strlen(value));
    } else if (strcasecmp(line, "TOPIC") == 0) {
        char* payload = strchr(rest, ' ');
        if (payload) *payload++ = '\0';
        else payload = rest + strlen(rest);
        scheduler_->onMessage(rest, reinterpret_cast<const uint8_t*>(payload), strlen(payload));
    } else {
        DBG_PRINTF("[Uplink] unknown line '%s'\n", line);
    }
}
