/**
 * @file uvc_indicator.cpp
 */
#include "uvc_indicator.h"
#include "uvc_config.h"

uvc_indicator_t uvc_indicator_pattern(const uvc_status_t* status) {
    if (status->interlock_state == UVC_INTERLOCK_OPEN) {
        return UVC_INDICATOR_ALARM_BLINK;
    }
    switch (status->system_state) {
        case UVC_SYSTEM_FAULT:   return UVC_INDICATOR_FAULT_BLINK;
        case UVC_SYSTEM_RUNNING: return UVC_INDICATOR_ACTIVE;
        case UVC_SYSTEM_IDLE:
        case UVC_SYSTEM_PAUSED:  return UVC_INDICATOR_READY;
    }
    return UVC_INDICATOR_READY;
}

bool uvc_indicator_lamp_on(uvc_indicator_t pattern, uint32_t now_ms) {
    uint32_t half = uvc_get_config()->blink_interval_ms;

    switch (pattern) {
        case UVC_INDICATOR_READY:
        case UVC_INDICATOR_ACTIVE:
            return true;
        case UVC_INDICATOR_ALARM_BLINK:
            return ((now_ms / half) % 2U) == 0U;
        case UVC_INDICATOR_FAULT_BLINK:
            half /= 2U;
            return ((now_ms / half) % 2U) == 0U;
    }
    return false;
}
