/**
 * @file uvc_interlock.cpp
 * @brief Debounce and line supervision for the lid switch.
 *        - An Open reading is reported at once; a Closed reading only after it
 *          persists for debounce_ms.
 *        - A fault reading reports Open immediately; persisting for
 *          sensor_fault_window_ms latches sensor_fault.
 *        - The latch clears after valid readings persist for the same window.
 */
#include "uvc_interlock.h"
#include "uvc_config.h"
#include "uvc_clock.h"
#include "uvc_logging.h"

static void uvi_report(uvc_interlock_t* il, uvc_interlock_state_t state) {
    if (il->state != state) {
        il->state = state;
        UVC_LOGF("interlock %s", state == UVC_INTERLOCK_CLOSED ? "CLOSED" : "OPEN");
    }
}

static void uvi_track_fault(uvc_interlock_t* il, uint32_t now_ms) {
    const uvc_config_t* cfg = uvc_get_config();

    il->valid_timing = false;
    if (!il->fault_timing) {
        il->fault_timing = true;
        il->fault_since_ms = now_ms;
    }
    if (!il->sensor_fault && uvc_clock_has_elapsed(now_ms, il->fault_since_ms, cfg->sensor_fault_window_ms)) {
        il->sensor_fault = true;
        UVC_LOGF("lid sensor fault latched");
    }
}

static void uvi_track_valid(uvc_interlock_t* il, uint32_t now_ms) {
    const uvc_config_t* cfg = uvc_get_config();

    il->fault_timing = false;
    if (!il->sensor_fault) {
        il->valid_timing = false;
        return;
    }
    if (!il->valid_timing) {
        il->valid_timing = true;
        il->valid_since_ms = now_ms;
    }
    if (uvc_clock_has_elapsed(now_ms, il->valid_since_ms, cfg->sensor_fault_window_ms)) {
        il->sensor_fault = false;
        il->valid_timing = false;
        UVC_LOGF("lid sensor fault cleared");
    }
}

void uvc_interlock_init(uvc_interlock_t* il, uint32_t now_ms) {
    il->state = UVC_INTERLOCK_OPEN;
    il->candidate = UVC_LID_READ_OPEN;
    il->candidate_since_ms = now_ms;
    il->sensor_fault = false;
    il->fault_timing = false;
    il->fault_since_ms = 0;
    il->valid_timing = false;
    il->valid_since_ms = 0;
}

uvc_interlock_state_t uvc_interlock_poll(uvc_interlock_t* il, uvc_lid_reading_t reading, uint32_t now_ms) {
    const uvc_config_t* cfg = uvc_get_config();

    if (reading == UVC_LID_READ_FAULT) {
        /* Fail safe: no debounce toward Open, and a later Closed must start a fresh window. */
        uvi_track_fault(il, now_ms);
        il->candidate = UVC_LID_READ_OPEN;
        il->candidate_since_ms = now_ms;
        uvi_report(il, UVC_INTERLOCK_OPEN);
        return il->state;
    }

    uvi_track_valid(il, now_ms);

    if (reading != il->candidate) {
        il->candidate = reading;
        il->candidate_since_ms = now_ms;
    }

    if (il->sensor_fault) {
        uvi_report(il, UVC_INTERLOCK_OPEN);
        return il->state;
    }

    /* Bounce only matters on closing; opening cuts emission on the first reading. */
    if (il->candidate == UVC_LID_READ_OPEN) {
        uvi_report(il, UVC_INTERLOCK_OPEN);
    } else if (il->state != UVC_INTERLOCK_CLOSED &&
               uvc_clock_has_elapsed(now_ms, il->candidate_since_ms, cfg->debounce_ms)) {
        uvi_report(il, UVC_INTERLOCK_CLOSED);
    }
    return il->state;
}

bool uvc_interlock_is_safe_to_emit(const uvc_interlock_t* il) {
    return il->state == UVC_INTERLOCK_CLOSED && !il->sensor_fault;
}

bool uvc_interlock_has_sensor_fault(const uvc_interlock_t* il) {
    return il->sensor_fault;
}

uvc_lid_reading_t uvc_interlock_classify_mv(uint16_t sense_mv) {
    const uvc_config_t* cfg = uvc_get_config();

    if (sense_mv <= cfg->lid_short_max_mv) return UVC_LID_READ_FAULT;
    if (sense_mv <= cfg->lid_closed_max_mv) return UVC_LID_READ_CLOSED;
    if (sense_mv <= cfg->lid_open_max_mv) return UVC_LID_READ_OPEN;
    return UVC_LID_READ_FAULT;
}
