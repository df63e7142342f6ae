/**
 * @file uvc_config.cpp
 * @brief Implementation of runtime-configurable controller parameters
 */
#include "uvc_config.h"
#include <stddef.h>

#define UVC_TICK_MIN_MS        10U
#define UVC_TICK_MAX_MS        50U
#define UVC_DEBOUNCE_MIN_MS    5U
#define UVC_DEBOUNCE_MAX_MS    500U
#define UVC_FAULT_WIN_MIN_MS   20U
#define UVC_FAULT_WIN_MAX_MS   5000U
#define UVC_LOG_MIN_MS         100U
#define UVC_LOG_MAX_MS         60000U
#define UVC_BLINK_MIN_MS       100U
#define UVC_BLINK_MAX_MS       2000U
#define UVC_TOTAL_MIN_MS       1000UL
#define UVC_TOTAL_MAX_MS       (72UL * 3600UL * 1000UL)

static const uvc_config_t uvi_default_config = {
    .tick_period_ms         = 20U,                   /* 50 Hz control loop */
    .debounce_ms            = 50U,                   /* switch bounce window */
    .sensor_fault_window_ms = 200U,                  /* shorted/open line before fault */
    .periodic_log_ms        = 1000U,                 /* log every second */
    .blink_interval_ms      = 500U,                  /* lamp blink half-period */
    .max_total_duration_ms  = 24UL * 3600UL * 1000UL, /* one day */
    .lid_short_max_mv       = 300U,
    .lid_closed_max_mv      = 1650U,
    .lid_open_max_mv        = 3000U,
    .interlock_auto_resume  = true
};

/* Internal configuration state */
static uvc_config_t uvi_config = uvi_default_config;

static bool uvi_in_range(uint32_t v, uint32_t lo, uint32_t hi) {
    return v >= lo && v <= hi;
}

static bool uvi_bands_valid(uint16_t short_mv, uint16_t closed_mv, uint16_t open_mv) {
    return short_mv < closed_mv && closed_mv < open_mv;
}

static bool uvi_config_valid(const uvc_config_t* c) {
    return uvi_in_range(c->tick_period_ms, UVC_TICK_MIN_MS, UVC_TICK_MAX_MS) &&
           uvi_in_range(c->debounce_ms, UVC_DEBOUNCE_MIN_MS, UVC_DEBOUNCE_MAX_MS) &&
           uvi_in_range(c->sensor_fault_window_ms, UVC_FAULT_WIN_MIN_MS, UVC_FAULT_WIN_MAX_MS) &&
           uvi_in_range(c->periodic_log_ms, UVC_LOG_MIN_MS, UVC_LOG_MAX_MS) &&
           uvi_in_range(c->blink_interval_ms, UVC_BLINK_MIN_MS, UVC_BLINK_MAX_MS) &&
           uvi_in_range(c->max_total_duration_ms, UVC_TOTAL_MIN_MS, UVC_TOTAL_MAX_MS) &&
           uvi_bands_valid(c->lid_short_max_mv, c->lid_closed_max_mv, c->lid_open_max_mv);
}

const uvc_config_t* uvc_get_config(void) {
    return &uvi_config;
}

bool uvc_set_config(const uvc_config_t* config) {
    if (config == NULL || !uvi_config_valid(config)) {
        return false;
    }
    uvi_config = *config;
    return true;
}

void uvc_reset_config_to_defaults(void) {
    uvi_config = uvi_default_config;
}

/* Individual parameter setters */
void uvc_set_tick_period_ms(uint32_t period_ms) {
    if (uvi_in_range(period_ms, UVC_TICK_MIN_MS, UVC_TICK_MAX_MS)) {
        uvi_config.tick_period_ms = period_ms;
    }
}

uint32_t uvc_get_tick_period_ms(void) {
    return uvi_config.tick_period_ms;
}

void uvc_set_debounce_ms(uint32_t debounce_ms) {
    if (uvi_in_range(debounce_ms, UVC_DEBOUNCE_MIN_MS, UVC_DEBOUNCE_MAX_MS)) {
        uvi_config.debounce_ms = debounce_ms;
    }
}

uint32_t uvc_get_debounce_ms(void) {
    return uvi_config.debounce_ms;
}

void uvc_set_sensor_fault_window_ms(uint32_t window_ms) {
    if (uvi_in_range(window_ms, UVC_FAULT_WIN_MIN_MS, UVC_FAULT_WIN_MAX_MS)) {
        uvi_config.sensor_fault_window_ms = window_ms;
    }
}

uint32_t uvc_get_sensor_fault_window_ms(void) {
    return uvi_config.sensor_fault_window_ms;
}

void uvc_set_periodic_log_ms(uint32_t interval_ms) {
    if (uvi_in_range(interval_ms, UVC_LOG_MIN_MS, UVC_LOG_MAX_MS)) {
        uvi_config.periodic_log_ms = interval_ms;
    }
}

uint32_t uvc_get_periodic_log_ms(void) {
    return uvi_config.periodic_log_ms;
}

void uvc_set_blink_interval_ms(uint32_t interval_ms) {
    if (uvi_in_range(interval_ms, UVC_BLINK_MIN_MS, UVC_BLINK_MAX_MS)) {
        uvi_config.blink_interval_ms = interval_ms;
    }
}

uint32_t uvc_get_blink_interval_ms(void) {
    return uvi_config.blink_interval_ms;
}

void uvc_set_max_total_duration_ms(uint32_t duration_ms) {
    if (uvi_in_range(duration_ms, UVC_TOTAL_MIN_MS, UVC_TOTAL_MAX_MS)) {
        uvi_config.max_total_duration_ms = duration_ms;
    }
}

uint32_t uvc_get_max_total_duration_ms(void) {
    return uvi_config.max_total_duration_ms;
}

void uvc_set_lid_bands_mv(uint16_t short_max_mv, uint16_t closed_max_mv, uint16_t open_max_mv) {
    if (uvi_bands_valid(short_max_mv, closed_max_mv, open_max_mv)) {
        uvi_config.lid_short_max_mv  = short_max_mv;
        uvi_config.lid_closed_max_mv = closed_max_mv;
        uvi_config.lid_open_max_mv   = open_max_mv;
    }
}

void uvc_set_interlock_auto_resume(bool enabled) {
    uvi_config.interlock_auto_resume = enabled;
}

bool uvc_get_interlock_auto_resume(void) {
    return uvi_config.interlock_auto_resume;
}
