/**
 * @file uvc_indicator.h
 * @brief Status lamp contract: blinking while the lid is open, steady when
 *        ready, active while running.
 */
#ifndef UVC_INDICATOR_H
#define UVC_INDICATOR_H

#include <stdint.h>
#include <stdbool.h>
#include "uvc_status.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    UVC_INDICATOR_READY = 0,    /**< Steady on: closed and Idle/Paused. */
    UVC_INDICATOR_ACTIVE,       /**< Steady on, active colour: Running. */
    UVC_INDICATOR_ALARM_BLINK,  /**< Blink at blink_interval_ms: lid open. */
    UVC_INDICATOR_FAULT_BLINK   /**< Blink at half blink_interval_ms: Fault. */
} uvc_indicator_t;

/**
 * @brief Pattern for a status snapshot; an open lid takes precedence.
 */
uvc_indicator_t uvc_indicator_pattern(const uvc_status_t* status);

/**
 * @brief Lamp level for a pattern at @p now_ms.
 */
bool uvc_indicator_lamp_on(uvc_indicator_t pattern, uint32_t now_ms);

#ifdef __cplusplus
}
#endif

#endif /* UVC_INDICATOR_H */
