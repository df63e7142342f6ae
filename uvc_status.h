/**
 * @file uvc_status.h
 * @brief Controller state enums and the status tuple pushed to the display side.
 */
#ifndef UVC_STATUS_H
#define UVC_STATUS_H

#include <stdint.h>
#include <stdbool.h>
#include "uvc_interlock.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Top-level controller state.
 */
typedef enum {
    UVC_SYSTEM_IDLE = 0,   /**< Output off; accepts mode/profile/start. */
    UVC_SYSTEM_RUNNING,    /**< Profile executing; output follows the engine. */
    UVC_SYSTEM_PAUSED,     /**< Output off; run time frozen. */
    UVC_SYSTEM_FAULT       /**< Output off; needs AcknowledgeFault. */
} uvc_system_state_t;

typedef enum {
    UVC_MODE_STANDARD = 0, /**< Single constant segment. */
    UVC_MODE_CUSTOM        /**< Any loaded profile, manual-stop allowed. */
} uvc_run_mode_t;

typedef enum {
    UVC_PAUSE_NONE = 0,
    UVC_PAUSE_USER,
    UVC_PAUSE_INTERLOCK_OPEN
} uvc_pause_reason_t;

typedef enum {
    UVC_FAULT_NONE = 0,
    UVC_FAULT_PWM_READBACK,
    UVC_FAULT_LID_SENSOR
} uvc_fault_t;

/** @brief How the last run ended. */
typedef enum {
    UVC_OUTCOME_NONE = 0,
    UVC_OUTCOME_COMPLETE,
    UVC_OUTCOME_ABORTED,
    UVC_OUTCOME_FAULTED
} uvc_run_outcome_t;

/**
 * @brief Status snapshot, pushed once per tick and on every state change.
 */
typedef struct {
    uvc_system_state_t    system_state;
    uvc_interlock_state_t interlock_state;
    float    intensity_pct;     /**< Intensity currently applied to the LED. */
    uint32_t elapsed_ms;        /**< Run time consumed. */
    uint32_t remaining_ms;      /**< UVC_DURATION_UNBOUNDED for manual stop. */
    uvc_run_mode_t     mode;
    uvc_pause_reason_t pause_reason;
    uvc_fault_t        fault;
    uvc_run_outcome_t  last_outcome;
    bool     sensor_fault;
} uvc_status_t;

const char* uvc_system_state_name(uvc_system_state_t state);

#ifdef __cplusplus
}
#endif

#endif /* UVC_STATUS_H */
