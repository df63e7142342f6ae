/**
 * @file uvc_mode_control.h
 * @brief Top-level controller: command surface, run state machine and the
 *        per-tick interlock/output arbitration.
 * @details State machine:
 *          Idle -> Running -> {Paused, Idle (complete), Fault}
 *          Paused -> {Running, Idle (aborted)}
 *          any -> Fault on a hardware fault; Fault -> Idle on acknowledgement.
 *          Each tick polls the interlock before anything is written to the PWM
 *          output. An open interlock forces emergency off and freezes run time.
 */
#ifndef UVC_MODE_CONTROL_H
#define UVC_MODE_CONTROL_H

#include <stdint.h>
#include <stdbool.h>
#include "uvc_clock.h"
#include "uvc_interlock.h"
#include "uvc_pwm.h"
#include "uvc_profile.h"
#include "uvc_profile_engine.h"
#include "uvc_beeper.h"
#include "uvc_status.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Hardware handles owned by the controller for its lifetime.
 */
typedef struct {
    uvc_clock_t       clock;
    uvc_pwm_port_t    pwm;
    uvc_lid_reading_t (*read_lid)(void);
} uvc_hw_t;

/**
 * @brief Why a command was refused.
 */
typedef enum {
    UVC_REJECT_NONE = 0,
    UVC_REJECT_BUSY,               /**< Only allowed while Idle. */
    UVC_REJECT_NO_PROFILE,
    UVC_REJECT_VALIDATION_FAILED,  /**< See uvc_command_result_t.validation. */
    UVC_REJECT_INTERLOCK_OPEN,
    UVC_REJECT_NOT_RUNNING,
    UVC_REJECT_NOT_PAUSED,
    UVC_REJECT_NOT_ACTIVE,         /**< Stop with nothing to stop. */
    UVC_REJECT_NOT_FAULTED,
    UVC_REJECT_IN_FAULT,           /**< Acknowledge the fault first. */
    UVC_REJECT_INVALID_ARGUMENT
} uvc_reject_reason_t;

typedef struct {
    bool accepted;
    uvc_reject_reason_t    reason;
    uvc_validation_error_t validation;
    uint8_t                node;        /**< Offending node for validation failures. */
} uvc_command_result_t;

typedef void (*uvc_status_sink_fn)(const uvc_status_t* status, void* ctx);

typedef struct {
    uvc_hw_t             hw;
    uvc_interlock_t      interlock;
    uvc_pwm_t            pwm;
    uvc_profile_engine_t engine;
    uvc_beeper_t         beeper;

    uvc_profile_t        profile;          /**< Private copy; read-only while a run exists. */
    bool                 profile_loaded;

    uvc_system_state_t   state;
    uvc_run_mode_t       mode;
    uvc_pause_reason_t   pause_reason;
    uvc_fault_t          fault;
    uvc_run_outcome_t    last_outcome;

    uint32_t             last_tick_ms;
    bool                 resync;           /**< Next running tick advances by 0 ms. */
    uint32_t             last_log_ms;

    uvc_status_sink_fn   sink;
    void*                sink_ctx;
} uvc_mode_controller_t;

/**
 * @brief Bind hardware, force the output off and enter Idle (Standard mode).
 * @return false if the PWM port is unusable; the controller is then in Fault.
 */
bool uvc_mode_controller_init(uvc_mode_controller_t* ctl, const uvc_hw_t* hw);

/** @brief Receive a status push every tick and on each state change. */
void uvc_mode_controller_set_status_sink(uvc_mode_controller_t* ctl, uvc_status_sink_fn sink, void* ctx);

/**
 * @brief One control tick: interlock first, then run/output arbitration.
 */
void uvc_mode_controller_tick(uvc_mode_controller_t* ctl);

/* Command surface. Each returns accept/reject with a reason. */
uvc_command_result_t uvc_mode_controller_select_mode(uvc_mode_controller_t* ctl, uvc_run_mode_t mode);
uvc_command_result_t uvc_mode_controller_load_profile(uvc_mode_controller_t* ctl, const uvc_profile_t* profile);

/**
 * @brief Validate and start a run.
 * @param profile profile to load first, or NULL to run the loaded profile
 */
uvc_command_result_t uvc_mode_controller_start(uvc_mode_controller_t* ctl, const uvc_profile_t* profile);
uvc_command_result_t uvc_mode_controller_pause(uvc_mode_controller_t* ctl);
uvc_command_result_t uvc_mode_controller_resume(uvc_mode_controller_t* ctl);

/** @brief Abort the run; the output is off before this returns. */
uvc_command_result_t uvc_mode_controller_stop(uvc_mode_controller_t* ctl);
uvc_command_result_t uvc_mode_controller_acknowledge_fault(uvc_mode_controller_t* ctl);

/**
 * @brief Build and load the Standard-mode run.
 */
uvc_command_result_t uvc_mode_controller_load_standard(uvc_mode_controller_t* ctl, uvc_time_unit_t unit,
                                                       uint32_t value, uint8_t intensity);

/** @brief Current status snapshot. */
void uvc_mode_controller_get_status(const uvc_mode_controller_t* ctl, uvc_status_t* out);

uvc_system_state_t uvc_mode_controller_state(const uvc_mode_controller_t* ctl);

/** @brief Buzzer level for this moment; call after each tick. */
bool uvc_mode_controller_buzzer_on(uvc_mode_controller_t* ctl);

const char* uvc_reject_reason_name(uvc_reject_reason_t reason);

#ifdef __cplusplus
}
#endif

#endif /* UVC_MODE_CONTROL_H */
