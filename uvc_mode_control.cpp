/**
 * @file uvc_mode_control.cpp
 * @brief Control logic:
 *        - Interlock is polled first every tick; nothing reaches the PWM output before it.
 *        - Interlock open -> emergency off, run time frozen, Running -> Paused(InterlockOpen).
 *        - Interlock closed -> engine advanced by the tick delta and its output applied.
 *        - PWM readback mismatch or a latched lid line fault -> Fault from any state.
 *        - Periodically log state, interlock, intensity and run times.
 */
#include "uvc_mode_control.h"
#include "uvc_config.h"
#include "uvc_logging.h"
#include <string.h>

static uint32_t uvi_now(const uvc_mode_controller_t* ctl) {
    return uvc_clock_now_ms(&ctl->hw.clock);
}

static bool uvi_run_exists(const uvc_mode_controller_t* ctl) {
    return ctl->state == UVC_SYSTEM_RUNNING || ctl->state == UVC_SYSTEM_PAUSED;
}

static void uvi_publish(const uvc_mode_controller_t* ctl) {
    if (ctl->sink == NULL) return;
    uvc_status_t st;
    uvc_mode_controller_get_status(ctl, &st);
    ctl->sink(&st, ctl->sink_ctx);
}

static void uvi_set_state(uvc_mode_controller_t* ctl, uvc_system_state_t next, const char* why) {
    if (ctl->state == next) return;
    UVC_LOGF("state %s -> %s (%s)", uvc_system_state_name(ctl->state), uvc_system_state_name(next), why);
    ctl->state = next;
    uvi_publish(ctl);
}

static void uvi_end_run(uvc_mode_controller_t* ctl, uvc_run_outcome_t outcome) {
    ctl->last_outcome = outcome;
    ctl->pause_reason = UVC_PAUSE_NONE;
    ctl->resync = false;
    uvc_engine_reset(&ctl->engine);
}

static void uvi_enter_fault(uvc_mode_controller_t* ctl, uvc_fault_t fault) {
    bool off_confirmed = uvc_pwm_emergency_off(&ctl->pwm);
    if (ctl->state == UVC_SYSTEM_FAULT) {
        return; /* first fault stays reported */
    }
    if (!off_confirmed) {
        UVC_LOGF("fault: output off not confirmed");
    }
    if (uvi_run_exists(ctl)) {
        uvi_end_run(ctl, UVC_OUTCOME_FAULTED);
    }
    ctl->fault = fault;
    uvi_set_state(ctl, UVC_SYSTEM_FAULT,
                  fault == UVC_FAULT_LID_SENSOR ? "lid sensor fault" : "pwm readback fault");
}

/* Output off outside interlock handling; a failed readback is a hardware fault. */
static void uvi_output_off(uvc_mode_controller_t* ctl) {
    if (!uvc_pwm_emergency_off(&ctl->pwm)) {
        uvi_enter_fault(ctl, UVC_FAULT_PWM_READBACK);
    }
}

static uvc_command_result_t uvi_accept(uvc_mode_controller_t* ctl, uvc_beep_pattern_t beep) {
    uvc_command_result_t r;
    r.accepted = true;
    r.reason = UVC_REJECT_NONE;
    r.validation = UVC_VALID_OK;
    r.node = UVC_NODE_NONE;
    uvc_beeper_play(&ctl->beeper, beep, uvi_now(ctl));
    return r;
}

static uvc_command_result_t uvi_reject(uvc_mode_controller_t* ctl, const char* cmd, uvc_reject_reason_t reason) {
    uvc_command_result_t r;
    r.accepted = false;
    r.reason = reason;
    r.validation = UVC_VALID_OK;
    r.node = UVC_NODE_NONE;
    UVC_LOGF("%s rejected: %s", cmd, uvc_reject_reason_name(reason));
    uvc_beeper_play(&ctl->beeper, UVC_BEEP_REJECT, uvi_now(ctl));
    return r;
}

static uvc_command_result_t uvi_reject_invalid(uvc_mode_controller_t* ctl, const char* cmd,
                                               uvc_validation_error_t err, uint8_t node) {
    UVC_LOGF("%s: validation failed: %s node=%d", cmd, uvc_validation_error_name(err),
             node == UVC_NODE_NONE ? -1 : (int)node);
    uvc_command_result_t r = uvi_reject(ctl, cmd, UVC_REJECT_VALIDATION_FAILED);
    r.validation = err;
    r.node = node;
    return r;
}

/* Idle-only commands share the same gate. */
static bool uvi_require_idle(const uvc_mode_controller_t* ctl, uvc_reject_reason_t* reason) {
    if (ctl->state == UVC_SYSTEM_FAULT) {
        *reason = UVC_REJECT_IN_FAULT;
        return false;
    }
    if (ctl->state != UVC_SYSTEM_IDLE) {
        *reason = UVC_REJECT_BUSY;
        return false;
    }
    return true;
}

static uvc_validation_error_t uvi_validate(const uvc_mode_controller_t* ctl, const uvc_profile_t* p, uint8_t* node) {
    bool allow_unbounded = (ctl->mode == UVC_MODE_CUSTOM) && p->manual_stop;
    return uvc_profile_validate(p, allow_unbounded, uvc_get_config()->max_total_duration_ms, node);
}

static void uvc_mode_controller_run_log(uvc_mode_controller_t* ctl, uint32_t now_ms) {
    const uvc_config_t* cfg = uvc_get_config();

    if (!uvc_clock_has_elapsed(now_ms, ctl->last_log_ms, cfg->periodic_log_ms)) return;
    ctl->last_log_ms = now_ms;

    uvc_status_t st;
    uvc_mode_controller_get_status(ctl, &st);
    int tenths = (int)(st.intensity_pct * 10.0f + 0.5f);
    long remaining = (st.remaining_ms == UVC_DURATION_UNBOUNDED) ? -1L : (long)st.remaining_ms;
    UVC_LOGF("state=%s lid=%s int=%d.%d%% elapsed=%lums remaining=%ldms node=%d fault=%d",
             uvc_system_state_name(st.system_state),
             st.interlock_state == UVC_INTERLOCK_CLOSED ? "CLOSED" : "OPEN",
             tenths / 10, tenths % 10,
             (unsigned long)st.elapsed_ms,
             remaining,
             uvc_engine_active_node(&ctl->engine) == UVC_NODE_NONE ? -1 : (int)uvc_engine_active_node(&ctl->engine),
             (int)st.fault);
}

const char* uvc_system_state_name(uvc_system_state_t state) {
    switch (state) {
        case UVC_SYSTEM_IDLE:    return "IDLE";
        case UVC_SYSTEM_RUNNING: return "RUNNING";
        case UVC_SYSTEM_PAUSED:  return "PAUSED";
        case UVC_SYSTEM_FAULT:   return "FAULT";
    }
    return "?";
}

const char* uvc_reject_reason_name(uvc_reject_reason_t reason) {
    switch (reason) {
        case UVC_REJECT_NONE:              return "none";
        case UVC_REJECT_BUSY:              return "busy";
        case UVC_REJECT_NO_PROFILE:        return "no profile";
        case UVC_REJECT_VALIDATION_FAILED: return "validation failed";
        case UVC_REJECT_INTERLOCK_OPEN:    return "interlock open";
        case UVC_REJECT_NOT_RUNNING:       return "not running";
        case UVC_REJECT_NOT_PAUSED:        return "not paused";
        case UVC_REJECT_NOT_ACTIVE:        return "not active";
        case UVC_REJECT_NOT_FAULTED:       return "not faulted";
        case UVC_REJECT_IN_FAULT:          return "in fault";
        case UVC_REJECT_INVALID_ARGUMENT:  return "invalid argument";
    }
    return "?";
}

/* Public API */
bool uvc_mode_controller_init(uvc_mode_controller_t* ctl, const uvc_hw_t* hw) {
    memset(ctl, 0, sizeof(*ctl));
    ctl->hw = *hw;

    uint32_t now = uvi_now(ctl);
    uvc_interlock_init(&ctl->interlock, now);
    uvc_engine_reset(&ctl->engine);
    uvc_beeper_init(&ctl->beeper);

    ctl->state = UVC_SYSTEM_IDLE;
    ctl->mode = UVC_MODE_STANDARD;
    ctl->pause_reason = UVC_PAUSE_NONE;
    ctl->fault = UVC_FAULT_NONE;
    ctl->last_outcome = UVC_OUTCOME_NONE;
    ctl->profile_loaded = false;
    ctl->last_tick_ms = now;
    ctl->last_log_ms = now;
    ctl->resync = false;

    if (!uvc_pwm_init(&ctl->pwm, &hw->pwm)) {
        uvi_enter_fault(ctl, UVC_FAULT_PWM_READBACK);
        return false;
    }
    UVC_LOGF("mode control init");
    return true;
}

void uvc_mode_controller_set_status_sink(uvc_mode_controller_t* ctl, uvc_status_sink_fn sink, void* ctx) {
    ctl->sink = sink;
    ctl->sink_ctx = ctx;
}

void uvc_mode_controller_tick(uvc_mode_controller_t* ctl) {
    const uvc_config_t* cfg = uvc_get_config();
    uint32_t now = uvi_now(ctl);
    uint32_t delta = uvc_clock_elapsed_ms(now, ctl->last_tick_ms);
    ctl->last_tick_ms = now;

    /* 1. Interlock, before any output write. */
    uvc_lid_reading_t reading = (ctl->hw.read_lid != NULL) ? ctl->hw.read_lid() : UVC_LID_READ_FAULT;
    uvc_interlock_poll(&ctl->interlock, reading, now);
    bool safe = uvc_interlock_is_safe_to_emit(&ctl->interlock);

    if (uvc_interlock_has_sensor_fault(&ctl->interlock)) {
        uvi_enter_fault(ctl, UVC_FAULT_LID_SENSOR);
    }

    if (!safe) {
        /* Interlock-open handling: emergency off only, run time frozen. */
        if (!uvc_pwm_emergency_off(&ctl->pwm)) {
            uvi_enter_fault(ctl, UVC_FAULT_PWM_READBACK);
        }
        if (ctl->state == UVC_SYSTEM_RUNNING) {
            ctl->pause_reason = UVC_PAUSE_INTERLOCK_OPEN;
            uvc_beeper_play(&ctl->beeper, UVC_BEEP_LID_ABORT, now);
            uvi_set_state(ctl, UVC_SYSTEM_PAUSED, "interlock open");
        }
    } else {
        if (ctl->state == UVC_SYSTEM_PAUSED && ctl->pause_reason == UVC_PAUSE_INTERLOCK_OPEN &&
            cfg->interlock_auto_resume) {
            ctl->pause_reason = UVC_PAUSE_NONE;
            ctl->resync = true;
            uvi_set_state(ctl, UVC_SYSTEM_RUNNING, "interlock closed");
        }

        if (ctl->state == UVC_SYSTEM_RUNNING) {
            /* 2. Advance the run and apply its output. */
            uint32_t step = ctl->resync ? 0 : delta;
            float requested = 0.0f;
            ctl->resync = false;

            if (uvc_engine_tick(&ctl->engine, step, &requested) == UVC_ENGINE_COMPLETE) {
                uvi_output_off(ctl);
                if (ctl->state == UVC_SYSTEM_RUNNING) {
                    uvi_end_run(ctl, UVC_OUTCOME_COMPLETE);
                    uvc_beeper_play(&ctl->beeper, UVC_BEEP_DONE, now);
                    uvi_set_state(ctl, UVC_SYSTEM_IDLE, "profile complete");
                }
            } else if (!uvc_pwm_set_intensity(&ctl->pwm, requested)) {
                uvi_enter_fault(ctl, UVC_FAULT_PWM_READBACK);
            }
        } else if (ctl->state == UVC_SYSTEM_FAULT) {
            uvi_output_off(ctl);
        } else if (!uvc_pwm_verify(&ctl->pwm)) {
            uvi_enter_fault(ctl, UVC_FAULT_PWM_READBACK);
        }
    }

    uvi_publish(ctl);
    uvc_mode_controller_run_log(ctl, now);
}

uvc_command_result_t uvc_mode_controller_select_mode(uvc_mode_controller_t* ctl, uvc_run_mode_t mode) {
    uvc_reject_reason_t reason;
    if (mode != UVC_MODE_STANDARD && mode != UVC_MODE_CUSTOM) {
        return uvi_reject(ctl, "mode", UVC_REJECT_INVALID_ARGUMENT);
    }
    if (!uvi_require_idle(ctl, &reason)) {
        return uvi_reject(ctl, "mode", reason);
    }
    ctl->mode = mode;
    UVC_LOGF("mode %s", mode == UVC_MODE_CUSTOM ? "CUSTOM" : "STANDARD");
    uvi_publish(ctl);
    return uvi_accept(ctl, UVC_BEEP_ACCEPT);
}

uvc_command_result_t uvc_mode_controller_load_profile(uvc_mode_controller_t* ctl, const uvc_profile_t* profile) {
    uvc_reject_reason_t reason;
    if (profile == NULL) {
        return uvi_reject(ctl, "load", UVC_REJECT_INVALID_ARGUMENT);
    }
    if (!uvi_require_idle(ctl, &reason)) {
        return uvi_reject(ctl, "load", reason);
    }

    uint8_t node = UVC_NODE_NONE;
    uvc_validation_error_t err = uvi_validate(ctl, profile, &node);
    if (err != UVC_VALID_OK) {
        return uvi_reject_invalid(ctl, "load", err, node);
    }

    ctl->profile = *profile;
    ctl->profile.name[UVC_PROFILE_NAME_LEN - 1] = '\0';
    ctl->profile_loaded = true;
    ctl->last_outcome = UVC_OUTCOME_NONE;

    uint32_t total = uvc_profile_total_ms(&ctl->profile);
    UVC_LOGF("loaded '%s' nodes=%d total=%ldms", ctl->profile.name, (int)ctl->profile.node_count,
             total == UVC_DURATION_UNBOUNDED ? -1L : (long)total);
    return uvi_accept(ctl, UVC_BEEP_ACCEPT);
}

uvc_command_result_t uvc_mode_controller_load_standard(uvc_mode_controller_t* ctl, uvc_time_unit_t unit,
                                                       uint32_t value, uint8_t intensity) {
    uint32_t duration_ms = 0;
    if (!uvc_time_unit_to_ms(unit, value, &duration_ms) || intensity > UVC_INTENSITY_MAX) {
        return uvi_reject(ctl, "standard", UVC_REJECT_INVALID_ARGUMENT);
    }

    uvc_profile_t p;
    if (!uvc_profile_make_standard(&p, duration_ms, intensity)) {
        return uvi_reject(ctl, "standard", UVC_REJECT_INVALID_ARGUMENT);
    }
    return uvc_mode_controller_load_profile(ctl, &p);
}

uvc_command_result_t uvc_mode_controller_start(uvc_mode_controller_t* ctl, const uvc_profile_t* profile) {
    uvc_reject_reason_t reason;
    if (!uvi_require_idle(ctl, &reason)) {
        return uvi_reject(ctl, "start", reason);
    }
    if (profile != NULL) {
        uvc_command_result_t loaded = uvc_mode_controller_load_profile(ctl, profile);
        if (!loaded.accepted) {
            return loaded;
        }
    }
    if (!ctl->profile_loaded) {
        return uvi_reject(ctl, "start", UVC_REJECT_NO_PROFILE);
    }

    /* Mode may have changed since the profile was loaded. */
    uint8_t node = UVC_NODE_NONE;
    uvc_validation_error_t err = uvi_validate(ctl, &ctl->profile, &node);
    if (err != UVC_VALID_OK) {
        return uvi_reject_invalid(ctl, "start", err, node);
    }
    if (!uvc_interlock_is_safe_to_emit(&ctl->interlock)) {
        return uvi_reject(ctl, "start", UVC_REJECT_INTERLOCK_OPEN);
    }

    uvc_engine_start(&ctl->engine, &ctl->profile);
    ctl->pause_reason = UVC_PAUSE_NONE;
    ctl->last_outcome = UVC_OUTCOME_NONE;
    ctl->resync = true;
    uvc_command_result_t r = uvi_accept(ctl, UVC_BEEP_START);
    uvi_set_state(ctl, UVC_SYSTEM_RUNNING, "start");
    return r;
}

uvc_command_result_t uvc_mode_controller_pause(uvc_mode_controller_t* ctl) {
    if (ctl->state == UVC_SYSTEM_FAULT) {
        return uvi_reject(ctl, "pause", UVC_REJECT_IN_FAULT);
    }
    if (ctl->state != UVC_SYSTEM_RUNNING) {
        return uvi_reject(ctl, "pause", UVC_REJECT_NOT_RUNNING);
    }

    uvi_output_off(ctl);
    if (ctl->state == UVC_SYSTEM_FAULT) {
        return uvi_reject(ctl, "pause", UVC_REJECT_IN_FAULT);
    }
    ctl->pause_reason = UVC_PAUSE_USER;
    uvc_command_result_t r = uvi_accept(ctl, UVC_BEEP_ACCEPT);
    uvi_set_state(ctl, UVC_SYSTEM_PAUSED, "user pause");
    return r;
}

uvc_command_result_t uvc_mode_controller_resume(uvc_mode_controller_t* ctl) {
    if (ctl->state == UVC_SYSTEM_FAULT) {
        return uvi_reject(ctl, "resume", UVC_REJECT_IN_FAULT);
    }
    if (ctl->state != UVC_SYSTEM_PAUSED) {
        return uvi_reject(ctl, "resume", UVC_REJECT_NOT_PAUSED);
    }
    if (!uvc_interlock_is_safe_to_emit(&ctl->interlock)) {
        return uvi_reject(ctl, "resume", UVC_REJECT_INTERLOCK_OPEN);
    }

    ctl->pause_reason = UVC_PAUSE_NONE;
    ctl->resync = true;
    uvc_command_result_t r = uvi_accept(ctl, UVC_BEEP_ACCEPT);
    uvi_set_state(ctl, UVC_SYSTEM_RUNNING, "user resume");
    return r;
}

uvc_command_result_t uvc_mode_controller_stop(uvc_mode_controller_t* ctl) {
    /* Output goes off whatever the state. */
    uvi_output_off(ctl);

    if (ctl->state == UVC_SYSTEM_FAULT) {
        return uvi_reject(ctl, "stop", UVC_REJECT_IN_FAULT);
    }
    if (!uvi_run_exists(ctl)) {
        return uvi_reject(ctl, "stop", UVC_REJECT_NOT_ACTIVE);
    }

    uvi_end_run(ctl, UVC_OUTCOME_ABORTED);
    uvc_command_result_t r = uvi_accept(ctl, UVC_BEEP_ACCEPT);
    uvi_set_state(ctl, UVC_SYSTEM_IDLE, "user stop");
    return r;
}

uvc_command_result_t uvc_mode_controller_acknowledge_fault(uvc_mode_controller_t* ctl) {
    if (ctl->state != UVC_SYSTEM_FAULT) {
        return uvi_reject(ctl, "ack", UVC_REJECT_NOT_FAULTED);
    }

    /* Leave Fault only once the output is confirmed off. */
    uvc_pwm_clear_fault(&ctl->pwm);
    if (!uvc_pwm_emergency_off(&ctl->pwm)) {
        ctl->fault = UVC_FAULT_PWM_READBACK;
        return uvi_reject(ctl, "ack", UVC_REJECT_IN_FAULT);
    }

    UVC_LOGF("fault %d acknowledged", (int)ctl->fault);
    ctl->fault = UVC_FAULT_NONE;
    uvi_set_state(ctl, UVC_SYSTEM_IDLE, "fault acknowledged");
    return uvi_accept(ctl, UVC_BEEP_ACCEPT);
}

void uvc_mode_controller_get_status(const uvc_mode_controller_t* ctl, uvc_status_t* out) {
    out->system_state = ctl->state;
    out->interlock_state = ctl->interlock.state;
    out->intensity_pct = uvc_pwm_get_intensity(&ctl->pwm);
    out->mode = ctl->mode;
    out->pause_reason = ctl->pause_reason;
    out->fault = ctl->fault;
    out->last_outcome = ctl->last_outcome;
    out->sensor_fault = uvc_interlock_has_sensor_fault(&ctl->interlock);

    if (uvi_run_exists(ctl)) {
        out->elapsed_ms = uvc_engine_elapsed_ms(&ctl->engine);
        out->remaining_ms = uvc_engine_remaining_ms(&ctl->engine);
    } else {
        out->elapsed_ms = 0;
        out->remaining_ms = 0;
    }
}

uvc_system_state_t uvc_mode_controller_state(const uvc_mode_controller_t* ctl) {
    return ctl->state;
}

bool uvc_mode_controller_buzzer_on(uvc_mode_controller_t* ctl) {
    return uvc_beeper_update(&ctl->beeper, uvi_now(ctl));
}
