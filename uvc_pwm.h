/**
 * @file uvc_pwm.h
 * @brief UV LED PWM output driver.
 * @details Maps a requested intensity (0-100 %) to a duty value on an injected
 *          port. The last written duty stays in effect until overwritten.
 *          Every write is verified by reading the duty back from the port.
 */
#ifndef UVC_PWM_H
#define UVC_PWM_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Readback may differ from the commanded duty by this many counts. */
#define UVC_PWM_READBACK_TOLERANCE 1U

/**
 * @brief Hardware port for the PWM channel.
 */
typedef struct {
    void     (*write_duty)(uint16_t duty);
    uint16_t (*read_duty)(void);
    uint16_t duty_max;                /**< Duty value for 100 %. */
} uvc_pwm_port_t;

/**
 * @brief Driver state.
 */
typedef struct {
    uvc_pwm_port_t port;
    float    intensity_pct;           /**< Last applied intensity after clamping. */
    uint16_t duty;                    /**< Last commanded duty. */
    uint32_t clamp_count;             /**< Out-of-range requests seen. */
    bool     readback_fault;          /**< Latched on readback mismatch. */
} uvc_pwm_t;

/**
 * @brief Bind the port and force the output off.
 * @return false if the port is incomplete or the off state does not read back.
 */
bool uvc_pwm_init(uvc_pwm_t* pwm, const uvc_pwm_port_t* port);

/**
 * @brief Apply an intensity; out-of-range input is clamped to [0, 100] and logged.
 * @return false on readback mismatch (readback_fault is latched).
 */
bool uvc_pwm_set_intensity(uvc_pwm_t* pwm, float percent);

/**
 * @brief Force duty 0. Always writes the port, even with a latched fault.
 * @return false if 0 does not read back.
 */
bool uvc_pwm_emergency_off(uvc_pwm_t* pwm);

/**
 * @brief Compare the port against the last commanded duty.
 * @return false on mismatch (readback_fault is latched).
 */
bool uvc_pwm_verify(uvc_pwm_t* pwm);

/** @brief Clear a latched readback fault (after acknowledgement). */
void uvc_pwm_clear_fault(uvc_pwm_t* pwm);

/** @brief Last applied intensity in percent. */
float uvc_pwm_get_intensity(const uvc_pwm_t* pwm);

/** @brief Last commanded duty value. */
uint16_t uvc_pwm_get_duty(const uvc_pwm_t* pwm);

/** @brief Duty value for an intensity, rounded to nearest. */
uint16_t uvc_pwm_duty_for_percent(float percent, uint16_t duty_max);

#ifdef __cplusplus
}
#endif

#endif /* UVC_PWM_H */
