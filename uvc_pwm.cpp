/**
 * @file uvc_pwm.cpp
 * @brief Intensity to duty mapping with clamp and readback check.
 */
#include "uvc_pwm.h"
#include "uvc_logging.h"
#include <stddef.h>

static bool uvi_readback_matches(const uvc_pwm_t* pwm) {
    uint16_t actual = pwm->port.read_duty();
    uint16_t diff = (actual > pwm->duty) ? (uint16_t)(actual - pwm->duty) : (uint16_t)(pwm->duty - actual);
    return diff <= UVC_PWM_READBACK_TOLERANCE;
}

static bool uvi_write(uvc_pwm_t* pwm, uint16_t duty, float percent) {
    pwm->port.write_duty(duty);
    pwm->duty = duty;
    pwm->intensity_pct = percent;
    return uvc_pwm_verify(pwm);
}

uint16_t uvc_pwm_duty_for_percent(float percent, uint16_t duty_max) {
    if (!(percent > 0.0f)) return 0;      /* also catches NaN */
    if (percent >= 100.0f) return duty_max;
    return (uint16_t)(percent * (float)duty_max / 100.0f + 0.5f);
}

bool uvc_pwm_init(uvc_pwm_t* pwm, const uvc_pwm_port_t* port) {
    pwm->intensity_pct = 0.0f;
    pwm->duty = 0;
    pwm->clamp_count = 0;
    pwm->readback_fault = false;

    if (port == NULL || port->write_duty == NULL || port->read_duty == NULL || port->duty_max == 0) {
        pwm->port.write_duty = NULL;
        pwm->port.read_duty = NULL;
        pwm->port.duty_max = 0;
        pwm->readback_fault = true;
        UVC_LOGF("pwm init: incomplete port");
        return false;
    }
    pwm->port = *port;
    return uvi_write(pwm, 0, 0.0f);
}

bool uvc_pwm_set_intensity(uvc_pwm_t* pwm, float percent) {
    if (pwm->port.write_duty == NULL) {
        return false;
    }

    float clamped = percent;
    if (!(percent >= 0.0f)) {
        clamped = 0.0f;
    } else if (percent > 100.0f) {
        clamped = 100.0f;
    }
    if (percent != percent) {
        pwm->clamp_count++;
        UVC_LOGF("pwm clamp request=nan");
    } else if (clamped != percent) {
        pwm->clamp_count++;
        long tenths = (percent > 1.0e6f) ? 10000000L : (percent < -1.0e6f) ? -10000000L : (long)(percent * 10.0f);
        UVC_LOGF("pwm clamp request=%ld tenths%%", tenths);
    }

    return uvi_write(pwm, uvc_pwm_duty_for_percent(clamped, pwm->port.duty_max), clamped);
}

bool uvc_pwm_emergency_off(uvc_pwm_t* pwm) {
    if (pwm->port.write_duty == NULL) {
        return false;
    }
    return uvi_write(pwm, 0, 0.0f);
}

bool uvc_pwm_verify(uvc_pwm_t* pwm) {
    if (pwm->port.read_duty == NULL) {
        return false;
    }
    if (uvi_readback_matches(pwm)) {
        return true;
    }
    if (!pwm->readback_fault) {
        UVC_LOGF("pwm readback mismatch duty=%u", (unsigned)pwm->duty);
    }
    pwm->readback_fault = true;
    return false;
}

void uvc_pwm_clear_fault(uvc_pwm_t* pwm) {
    pwm->readback_fault = false;
}

float uvc_pwm_get_intensity(const uvc_pwm_t* pwm) {
    return pwm->intensity_pct;
}

uint16_t uvc_pwm_get_duty(const uvc_pwm_t* pwm) {
    return pwm->duty;
}
