/**
 * @file uvc_board.cpp
 * @brief api.h bindings for the controller and the profile store.
 */
#include "uvc_board.h"
#include "api.h"

uvc_lid_reading_t uvc_board_read_lid(void) {
    return uvc_interlock_classify_mv(read_voltage(LID_SENSE));
}

void uvc_board_hw(uvc_hw_t* hw) {
    hw->clock.now_ms = get_millis;
    hw->pwm.write_duty = set_uv_pwm_duty;
    hw->pwm.read_duty = read_uv_pwm_duty;
    hw->pwm.duty_max = UV_PWM_DUTY_MAX;
    hw->read_lid = uvc_board_read_lid;
}

void uvc_board_storage(uvc_storage_port_t* port) {
    port->read = storage_read;
    port->write = storage_write;
}
