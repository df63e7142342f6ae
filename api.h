// Board API for the UV curing chamber (RP2040 Pico, arduino-pico core).
// Everything pin- or peripheral-specific lives behind these calls so the
// control modules can be built and tested on the host.

#pragma once

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum
{
    // pin GP27 / ADC1
    // supervised lid switch line (series + end-of-line resistor)
    LID_SENSE,
} input_t;

typedef enum
{
    // pin GP17
    BUZZER,

    // pin GP21
    // steady/blinking status lamp next to the knob
    STATUS_LAMP,
} output_t;

// 1 kHz PWM, duty in [0, UV_PWM_DUTY_MAX]
#define UV_PWM_FREQ_HZ   1000U
#define UV_PWM_DUTY_MAX  1000U

void setup_api();

// returns voltage in millivolts
uint16_t read_voltage(input_t input);

// true for on, false for off
void set_output(output_t output, bool output_state);

// pin GP26, 405nm LED driver gate
void set_uv_pwm_duty(uint16_t duty);

// duty currently loaded in the PWM slice compare register
uint16_t read_uv_pwm_duty();

// returns the current number of milliseconds since the board began running
uint32_t get_millis();

// note that float %f format is not supported
void serial_printf(const char * format, ...);

// returns -1 if no byte is pending
int serial_read_char();

// whole-file access to the program store on flash.
// read returns bytes read (0 if the file does not exist), -1 on error.
int storage_read(char* buffer, size_t capacity);
bool storage_write(const char* data, size_t length);

#ifdef __cplusplus
}
#endif
