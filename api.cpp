#include "api.h"
#include "Arduino.h"
#include <LittleFS.h>
#include <hardware/gpio.h>
#include <hardware/pwm.h>
#include <stdarg.h>

#define PIN_UV_PWM      26
#define PIN_BUZZER      17
#define PIN_STATUS_LAMP 21
#define PIN_LID_SENSE   A1

#define PROGRAMS_FILE "/uv_programs.json"

void setup_api()
{
  pinMode(PIN_BUZZER, OUTPUT);
  pinMode(PIN_STATUS_LAMP, OUTPUT);
  pinMode(PIN_UV_PWM, OUTPUT);

  analogWriteFreq(UV_PWM_FREQ_HZ);
  analogWriteRange(UV_PWM_DUTY_MAX);
  set_uv_pwm_duty(0); // LED driver must come up dark

  analogReadResolution(12);

  Serial.begin(115200);
  LittleFS.begin();
}

// returns voltage in millivolts
uint16_t read_voltage(input_t input)
{
  if (input == LID_SENSE)
  {
    return (uint32_t)analogRead(PIN_LID_SENSE) * 3300 / 4095;
  }

  return 0;
}

// true for on, false for off
void set_output(output_t output, bool output_state)
{
  if (output == BUZZER)
  {
    digitalWrite(PIN_BUZZER, output_state);
  }
  else if (output == STATUS_LAMP)
  {
    digitalWrite(PIN_STATUS_LAMP, output_state);
  }
}

void set_uv_pwm_duty(uint16_t duty)
{
  if (duty > UV_PWM_DUTY_MAX)
  {
    duty = UV_PWM_DUTY_MAX;
  }
  analogWrite(PIN_UV_PWM, duty);
}

// reads the duty back from the slice registers, not from a shadow copy,
// so a stuck or reconfigured slice shows up as a mismatch
uint16_t read_uv_pwm_duty()
{
  // the core drops to plain GPIO for 0% and 100%
  if (gpio_get_function(PIN_UV_PWM) != GPIO_FUNC_PWM)
  {
    return digitalRead(PIN_UV_PWM) == HIGH ? UV_PWM_DUTY_MAX : 0;
  }

  uint slice = pwm_gpio_to_slice_num(PIN_UV_PWM);
  uint32_t cc = pwm_hw->slice[slice].cc;
  uint32_t level = (pwm_gpio_to_channel(PIN_UV_PWM) == PWM_CHAN_A) ? (cc & 0xFFFFu) : (cc >> 16);
  uint32_t top = pwm_hw->slice[slice].top + 1u;

  return (uint16_t)((level * UV_PWM_DUTY_MAX + top / 2u) / top);
}

uint32_t get_millis()
{
  return millis();
}

void serial_printf(const char * format, ...)
{
  char buffer[256];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, 256, format, args);
  va_end (args);

  Serial.print(buffer);
}

int serial_read_char()
{
  return Serial.available() > 0 ? Serial.read() : -1;
}

int storage_read(char* buffer, size_t capacity)
{
  if (!LittleFS.exists(PROGRAMS_FILE))
  {
    return 0;
  }
  File f = LittleFS.open(PROGRAMS_FILE, "r");
  if (!f)
  {
    return -1;
  }
  size_t n = f.readBytes(buffer, capacity);
  f.close();
  return (int)n;
}

bool storage_write(const char* data, size_t length)
{
  File f = LittleFS.open(PROGRAMS_FILE, "w");
  if (!f)
  {
    return false;
  }
  size_t n = f.write((const uint8_t*)data, length);
  f.close();
  return n == length;
}
