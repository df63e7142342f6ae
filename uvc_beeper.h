/**
 * @file uvc_beeper.h
 * @brief Non-blocking buzzer patterns driven from the control tick.
 */
#ifndef UVC_BEEPER_H
#define UVC_BEEPER_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum {
    UVC_BEEP_NONE = 0,
    UVC_BEEP_ACCEPT,      /**< 60 ms */
    UVC_BEEP_REJECT,      /**< 100 ms */
    UVC_BEEP_START,       /**< 120 ms */
    UVC_BEEP_DONE,        /**< 3 x 120 ms, 120 ms gaps */
    UVC_BEEP_LID_ABORT    /**< 2 x 200 ms, 100 ms gap */
} uvc_beep_pattern_t;

typedef struct {
    uvc_beep_pattern_t pattern;
    uint8_t  step;            /**< Even steps sound, odd steps are gaps. */
    uint32_t step_since_ms;
} uvc_beeper_t;

void uvc_beeper_init(uvc_beeper_t* b);

/** @brief Start a pattern, replacing any pattern in progress. */
void uvc_beeper_play(uvc_beeper_t* b, uvc_beep_pattern_t pattern, uint32_t now_ms);

/**
 * @brief Advance the pattern.
 * @return Buzzer level for @p now_ms.
 */
bool uvc_beeper_update(uvc_beeper_t* b, uint32_t now_ms);

bool uvc_beeper_is_busy(const uvc_beeper_t* b);

#ifdef __cplusplus
}
#endif

#endif /* UVC_BEEPER_H */
