/**
 * @file uvc_beeper.cpp
 */
#include "uvc_beeper.h"
#include "uvc_clock.h"

#define UVI_BEEP_MAX_STEPS 5U

typedef struct {
    uint8_t  count;
    uint16_t steps_ms[UVI_BEEP_MAX_STEPS];
} uvi_beep_table_t;

static const uvi_beep_table_t uvi_patterns[] = {
    { 0, { 0 } },                          /* NONE */
    { 1, { 60 } },                         /* ACCEPT */
    { 1, { 100 } },                        /* REJECT */
    { 1, { 120 } },                        /* START */
    { 5, { 120, 120, 120, 120, 120 } },    /* DONE */
    { 3, { 200, 100, 200 } },              /* LID_ABORT */
};

void uvc_beeper_init(uvc_beeper_t* b) {
    b->pattern = UVC_BEEP_NONE;
    b->step = 0;
    b->step_since_ms = 0;
}

void uvc_beeper_play(uvc_beeper_t* b, uvc_beep_pattern_t pattern, uint32_t now_ms) {
    b->pattern = pattern;
    b->step = 0;
    b->step_since_ms = now_ms;
}

bool uvc_beeper_update(uvc_beeper_t* b, uint32_t now_ms) {
    if (b->pattern == UVC_BEEP_NONE) {
        return false;
    }

    const uvi_beep_table_t* t = &uvi_patterns[b->pattern];
    while (uvc_clock_has_elapsed(now_ms, b->step_since_ms, t->steps_ms[b->step])) {
        b->step_since_ms += t->steps_ms[b->step];
        b->step++;
        if (b->step >= t->count) {
            b->pattern = UVC_BEEP_NONE;
            b->step = 0;
            return false;
        }
    }
    return (b->step % 2U) == 0U;
}

bool uvc_beeper_is_busy(const uvc_beeper_t* b) {
    return b->pattern != UVC_BEEP_NONE;
}
