/**
 * @file uvc_clock.cpp
 */
#include "uvc_clock.h"
#include <stddef.h>

uint32_t uvc_clock_now_ms(const uvc_clock_t* clock) {
    if (clock == NULL || clock->now_ms == NULL) {
        return 0;
    }
    return clock->now_ms();
}

uint32_t uvc_clock_elapsed_ms(uint32_t now, uint32_t since) {
    /* unsigned subtraction is modulo 2^32 */
    return (uint32_t)(now - since);
}

bool uvc_clock_has_elapsed(uint32_t now, uint32_t since, uint32_t interval_ms) {
    return uvc_clock_elapsed_ms(now, since) >= interval_ms;
}
