/**
 * @file uvc_clock.h
 * @brief Monotonic millisecond time source and wrap-safe interval helpers.
 * @details The counter is 32-bit and wraps after ~49.7 days. Every duration
 *          comparison in the controller goes through uvc_clock_elapsed_ms().
 */
#ifndef UVC_CLOCK_H
#define UVC_CLOCK_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Milliseconds since boot; never decreases except by wrapping. */
typedef uint32_t (*uvc_now_ms_fn)(void);

/**
 * @brief Clock handle injected into the controller.
 */
typedef struct {
    uvc_now_ms_fn now_ms;
} uvc_clock_t;

/**
 * @brief Current time of the clock.
 * @return 0 if the handle has no time source.
 */
uint32_t uvc_clock_now_ms(const uvc_clock_t* clock);

/**
 * @brief Milliseconds from @p since to @p now, correct across one counter wrap.
 */
uint32_t uvc_clock_elapsed_ms(uint32_t now, uint32_t since);

/**
 * @brief True once at least @p interval_ms has passed since @p since.
 */
bool uvc_clock_has_elapsed(uint32_t now, uint32_t since, uint32_t interval_ms);

#ifdef __cplusplus
}
#endif

#endif /* UVC_CLOCK_H */
