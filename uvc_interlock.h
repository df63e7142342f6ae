/**
 * @file uvc_interlock.h
 * @brief Lid safety interlock supervisor.
 * @details Debounces the supervised lid line and reports whether UV emission is
 *          permitted. The supervisor boots Open and falls back to Open on any
 *          shorted or disconnected line reading.
 */
#ifndef UVC_INTERLOCK_H
#define UVC_INTERLOCK_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Debounced interlock state.
 */
typedef enum {
    UVC_INTERLOCK_OPEN = 0,   /**< Emission forbidden. */
    UVC_INTERLOCK_CLOSED      /**< Lid closed for at least one debounce window. */
} uvc_interlock_state_t;

/**
 * @brief One raw reading of the lid line.
 */
typedef enum {
    UVC_LID_READ_OPEN = 0,
    UVC_LID_READ_CLOSED,
    UVC_LID_READ_FAULT        /**< Line shorted or disconnected. */
} uvc_lid_reading_t;

/**
 * @brief Supervisor state; written only by uvc_interlock_poll().
 */
typedef struct {
    uvc_interlock_state_t state;      /**< Reported (debounced) state. */
    uvc_lid_reading_t     candidate;  /**< Last valid raw reading. */
    uint32_t candidate_since_ms;      /**< When the candidate was first seen. */

    bool     sensor_fault;            /**< Latched line fault. */
    bool     fault_timing;            /**< A fault reading window is running. */
    uint32_t fault_since_ms;
    bool     valid_timing;            /**< A valid reading window is running (clears the latch). */
    uint32_t valid_since_ms;
} uvc_interlock_t;

/**
 * @brief Reset to Open with no latched fault.
 */
void uvc_interlock_init(uvc_interlock_t* il, uint32_t now_ms);

/**
 * @brief Feed one raw reading; call once per tick before any output write.
 * @return The debounced state after this reading.
 */
uvc_interlock_state_t uvc_interlock_poll(uvc_interlock_t* il, uvc_lid_reading_t reading, uint32_t now_ms);

/**
 * @brief True iff the debounced state is Closed and no line fault is latched.
 */
bool uvc_interlock_is_safe_to_emit(const uvc_interlock_t* il);

/**
 * @brief True while a line fault is latched.
 */
bool uvc_interlock_has_sensor_fault(const uvc_interlock_t* il);

/**
 * @brief Classify a lid line voltage using the configured bands.
 */
uvc_lid_reading_t uvc_interlock_classify_mv(uint16_t sense_mv);

#ifdef __cplusplus
}
#endif

#endif /* UVC_INTERLOCK_H */
