/**
 * @file uvc_profile_engine.h
 * @brief Profile execution engine.
 * @details Walks a validated profile with an index-path cursor and turns the
 *          elapsed run time into a requested intensity. The cursor is owned by
 *          the engine, reset by uvc_engine_start() and changed only by
 *          uvc_engine_tick().
 */
#ifndef UVC_PROFILE_ENGINE_H
#define UVC_PROFILE_ENGINE_H

#include <stdint.h>
#include <stdbool.h>
#include "uvc_profile.h"

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Segment boundaries crossed in one tick before the rest is carried to the next. */
#define UVC_ENGINE_MAX_TRANSITIONS 64U

typedef enum {
    UVC_ENGINE_RUNNING = 0,    /**< A segment is active. */
    UVC_ENGINE_COMPLETE        /**< No segment and no Loop iteration remains. */
} uvc_engine_result_t;

/**
 * @brief Execution cursor.
 * @note path[0..depth-1] are the enclosing Loops, path[depth] the active Segment.
 *       remaining[i] counts the iterations of path[i] still to run, the current
 *       one included; UVC_REPEAT_INFINITE never counts down.
 */
typedef struct {
    uint8_t  path[UVC_PROFILE_MAX_DEPTH + 1];
    uint16_t remaining[UVC_PROFILE_MAX_DEPTH + 1];
    uint8_t  depth;
    bool     started;
    bool     active;
    bool     complete;
    uint32_t segment_elapsed_ms;
    uint32_t run_elapsed_ms;
    uint32_t carry_ms;         /**< Time not yet applied after hitting the transition cap. */
} uvc_cursor_t;

typedef struct {
    const uvc_profile_t* profile;
    uvc_cursor_t cursor;
    uint32_t total_ms;         /**< Declared run length, UVC_DURATION_UNBOUNDED for manual stop. */
    float    intensity;        /**< Last requested intensity. */
} uvc_profile_engine_t;

/**
 * @brief Bind a validated profile and reset the cursor before its first segment.
 * @note The profile must stay alive and unchanged until the run ends.
 */
void uvc_engine_start(uvc_profile_engine_t* e, const uvc_profile_t* profile);

/**
 * @brief Drop the profile and the cursor.
 */
void uvc_engine_reset(uvc_profile_engine_t* e);

/**
 * @brief Advance the run by @p delta_ms and compute the requested intensity.
 * @param requested receives the intensity in percent (0 when complete)
 * @return UVC_ENGINE_COMPLETE once the last segment has finished.
 */
uvc_engine_result_t uvc_engine_tick(uvc_profile_engine_t* e, uint32_t delta_ms, float* requested);

/**
 * @brief Intensity of one segment at @p elapsed_ms into it.
 */
float uvc_segment_intensity(const uvc_segment_t* seg, uint32_t elapsed_ms);

/** @brief Run time consumed so far. */
uint32_t uvc_engine_elapsed_ms(const uvc_profile_engine_t* e);

/** @brief Run time left, or UVC_DURATION_UNBOUNDED for a manual-stop run. */
uint32_t uvc_engine_remaining_ms(const uvc_profile_engine_t* e);

/** @brief Active segment node, UVC_NODE_NONE if none. */
uint8_t uvc_engine_active_node(const uvc_profile_engine_t* e);

/** @brief Time spent in the active segment. */
uint32_t uvc_engine_segment_elapsed_ms(const uvc_profile_engine_t* e);

bool uvc_engine_is_complete(const uvc_profile_engine_t* e);

#ifdef __cplusplus
}
#endif

#endif /* UVC_PROFILE_ENGINE_H */
