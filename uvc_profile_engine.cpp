/**
 * @file uvc_profile_engine.cpp
 * @brief Per tick:
 *        1. Select the first segment if none is active yet.
 *        2. Advance the active segment by delta; time beyond its end is carried
 *           into the following segments so no run time is lost at boundaries.
 *        3. On each completed segment pick the next one, re-entering the
 *           innermost Loop while it has iterations left.
 *        4. Evaluate the active segment at its elapsed time.
 */
#include "uvc_profile_engine.h"
#include "uvc_logging.h"
#include <string.h>

static bool uvi_enter(uvc_profile_engine_t* e, uint8_t idx, uint8_t level) {
    const uvc_profile_t* p = e->profile;
    uvc_cursor_t* c = &e->cursor;

    while (idx != UVC_NODE_NONE && p->nodes[idx].kind == UVC_NODE_LOOP) {
        if (level >= UVC_PROFILE_MAX_DEPTH) {
            return false;
        }
        c->path[level] = idx;
        c->remaining[level] = p->nodes[idx].u.loop.repeat_count;
        idx = p->nodes[idx].u.loop.first_child;
        level++;
    }
    if (idx == UVC_NODE_NONE) {
        return false;
    }

    c->path[level] = idx;
    c->remaining[level] = 0;
    c->depth = level;
    c->active = true;
    c->segment_elapsed_ms = 0;
    return true;
}

static bool uvi_advance(uvc_profile_engine_t* e) {
    const uvc_profile_t* p = e->profile;
    uvc_cursor_t* c = &e->cursor;
    uint8_t level = c->depth;

    for (;;) {
        uint8_t next = p->nodes[c->path[level]].next_sibling;
        if (next != UVC_NODE_NONE) {
            return uvi_enter(e, next, level);
        }
        if (level == 0) {
            return false;
        }

        level--;
        const uvc_loop_t* loop = &p->nodes[c->path[level]].u.loop;
        if (c->remaining[level] == UVC_REPEAT_INFINITE) {
            return uvi_enter(e, loop->first_child, (uint8_t)(level + 1));
        }
        if (c->remaining[level] > 1) {
            c->remaining[level]--;
            return uvi_enter(e, loop->first_child, (uint8_t)(level + 1));
        }
        /* Loop finished; continue after it at this level. */
    }
}

static bool uvi_select_next(uvc_profile_engine_t* e) {
    uvc_cursor_t* c = &e->cursor;

    c->active = false;
    if (!c->started) {
        c->started = true;
        return uvi_enter(e, e->profile->first, 0);
    }
    return uvi_advance(e);
}

static uvc_engine_result_t uvi_finish(uvc_profile_engine_t* e, float* requested) {
    e->cursor.active = false;
    e->cursor.complete = true;
    e->cursor.carry_ms = 0;
    e->intensity = 0.0f;
    *requested = 0.0f;
    return UVC_ENGINE_COMPLETE;
}

static const uvc_segment_t* uvi_active_segment(const uvc_profile_engine_t* e) {
    return &e->profile->nodes[e->cursor.path[e->cursor.depth]].u.segment;
}

float uvc_segment_intensity(const uvc_segment_t* seg, uint32_t elapsed_ms) {
    const float start = (float)seg->start_intensity;
    const float end = (float)seg->end_intensity;

    switch (seg->kind) {
        case UVC_SEGMENT_CONSTANT:
            return start;

        case UVC_SEGMENT_RAMP: {
            if (seg->duration_ms == 0 || elapsed_ms >= seg->duration_ms) {
                return end;
            }
            float frac = (float)elapsed_ms / (float)seg->duration_ms;
            return start + (end - start) * frac;
        }

        case UVC_SEGMENT_STEP:
            /* jump once at the midpoint: [0, d/2) start, [d/2, d] end */
            return ((uint64_t)elapsed_ms * 2U < (uint64_t)seg->duration_ms) ? start : end;

        case UVC_SEGMENT_PULSE: {
            uint32_t period = seg->on_ms + seg->off_ms;
            if (period == 0 || elapsed_ms >= uvc_segment_duration_ms(seg)) {
                return 0.0f;
            }
            return ((elapsed_ms % period) < seg->on_ms) ? start : 0.0f;
        }
    }
    return 0.0f;
}

void uvc_engine_start(uvc_profile_engine_t* e, const uvc_profile_t* profile) {
    memset(&e->cursor, 0, sizeof(e->cursor));
    e->profile = profile;
    e->intensity = 0.0f;
    e->total_ms = (profile != NULL) ? uvc_profile_total_ms(profile) : 0;
}

void uvc_engine_reset(uvc_profile_engine_t* e) {
    memset(&e->cursor, 0, sizeof(e->cursor));
    e->profile = NULL;
    e->intensity = 0.0f;
    e->total_ms = 0;
}

uvc_engine_result_t uvc_engine_tick(uvc_profile_engine_t* e, uint32_t delta_ms, float* requested) {
    uvc_cursor_t* c = &e->cursor;

    if (e->profile == NULL || c->complete) {
        return uvi_finish(e, requested);
    }
    if (!c->active && !uvi_select_next(e)) {
        return uvi_finish(e, requested);
    }

    uint32_t budget = delta_ms + c->carry_ms;
    uint32_t transitions = 0;
    c->carry_ms = 0;

    for (;;) {
        uint32_t duration = uvc_segment_duration_ms(uvi_active_segment(e));
        uint32_t left = duration - c->segment_elapsed_ms;

        if (budget < left) {
            c->segment_elapsed_ms += budget;
            c->run_elapsed_ms += budget;
            break;
        }

        c->segment_elapsed_ms = duration;
        c->run_elapsed_ms += left;
        budget -= left;

        if (!uvi_select_next(e)) {
            return uvi_finish(e, requested);
        }
        if (++transitions >= UVC_ENGINE_MAX_TRANSITIONS) {
            c->carry_ms = budget;
            UVC_LOGF("engine: %lu ms carried to next tick", (unsigned long)budget);
            break;
        }
    }

    e->intensity = uvc_segment_intensity(uvi_active_segment(e), c->segment_elapsed_ms);
    *requested = e->intensity;
    return UVC_ENGINE_RUNNING;
}

uint32_t uvc_engine_elapsed_ms(const uvc_profile_engine_t* e) {
    return e->cursor.run_elapsed_ms;
}

uint32_t uvc_engine_remaining_ms(const uvc_profile_engine_t* e) {
    if (e->total_ms == UVC_DURATION_UNBOUNDED) {
        return UVC_DURATION_UNBOUNDED;
    }
    if (e->cursor.complete || e->cursor.run_elapsed_ms >= e->total_ms) {
        return 0;
    }
    return e->total_ms - e->cursor.run_elapsed_ms;
}

uint8_t uvc_engine_active_node(const uvc_profile_engine_t* e) {
    return e->cursor.active ? e->cursor.path[e->cursor.depth] : UVC_NODE_NONE;
}

uint32_t uvc_engine_segment_elapsed_ms(const uvc_profile_engine_t* e) {
    return e->cursor.segment_elapsed_ms;
}

bool uvc_engine_is_complete(const uvc_profile_engine_t* e) {
    return e->cursor.complete;
}
