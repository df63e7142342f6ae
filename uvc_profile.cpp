/**
 * @file uvc_profile.cpp
 * @brief Profile arena construction, run-length computation and validation.
 */
#include "uvc_profile.h"
#include <string.h>

#define UVI_TOTAL_CAP 0xFFFFFFFFFFFFULL

static uint64_t uvi_sat_add(uint64_t a, uint64_t b) {
    return (a > UVI_TOTAL_CAP - b) ? UVI_TOTAL_CAP : a + b;
}

static uint64_t uvi_sat_mul(uint64_t a, uint64_t b) {
    if (a == 0 || b == 0) return 0;
    return (a > UVI_TOTAL_CAP / b) ? UVI_TOTAL_CAP : a * b;
}

uvc_segment_t uvc_segment_constant(uint8_t intensity, uint32_t duration_ms) {
    uvc_segment_t s;
    memset(&s, 0, sizeof(s));
    s.kind = UVC_SEGMENT_CONSTANT;
    s.start_intensity = intensity;
    s.duration_ms = duration_ms;
    return s;
}

uvc_segment_t uvc_segment_ramp(uint8_t start_intensity, uint8_t end_intensity, uint32_t duration_ms) {
    uvc_segment_t s;
    memset(&s, 0, sizeof(s));
    s.kind = UVC_SEGMENT_RAMP;
    s.start_intensity = start_intensity;
    s.end_intensity = end_intensity;
    s.duration_ms = duration_ms;
    return s;
}

uvc_segment_t uvc_segment_step(uint8_t start_intensity, uint8_t end_intensity, uint32_t duration_ms) {
    uvc_segment_t s = uvc_segment_ramp(start_intensity, end_intensity, duration_ms);
    s.kind = UVC_SEGMENT_STEP;
    return s;
}

uvc_segment_t uvc_segment_pulse(uint8_t intensity, uint32_t on_ms, uint32_t off_ms, uint16_t pulse_count) {
    uvc_segment_t s;
    memset(&s, 0, sizeof(s));
    s.kind = UVC_SEGMENT_PULSE;
    s.start_intensity = intensity;
    s.on_ms = on_ms;
    s.off_ms = off_ms;
    s.pulse_count = pulse_count;
    s.duration_ms = uvc_segment_duration_ms(&s);
    return s;
}

uint32_t uvc_segment_duration_ms(const uvc_segment_t* seg) {
    if (seg->kind != UVC_SEGMENT_PULSE) {
        return seg->duration_ms;
    }
    uint64_t period = (uint64_t)seg->on_ms + (uint64_t)seg->off_ms;
    uint64_t total = period * (uint64_t)seg->pulse_count;
    return (total >= UVC_DURATION_UNBOUNDED) ? UVC_DURATION_UNBOUNDED : (uint32_t)total;
}

void uvc_profile_init(uvc_profile_t* p, const char* name) {
    memset(p, 0, sizeof(*p));
    if (name != NULL) {
        strncpy(p->name, name, UVC_PROFILE_NAME_LEN - 1);
    }
    p->manual_stop = false;
    p->node_count = 0;
    p->first = UVC_NODE_NONE;
}

/* Link a freshly written node behind the last child of its parent. */
static uint8_t uvi_append(uvc_profile_t* p, uint8_t parent, const uvc_node_t* node) {
    if (p->node_count >= UVC_PROFILE_MAX_NODES) {
        return UVC_NODE_NONE;
    }
    if (parent != UVC_NODE_NONE && (parent >= p->node_count || p->nodes[parent].kind != UVC_NODE_LOOP)) {
        return UVC_NODE_NONE;
    }

    uint8_t idx = p->node_count++;
    p->nodes[idx] = *node;
    p->nodes[idx].parent = parent;
    p->nodes[idx].next_sibling = UVC_NODE_NONE;

    uint8_t* head = (parent == UVC_NODE_NONE) ? &p->first : &p->nodes[parent].u.loop.first_child;
    if (*head == UVC_NODE_NONE) {
        *head = idx;
    } else {
        uint8_t cur = *head;
        while (p->nodes[cur].next_sibling != UVC_NODE_NONE) {
            cur = p->nodes[cur].next_sibling;
        }
        p->nodes[cur].next_sibling = idx;
    }
    return idx;
}

uint8_t uvc_profile_add_segment(uvc_profile_t* p, uint8_t parent, const uvc_segment_t* seg) {
    uvc_node_t node;
    memset(&node, 0, sizeof(node));
    node.kind = UVC_NODE_SEGMENT;
    node.u.segment = *seg;
    return uvi_append(p, parent, &node);
}

uint8_t uvc_profile_add_loop(uvc_profile_t* p, uint8_t parent, uint16_t repeat_count) {
    uvc_node_t node;
    memset(&node, 0, sizeof(node));
    node.kind = UVC_NODE_LOOP;
    node.u.loop.repeat_count = repeat_count;
    node.u.loop.first_child = UVC_NODE_NONE;
    return uvi_append(p, parent, &node);
}

bool uvc_profile_make_standard(uvc_profile_t* p, uint32_t duration_ms, uint8_t intensity) {
    uvc_profile_init(p, "Standard");
    uvc_segment_t seg = uvc_segment_constant(intensity, duration_ms);
    return uvc_profile_add_segment(p, UVC_NODE_NONE, &seg) != UVC_NODE_NONE;
}

bool uvc_time_unit_to_ms(uvc_time_unit_t unit, uint32_t value, uint32_t* out_ms) {
    switch (unit) {
        case UVC_TIME_UNIT_MIN_SEC:
            if (value < 1 || value > 3600) return false;
            *out_ms = value * 1000UL;
            return true;
        case UVC_TIME_UNIT_HR_MIN:
            if (value < 1 || value > 1440) return false;
            *out_ms = value * 60UL * 1000UL;
            return true;
        case UVC_TIME_UNIT_SEC_MS:
            if (value < 100 || value > 60000) return false;
            *out_ms = value;
            return true;
    }
    return false;
}

static uint64_t uvi_chain_total(const uvc_profile_t* p, uint8_t idx, bool* unbounded) {
    uint64_t total = 0;
    for (; idx != UVC_NODE_NONE; idx = p->nodes[idx].next_sibling) {
        const uvc_node_t* n = &p->nodes[idx];
        if (n->kind == UVC_NODE_SEGMENT) {
            total = uvi_sat_add(total, uvc_segment_duration_ms(&n->u.segment));
        } else {
            uint64_t body = uvi_chain_total(p, n->u.loop.first_child, unbounded);
            if (n->u.loop.repeat_count == UVC_REPEAT_INFINITE) {
                *unbounded = true;
            }
            total = uvi_sat_add(total, uvi_sat_mul(body, n->u.loop.repeat_count));
        }
    }
    return total;
}

uint32_t uvc_profile_total_ms(const uvc_profile_t* p) {
    if (p->node_count == 0 || p->first == UVC_NODE_NONE) {
        return 0;
    }
    bool unbounded = false;
    uint64_t total = uvi_chain_total(p, p->first, &unbounded);
    if (unbounded) {
        return UVC_DURATION_UNBOUNDED;
    }
    return (total >= UVC_DURATION_UNBOUNDED) ? UVC_DURATION_UNBOUNDED - 1UL : (uint32_t)total;
}

/* Visit every node reachable from idx; false if a node is reached twice. */
static bool uvi_mark_chain(const uvc_profile_t* p, uint8_t idx, bool* seen) {
    for (; idx != UVC_NODE_NONE; idx = p->nodes[idx].next_sibling) {
        if (seen[idx]) return false;
        seen[idx] = true;
        if (p->nodes[idx].kind == UVC_NODE_LOOP &&
            !uvi_mark_chain(p, p->nodes[idx].u.loop.first_child, seen)) {
            return false;
        }
    }
    return true;
}

static bool uvi_structure_ok(const uvc_profile_t* p, uint8_t* bad_node) {
    const uint8_t count = p->node_count;

    if (p->first >= count || p->nodes[p->first].parent != UVC_NODE_NONE) {
        *bad_node = p->first;
        return false;
    }

    for (uint8_t i = 0; i < count; i++) {
        const uvc_node_t* n = &p->nodes[i];
        *bad_node = i;
        if (n->kind != UVC_NODE_SEGMENT && n->kind != UVC_NODE_LOOP) return false;
        if (n->parent != UVC_NODE_NONE &&
            (n->parent >= i || p->nodes[n->parent].kind != UVC_NODE_LOOP)) return false;
        if (n->next_sibling != UVC_NODE_NONE &&
            (n->next_sibling <= i || n->next_sibling >= count ||
             p->nodes[n->next_sibling].parent != n->parent)) return false;
        if (n->kind == UVC_NODE_LOOP) {
            uint8_t fc = n->u.loop.first_child;
            if (fc != UVC_NODE_NONE && (fc <= i || fc >= count || p->nodes[fc].parent != i)) return false;
        } else if (n->u.segment.kind > UVC_SEGMENT_PULSE) {
            return false;
        }
    }

    bool seen[UVC_PROFILE_MAX_NODES];
    memset(seen, 0, sizeof(seen));
    if (!uvi_mark_chain(p, p->first, seen)) {
        *bad_node = UVC_NODE_NONE;
        return false;
    }
    for (uint8_t i = 0; i < count; i++) {
        if (!seen[i]) {
            *bad_node = i;
            return false;
        }
    }
    *bad_node = UVC_NODE_NONE;
    return true;
}

static uvc_validation_error_t uvi_check_segment(const uvc_segment_t* s) {
    if (s->start_intensity > UVC_INTENSITY_MAX) return UVC_VALID_INTENSITY_OUT_OF_RANGE;

    switch (s->kind) {
        case UVC_SEGMENT_RAMP:
        case UVC_SEGMENT_STEP:
            if (s->end_intensity > UVC_INTENSITY_MAX) return UVC_VALID_INTENSITY_OUT_OF_RANGE;
            if (s->duration_ms == 0) return UVC_VALID_NON_POSITIVE_DURATION;
            break;
        case UVC_SEGMENT_CONSTANT:
            if (s->duration_ms == 0) return UVC_VALID_NON_POSITIVE_DURATION;
            break;
        case UVC_SEGMENT_PULSE:
            if (s->pulse_count == 0 || s->duration_ms == 0) return UVC_VALID_NON_POSITIVE_DURATION;
            if (s->on_ms == 0) return UVC_VALID_PULSE_INVALID;
            if (s->duration_ms != uvc_segment_duration_ms(s)) return UVC_VALID_PULSE_INVALID;
            break;
    }
    return UVC_VALID_OK;
}

uvc_validation_error_t uvc_profile_validate(const uvc_profile_t* p, bool allow_unbounded,
                                            uint32_t max_total_ms, uint8_t* bad_node) {
    uint8_t bad = UVC_NODE_NONE;
    uvc_validation_error_t err = UVC_VALID_OK;

    if (p->node_count == 0 || p->node_count > UVC_PROFILE_MAX_NODES || p->first == UVC_NODE_NONE) {
        err = UVC_VALID_EMPTY_PROFILE;
    } else if (!uvi_structure_ok(p, &bad)) {
        err = UVC_VALID_MALFORMED_TREE;
    } else {
        uint8_t depth[UVC_PROFILE_MAX_NODES];
        for (uint8_t i = 0; i < p->node_count && err == UVC_VALID_OK; i++) {
            const uvc_node_t* n = &p->nodes[i];
            depth[i] = (n->parent == UVC_NODE_NONE) ? 0 : (uint8_t)(depth[n->parent] + 1);
            bad = i;

            if (n->kind == UVC_NODE_LOOP) {
                if (depth[i] + 1U > UVC_PROFILE_MAX_DEPTH) {
                    err = UVC_VALID_DEPTH_EXCEEDED;
                } else if (n->u.loop.first_child == UVC_NODE_NONE) {
                    err = UVC_VALID_EMPTY_LOOP;
                } else if (n->u.loop.repeat_count > UVC_REPEAT_MAX) {
                    err = UVC_VALID_INVALID_REPEAT;
                } else if (n->u.loop.repeat_count == UVC_REPEAT_INFINITE && !allow_unbounded) {
                    err = UVC_VALID_UNBOUNDED_DURATION;
                }
            } else {
                err = uvi_check_segment(&n->u.segment);
            }
        }

        if (err == UVC_VALID_OK) {
            bad = UVC_NODE_NONE;
            uint32_t total = uvc_profile_total_ms(p);
            if (total != UVC_DURATION_UNBOUNDED && total > max_total_ms) {
                err = UVC_VALID_DURATION_TOO_LONG;
            }
        }
    }

    if (bad_node != NULL) {
        *bad_node = (err == UVC_VALID_OK) ? UVC_NODE_NONE : bad;
    }
    return err;
}

static bool uvi_segment_equal(const uvc_segment_t* a, const uvc_segment_t* b) {
    return a->kind == b->kind &&
           a->start_intensity == b->start_intensity &&
           a->end_intensity == b->end_intensity &&
           a->duration_ms == b->duration_ms &&
           a->on_ms == b->on_ms &&
           a->off_ms == b->off_ms &&
           a->pulse_count == b->pulse_count;
}

bool uvc_profile_equal(const uvc_profile_t* a, const uvc_profile_t* b) {
    if (strncmp(a->name, b->name, UVC_PROFILE_NAME_LEN) != 0 ||
        a->manual_stop != b->manual_stop ||
        a->node_count != b->node_count ||
        a->first != b->first) {
        return false;
    }
    for (uint8_t i = 0; i < a->node_count; i++) {
        const uvc_node_t* na = &a->nodes[i];
        const uvc_node_t* nb = &b->nodes[i];
        if (na->kind != nb->kind || na->parent != nb->parent || na->next_sibling != nb->next_sibling) {
            return false;
        }
        if (na->kind == UVC_NODE_LOOP) {
            if (na->u.loop.repeat_count != nb->u.loop.repeat_count ||
                na->u.loop.first_child != nb->u.loop.first_child) {
                return false;
            }
        } else if (!uvi_segment_equal(&na->u.segment, &nb->u.segment)) {
            return false;
        }
    }
    return true;
}

const char* uvc_validation_error_name(uvc_validation_error_t err) {
    switch (err) {
        case UVC_VALID_OK:                     return "ok";
        case UVC_VALID_EMPTY_PROFILE:          return "empty profile";
        case UVC_VALID_MALFORMED_TREE:         return "malformed tree";
        case UVC_VALID_EMPTY_LOOP:             return "empty loop";
        case UVC_VALID_NON_POSITIVE_DURATION:  return "non-positive duration";
        case UVC_VALID_INTENSITY_OUT_OF_RANGE: return "intensity out of range";
        case UVC_VALID_PULSE_INVALID:          return "invalid pulse train";
        case UVC_VALID_INVALID_REPEAT:         return "invalid repeat count";
        case UVC_VALID_DEPTH_EXCEEDED:         return "loop depth exceeded";
        case UVC_VALID_UNBOUNDED_DURATION:     return "unbounded duration";
        case UVC_VALID_DURATION_TOO_LONG:      return "duration too long";
    }
    return "unknown";
}

static const char* const uvi_kind_names[] = { "constant", "ramp", "step", "pulse" };

const char* uvc_segment_kind_name(uvc_segment_kind_t kind) {
    return (kind <= UVC_SEGMENT_PULSE) ? uvi_kind_names[kind] : "unknown";
}

bool uvc_segment_kind_from_name(const char* name, uvc_segment_kind_t* out) {
    if (name == NULL) return false;
    for (uint8_t i = 0; i <= (uint8_t)UVC_SEGMENT_PULSE; i++) {
        if (strcmp(name, uvi_kind_names[i]) == 0) {
            *out = (uvc_segment_kind_t)i;
            return true;
        }
    }
    return false;
}
