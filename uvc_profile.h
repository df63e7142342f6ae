/**
 * @file uvc_profile.h
 * @brief Curing profile data model: segments, loops and validation.
 * @details A profile is an arena of nodes addressed by index. Each node is a
 *          Segment or a Loop; siblings are chained through next_sibling in
 *          arena order and a Loop points at its first child. Indices always
 *          grow from parent to child and from sibling to sibling, so the tree
 *          cannot contain cycles.
 */
#ifndef UVC_PROFILE_H
#define UVC_PROFILE_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#define UVC_PROFILE_MAX_NODES   32U
#define UVC_PROFILE_MAX_DEPTH   4U      /**< Maximum Loop nesting. */
#define UVC_PROFILE_NAME_LEN    16U     /**< Including terminator. */
#define UVC_NODE_NONE           0xFFU
#define UVC_REPEAT_INFINITE     0U      /**< repeat_count value for a manual-stop Loop. */
#define UVC_REPEAT_MAX          9999U
#define UVC_INTENSITY_MAX       100U
#define UVC_DURATION_UNBOUNDED  0xFFFFFFFFUL

/**
 * @brief Segment kinds; a closed set evaluated by uvc_segment_intensity().
 */
typedef enum {
    UVC_SEGMENT_CONSTANT = 0,  /**< start_intensity for the whole duration. */
    UVC_SEGMENT_RAMP,          /**< Linear from start to end intensity. */
    UVC_SEGMENT_STEP,          /**< start for the first half, end for the second. */
    UVC_SEGMENT_PULSE          /**< pulse_count x (on_ms at start_intensity, off_ms at 0). */
} uvc_segment_kind_t;

/**
 * @brief One atomic irradiance instruction.
 * @note end_intensity is used by Ramp and Step only; on_ms, off_ms and
 *       pulse_count by Pulse only. For Pulse, duration_ms must equal
 *       (on_ms + off_ms) * pulse_count.
 */
typedef struct {
    uvc_segment_kind_t kind;
    uint8_t  start_intensity;  /**< Percent, 0-100. */
    uint8_t  end_intensity;    /**< Percent, 0-100. */
    uint32_t duration_ms;
    uint32_t on_ms;
    uint32_t off_ms;
    uint16_t pulse_count;
} uvc_segment_t;

/**
 * @brief Repetition wrapper around its children.
 */
typedef struct {
    uint16_t repeat_count;     /**< >= 1, or UVC_REPEAT_INFINITE. */
    uint8_t  first_child;      /**< UVC_NODE_NONE while empty. */
} uvc_loop_t;

typedef enum {
    UVC_NODE_SEGMENT = 0,
    UVC_NODE_LOOP
} uvc_node_kind_t;

typedef struct {
    uvc_node_kind_t kind;
    uint8_t parent;            /**< Enclosing Loop, UVC_NODE_NONE at top level. */
    uint8_t next_sibling;      /**< UVC_NODE_NONE for the last entry. */
    union {
        uvc_segment_t segment;
        uvc_loop_t    loop;
    } u;
} uvc_node_t;

/**
 * @brief Root of one curing run; read-only while executing.
 */
typedef struct {
    char       name[UVC_PROFILE_NAME_LEN];
    bool       manual_stop;    /**< Runs until Stop; allows an infinite Loop in Custom mode. */
    uint8_t    node_count;
    uint8_t    first;          /**< First top-level node. */
    uvc_node_t nodes[UVC_PROFILE_MAX_NODES];
} uvc_profile_t;

/**
 * @brief Reasons a profile is rejected.
 */
typedef enum {
    UVC_VALID_OK = 0,
    UVC_VALID_EMPTY_PROFILE,
    UVC_VALID_MALFORMED_TREE,
    UVC_VALID_EMPTY_LOOP,
    UVC_VALID_NON_POSITIVE_DURATION,
    UVC_VALID_INTENSITY_OUT_OF_RANGE,
    UVC_VALID_PULSE_INVALID,
    UVC_VALID_INVALID_REPEAT,
    UVC_VALID_DEPTH_EXCEEDED,
    UVC_VALID_UNBOUNDED_DURATION,
    UVC_VALID_DURATION_TOO_LONG
} uvc_validation_error_t;

/**
 * @brief Time units offered when entering a Standard run.
 */
typedef enum {
    UVC_TIME_UNIT_MIN_SEC = 0, /**< value in seconds, 1-3600 */
    UVC_TIME_UNIT_HR_MIN,      /**< value in minutes, 1-1440 */
    UVC_TIME_UNIT_SEC_MS       /**< value in milliseconds, 100-60000 */
} uvc_time_unit_t;

/* Segment constructors */
uvc_segment_t uvc_segment_constant(uint8_t intensity, uint32_t duration_ms);
uvc_segment_t uvc_segment_ramp(uint8_t start_intensity, uint8_t end_intensity, uint32_t duration_ms);
uvc_segment_t uvc_segment_step(uint8_t start_intensity, uint8_t end_intensity, uint32_t duration_ms);
uvc_segment_t uvc_segment_pulse(uint8_t intensity, uint32_t on_ms, uint32_t off_ms, uint16_t pulse_count);

/**
 * @brief Active window of a segment; derived from the pulse train for Pulse.
 * @return UVC_DURATION_UNBOUNDED if the pulse train overflows 32 bits.
 */
uint32_t uvc_segment_duration_ms(const uvc_segment_t* seg);

/**
 * @brief Empty profile with the given name (truncated to fit).
 */
void uvc_profile_init(uvc_profile_t* p, const char* name);

/**
 * @brief Append a segment as the last child of @p parent (UVC_NODE_NONE for top level).
 * @return New node index, or UVC_NODE_NONE if the arena is full or parent is not a Loop.
 */
uint8_t uvc_profile_add_segment(uvc_profile_t* p, uint8_t parent, const uvc_segment_t* seg);

/**
 * @brief Append an empty Loop as the last child of @p parent.
 * @return New node index, or UVC_NODE_NONE.
 */
uint8_t uvc_profile_add_loop(uvc_profile_t* p, uint8_t parent, uint16_t repeat_count);

/**
 * @brief Build the single Constant segment run used by Standard mode.
 */
bool uvc_profile_make_standard(uvc_profile_t* p, uint32_t duration_ms, uint8_t intensity);

/**
 * @brief Convert a Standard-mode time entry to milliseconds.
 * @return false if value is outside the unit's range.
 */
bool uvc_time_unit_to_ms(uvc_time_unit_t unit, uint32_t value, uint32_t* out_ms);

/**
 * @brief Declared run length: sum of segment windows times enclosing repeats.
 * @return UVC_DURATION_UNBOUNDED if an infinite Loop is present; saturates
 *         to UVC_DURATION_UNBOUNDED - 1 otherwise.
 */
uint32_t uvc_profile_total_ms(const uvc_profile_t* p);

/**
 * @brief Check a profile before it may run.
 * @param allow_unbounded  true only for a manual-stop profile in Custom mode
 * @param max_total_ms     longest accepted bounded run
 * @param bad_node         optional; receives the offending node or UVC_NODE_NONE
 */
uvc_validation_error_t uvc_profile_validate(const uvc_profile_t* p, bool allow_unbounded,
                                            uint32_t max_total_ms, uint8_t* bad_node);

/**
 * @brief Structural and field-wise equality (names, flags, every node).
 */
bool uvc_profile_equal(const uvc_profile_t* a, const uvc_profile_t* b);

const char* uvc_validation_error_name(uvc_validation_error_t err);
const char* uvc_segment_kind_name(uvc_segment_kind_t kind);
bool uvc_segment_kind_from_name(const char* name, uvc_segment_kind_t* out);

#ifdef __cplusplus
}
#endif

#endif /* UVC_PROFILE_H */
