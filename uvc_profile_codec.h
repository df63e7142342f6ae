/**
 * @file uvc_profile_codec.h
 * @brief JSON encoding of curing profiles.
 * @details Layout:
 *          {"name":"P-01","manual":false,"nodes":[
 *            {"k":"ramp","s":0,"e":80,"d":5000,"on":0,"off":0,"n":0,"r":0,"p":-1}, ...]}
 *          Nodes are listed in arena order; "p" is the parent Loop index or -1
 *          at top level, "r" the Loop repeat count (0 = until stopped).
 */
#ifndef UVC_PROFILE_CODEC_H
#define UVC_PROFILE_CODEC_H

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>
#include "uvc_profile.h"

#ifdef __cplusplus
#include <ArduinoJson.h>

extern "C" {
#endif

typedef enum {
    UVC_CODEC_OK = 0,
    UVC_CODEC_NO_MEMORY,       /**< Output buffer or document too small. */
    UVC_CODEC_PARSE_ERROR,     /**< Not JSON. */
    UVC_CODEC_BAD_FIELD,       /**< Missing key or wrong type/range. */
    UVC_CODEC_TOO_MANY_NODES,
    UVC_CODEC_BAD_PARENT,      /**< Parent is not an earlier Loop. */
    UVC_CODEC_BAD_KIND
} uvc_codec_error_t;

/**
 * @brief Encode one profile.
 * @param out   destination, NUL-terminated on success
 * @param len   optional; receives the encoded length without the terminator
 */
uvc_codec_error_t uvc_profile_serialize(const uvc_profile_t* p, char* out, size_t cap, size_t* len);

/**
 * @brief Decode one profile. The result is structurally sound but not validated.
 */
uvc_codec_error_t uvc_profile_deserialize(const char* json, size_t len, uvc_profile_t* out);

const char* uvc_codec_error_name(uvc_codec_error_t err);

#ifdef __cplusplus
}

/* Object-level helpers shared with the profile store document. */
bool uvc_profile_to_json(const uvc_profile_t* p, JsonObject obj);
uvc_codec_error_t uvc_profile_from_json(JsonObjectConst obj, uvc_profile_t* out);
#endif

#endif /* UVC_PROFILE_CODEC_H */
