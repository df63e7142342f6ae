/**
 * @file uvc_profile_codec.cpp
 * @brief ArduinoJson encoding/decoding of uvc_profile_t.
 */
#include "uvc_profile_codec.h"
#include "uvc_logging.h"
#include <string.h>

#define UVI_KIND_LOOP "loop"

static const char* uvi_node_kind(const uvc_node_t* n) {
    return (n->kind == UVC_NODE_LOOP) ? UVI_KIND_LOOP : uvc_segment_kind_name(n->u.segment.kind);
}

bool uvc_profile_to_json(const uvc_profile_t* p, JsonObject obj) {
    if (p == NULL || obj.isNull()) {
        return false;
    }
    obj["name"] = (const char*)p->name;
    obj["manual"] = p->manual_stop;
    JsonArray nodes = obj["nodes"].to<JsonArray>();

    for (uint8_t i = 0; i < p->node_count; i++) {
        const uvc_node_t* n = &p->nodes[i];
        JsonObject j = nodes.add<JsonObject>();
        if (j.isNull()) {
            return false;
        }
        const bool seg = (n->kind == UVC_NODE_SEGMENT);
        j["k"]   = uvi_node_kind(n);
        j["s"]   = seg ? n->u.segment.start_intensity : 0;
        j["e"]   = seg ? n->u.segment.end_intensity : 0;
        j["d"]   = seg ? n->u.segment.duration_ms : 0;
        j["on"]  = seg ? n->u.segment.on_ms : 0;
        j["off"] = seg ? n->u.segment.off_ms : 0;
        j["n"]   = seg ? n->u.segment.pulse_count : 0;
        j["r"]   = seg ? 0 : n->u.loop.repeat_count;
        j["p"]   = (n->parent == UVC_NODE_NONE) ? -1 : (int)n->parent;
    }
    return true;
}

/* Read an unsigned field that must be present and fit in max. */
static bool uvi_get_u32(JsonObjectConst j, const char* key, uint32_t max, uint32_t* out) {
    JsonVariantConst v = j[key];
    if (!v.is<uint32_t>()) {
        return false;
    }
    uint32_t value = v.as<uint32_t>();
    if (value > max) {
        return false;
    }
    *out = value;
    return true;
}

static uvc_codec_error_t uvi_read_segment(JsonObjectConst j, uvc_segment_kind_t kind, uvc_segment_t* s) {
    uint32_t start, end, dur, on, off, count;
    if (!uvi_get_u32(j, "s", 0xFFU, &start) ||
        !uvi_get_u32(j, "e", 0xFFU, &end) ||
        !uvi_get_u32(j, "d", 0xFFFFFFFFUL, &dur) ||
        !uvi_get_u32(j, "on", 0xFFFFFFFFUL, &on) ||
        !uvi_get_u32(j, "off", 0xFFFFFFFFUL, &off) ||
        !uvi_get_u32(j, "n", 0xFFFFU, &count)) {
        return UVC_CODEC_BAD_FIELD;
    }
    memset(s, 0, sizeof(*s));
    s->kind = kind;
    s->start_intensity = (uint8_t)start;
    s->end_intensity = (uint8_t)end;
    s->duration_ms = dur;
    s->on_ms = on;
    s->off_ms = off;
    s->pulse_count = (uint16_t)count;
    return UVC_CODEC_OK;
}

uvc_codec_error_t uvc_profile_from_json(JsonObjectConst obj, uvc_profile_t* out) {
    if (out == NULL || obj.isNull()) {
        return UVC_CODEC_BAD_FIELD;
    }
    if (!obj["name"].is<const char*>() || !obj["manual"].is<bool>() || !obj["nodes"].is<JsonArrayConst>()) {
        return UVC_CODEC_BAD_FIELD;
    }
    JsonArrayConst nodes = obj["nodes"].as<JsonArrayConst>();
    if (nodes.size() > UVC_PROFILE_MAX_NODES) {
        return UVC_CODEC_TOO_MANY_NODES;
    }

    uvc_profile_init(out, obj["name"].as<const char*>());
    out->manual_stop = obj["manual"].as<bool>();

    for (JsonVariantConst v : nodes) {
        if (!v.is<JsonObjectConst>()) {
            return UVC_CODEC_BAD_FIELD;
        }
        JsonObjectConst j = v.as<JsonObjectConst>();
        if (!j["k"].is<const char*>() || !j["p"].is<int>()) {
            return UVC_CODEC_BAD_FIELD;
        }

        /* Arena order puts every parent before its children. */
        int p = j["p"].as<int>();
        if (p < -1 || p >= (int)out->node_count) {
            return UVC_CODEC_BAD_PARENT;
        }
        uint8_t parent = (p < 0) ? UVC_NODE_NONE : (uint8_t)p;
        if (parent != UVC_NODE_NONE && out->nodes[parent].kind != UVC_NODE_LOOP) {
            return UVC_CODEC_BAD_PARENT;
        }

        const char* kind = j["k"].as<const char*>();
        uint8_t idx;
        if (strcmp(kind, UVI_KIND_LOOP) == 0) {
            uint32_t repeat;
            if (!uvi_get_u32(j, "r", 0xFFFFU, &repeat)) {
                return UVC_CODEC_BAD_FIELD;
            }
            idx = uvc_profile_add_loop(out, parent, (uint16_t)repeat);
        } else {
            uvc_segment_kind_t seg_kind;
            if (!uvc_segment_kind_from_name(kind, &seg_kind)) {
                return UVC_CODEC_BAD_KIND;
            }
            uvc_segment_t seg;
            uvc_codec_error_t err = uvi_read_segment(j, seg_kind, &seg);
            if (err != UVC_CODEC_OK) {
                return err;
            }
            idx = uvc_profile_add_segment(out, parent, &seg);
        }
        if (idx == UVC_NODE_NONE) {
            return UVC_CODEC_TOO_MANY_NODES;
        }
    }
    return UVC_CODEC_OK;
}

uvc_codec_error_t uvc_profile_serialize(const uvc_profile_t* p, char* out, size_t cap, size_t* len) {
    if (p == NULL || out == NULL || cap == 0) {
        return UVC_CODEC_BAD_FIELD;
    }
    JsonDocument doc;
    if (!uvc_profile_to_json(p, doc.to<JsonObject>()) || doc.overflowed()) {
        return UVC_CODEC_NO_MEMORY;
    }
    if (measureJson(doc) + 1 > cap) {
        return UVC_CODEC_NO_MEMORY;
    }
    size_t n = serializeJson(doc, out, cap);
    if (len != NULL) {
        *len = n;
    }
    return UVC_CODEC_OK;
}

uvc_codec_error_t uvc_profile_deserialize(const char* json, size_t len, uvc_profile_t* out) {
    if (json == NULL || out == NULL) {
        return UVC_CODEC_BAD_FIELD;
    }
    JsonDocument doc;
    DeserializationError derr = deserializeJson(doc, json, len);
    if (derr == DeserializationError::NoMemory) {
        return UVC_CODEC_NO_MEMORY;
    }
    if (derr) {
        UVC_LOGF("profile parse error: %s", derr.c_str());
        return UVC_CODEC_PARSE_ERROR;
    }
    if (!doc.is<JsonObjectConst>()) {
        return UVC_CODEC_BAD_FIELD;
    }
    return uvc_profile_from_json(doc.as<JsonObjectConst>(), out);
}

const char* uvc_codec_error_name(uvc_codec_error_t err) {
    switch (err) {
        case UVC_CODEC_OK:             return "ok";
        case UVC_CODEC_NO_MEMORY:      return "no memory";
        case UVC_CODEC_PARSE_ERROR:    return "parse error";
        case UVC_CODEC_BAD_FIELD:      return "bad field";
        case UVC_CODEC_TOO_MANY_NODES: return "too many nodes";
        case UVC_CODEC_BAD_PARENT:     return "bad parent";
        case UVC_CODEC_BAD_KIND:       return "bad kind";
    }
    return "unknown";
}
