/**
 * @file uvc_profile_store.cpp
 * @brief Profile store backed by a single JSON file.
 */
#include "uvc_profile_store.h"
#include "uvc_profile_codec.h"
#include "uvc_config.h"
#include "uvc_logging.h"
#include <stdio.h>
#include <string.h>

/* 8 profiles x 32 nodes at worst-case field widths */
#define UVC_STORE_IO_BUFFER 28672U
#define UVC_STORE_NAME_MAX  99U

static char uvi_io_buffer[UVC_STORE_IO_BUFFER];

void uvc_store_init(uvc_profile_store_t* store, const uvc_storage_port_t* port) {
    memset(store, 0, sizeof(*store));
    if (port != NULL) {
        store->port = *port;
    }
}

int uvc_store_find(const uvc_profile_store_t* store, const char* name) {
    if (name == NULL) return -1;
    for (uint8_t i = 0; i < store->count; i++) {
        if (strncmp(store->profiles[i].name, name, UVC_PROFILE_NAME_LEN) == 0) {
            return i;
        }
    }
    return -1;
}

const uvc_profile_t* uvc_store_at(const uvc_profile_store_t* store, uint8_t index) {
    return (index < store->count) ? &store->profiles[index] : NULL;
}

uint8_t uvc_store_count(const uvc_profile_store_t* store) {
    return store->count;
}

uvc_store_result_t uvc_store_load(uvc_profile_store_t* store) {
    store->count = 0;
    if (store->port.read == NULL) {
        return UVC_STORE_IO_ERROR;
    }

    int n = store->port.read(uvi_io_buffer, sizeof(uvi_io_buffer));
    if (n < 0) {
        UVC_LOG("store read failed");
        return UVC_STORE_IO_ERROR;
    }
    if (n == 0) {
        UVC_LOG("store empty");
        return UVC_STORE_OK;
    }
    if ((size_t)n >= sizeof(uvi_io_buffer)) {
        UVC_LOGF("store file too large (%d bytes)", n);
        return UVC_STORE_CORRUPT;
    }

    JsonDocument doc;
    DeserializationError derr = deserializeJson(doc, uvi_io_buffer, (size_t)n);
    if (derr) {
        UVC_LOGF("store parse error: %s", derr.c_str());
        return UVC_STORE_CORRUPT;
    }
    if (!doc.is<JsonArrayConst>()) {
        UVC_LOG("store root is not an array");
        return UVC_STORE_CORRUPT;
    }

    uvc_store_result_t result = UVC_STORE_OK;
    uint8_t index = 0;
    for (JsonVariantConst v : doc.as<JsonArrayConst>()) {
        if (store->count >= UVC_STORE_MAX_PROFILES) {
            UVC_LOGF("store entry %d dropped: store full", (int)index);
            result = UVC_STORE_CORRUPT;
            break;
        }
        uvc_profile_t* slot = &store->profiles[store->count];

        uvc_codec_error_t err = v.is<JsonObjectConst>()
            ? uvc_profile_from_json(v.as<JsonObjectConst>(), slot)
            : UVC_CODEC_BAD_FIELD;
        if (err != UVC_CODEC_OK) {
            UVC_LOGF("store entry %d skipped: %s", (int)index, uvc_codec_error_name(err));
            result = UVC_STORE_CORRUPT;
        } else if (slot->name[0] == '\0' || uvc_store_find(store, slot->name) >= 0) {
            UVC_LOGF("store entry %d skipped: bad or duplicate name", (int)index);
            result = UVC_STORE_CORRUPT;
        } else {
            store->count++;
        }
        index++;
    }

    UVC_LOGF("store loaded %d profile(s)", (int)store->count);
    return result;
}

/* Write the whole in-memory set back to the file. */
static bool uvi_store_persist(const uvc_profile_store_t* store) {
    if (store->port.write == NULL) {
        return false;
    }

    JsonDocument doc;
    JsonArray arr = doc.to<JsonArray>();
    for (uint8_t i = 0; i < store->count; i++) {
        if (!uvc_profile_to_json(&store->profiles[i], arr.add<JsonObject>())) {
            return false;
        }
    }
    if (doc.overflowed() || measureJson(doc) + 1 > sizeof(uvi_io_buffer)) {
        UVC_LOG("store document too large");
        return false;
    }

    size_t len = serializeJson(doc, uvi_io_buffer, sizeof(uvi_io_buffer));
    if (!store->port.write(uvi_io_buffer, len)) {
        UVC_LOG("store write failed");
        return false;
    }
    return true;
}

uvc_store_result_t uvc_store_save(uvc_profile_store_t* store, const uvc_profile_t* profile) {
    if (profile == NULL || profile->name[0] == '\0') {
        return UVC_STORE_NO_NAME;
    }

    uint8_t node;
    uvc_validation_error_t verr = uvc_profile_validate(profile, profile->manual_stop,
                                                       uvc_get_config()->max_total_duration_ms, &node);
    if (verr != UVC_VALID_OK) {
        UVC_LOGF("store save '%s' rejected: %s at node %d", profile->name,
                 uvc_validation_error_name(verr), node == UVC_NODE_NONE ? -1 : (int)node);
        return UVC_STORE_INVALID;
    }

    int idx = uvc_store_find(store, profile->name);
    const bool replaced = (idx >= 0);
    uvc_profile_t previous;
    if (replaced) {
        previous = store->profiles[idx];
    } else {
        if (store->count >= UVC_STORE_MAX_PROFILES) {
            UVC_LOGF("store save '%s' rejected: full", profile->name);
            return UVC_STORE_FULL;
        }
        idx = store->count++;
    }
    store->profiles[idx] = *profile;
    store->profiles[idx].name[UVC_PROFILE_NAME_LEN - 1] = '\0';

    if (!uvi_store_persist(store)) {
        if (replaced) {
            store->profiles[idx] = previous;
        } else {
            store->count--;
        }
        return UVC_STORE_IO_ERROR;
    }
    UVC_LOGF("store saved '%s' (%d/%d)", profile->name, (int)store->count, (int)UVC_STORE_MAX_PROFILES);
    return UVC_STORE_OK;
}

uvc_store_result_t uvc_store_remove(uvc_profile_store_t* store, const char* name) {
    int idx = uvc_store_find(store, name);
    if (idx < 0) {
        return UVC_STORE_NOT_FOUND;
    }

    uvc_profile_t removed = store->profiles[idx];
    for (uint8_t i = (uint8_t)idx; i + 1U < store->count; i++) {
        store->profiles[i] = store->profiles[i + 1U];
    }
    store->count--;

    if (!uvi_store_persist(store)) {
        for (uint8_t i = store->count; i > (uint8_t)idx; i--) {
            store->profiles[i] = store->profiles[i - 1U];
        }
        store->profiles[idx] = removed;
        store->count++;
        return UVC_STORE_IO_ERROR;
    }
    UVC_LOGF("store removed '%s'", removed.name);
    return UVC_STORE_OK;
}

bool uvc_store_next_free_name(const uvc_profile_store_t* store, char* out, size_t cap) {
    char name[UVC_PROFILE_NAME_LEN];
    if (out == NULL || cap < 5U) {
        return false;
    }
    for (unsigned n = 1; n <= UVC_STORE_NAME_MAX; n++) {
        snprintf(name, sizeof(name), "P-%02u", n);
        if (uvc_store_find(store, name) < 0) {
            strncpy(out, name, cap - 1U);
            out[cap - 1U] = '\0';
            return true;
        }
    }
    return false;
}

const char* uvc_store_result_name(uvc_store_result_t result) {
    switch (result) {
        case UVC_STORE_OK:        return "ok";
        case UVC_STORE_FULL:      return "full";
        case UVC_STORE_NOT_FOUND: return "not found";
        case UVC_STORE_INVALID:   return "invalid";
        case UVC_STORE_IO_ERROR:  return "io error";
        case UVC_STORE_CORRUPT:   return "corrupt";
        case UVC_STORE_NO_NAME:   return "no name";
    }
    return "unknown";
}
