/**
 * @file uvc_profile_store.h
 * @brief Named Custom-mode profiles persisted as one JSON array.
 */
#ifndef UVC_PROFILE_STORE_H
#define UVC_PROFILE_STORE_H

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>
#include "uvc_profile.h"

#ifdef __cplusplus
extern "C" {
#endif

#define UVC_STORE_MAX_PROFILES 8U

/**
 * @brief Backing file access.
 * @note read returns the byte count, 0 if the file does not exist, -1 on error.
 */
typedef struct {
    int  (*read)(char* buffer, size_t capacity);
    bool (*write)(const char* data, size_t length);
} uvc_storage_port_t;

typedef enum {
    UVC_STORE_OK = 0,
    UVC_STORE_FULL,
    UVC_STORE_NOT_FOUND,
    UVC_STORE_INVALID,     /**< Profile failed validation. */
    UVC_STORE_IO_ERROR,
    UVC_STORE_CORRUPT,     /**< File unreadable as profiles; good entries were kept. */
    UVC_STORE_NO_NAME
} uvc_store_result_t;

typedef struct {
    uvc_storage_port_t port;
    uvc_profile_t      profiles[UVC_STORE_MAX_PROFILES];
    uint8_t            count;
} uvc_profile_store_t;

void uvc_store_init(uvc_profile_store_t* store, const uvc_storage_port_t* port);

/**
 * @brief Replace the in-memory set with the file contents.
 * @return UVC_STORE_OK for a good or missing file.
 */
uvc_store_result_t uvc_store_load(uvc_profile_store_t* store);

/**
 * @brief Validate, then replace the profile with the same name or append it,
 *        and write the file. Memory is rolled back if the write fails.
 */
uvc_store_result_t uvc_store_save(uvc_profile_store_t* store, const uvc_profile_t* profile);

uvc_store_result_t uvc_store_remove(uvc_profile_store_t* store, const char* name);

/** @return index of the named profile, or -1. */
int uvc_store_find(const uvc_profile_store_t* store, const char* name);

/** @return NULL if index is out of range. */
const uvc_profile_t* uvc_store_at(const uvc_profile_store_t* store, uint8_t index);

uint8_t uvc_store_count(const uvc_profile_store_t* store);

/**
 * @brief First unused name of the form "P-01".."P-99".
 * @return false if all names are taken or cap is too small.
 */
bool uvc_store_next_free_name(const uvc_profile_store_t* store, char* out, size_t cap);

const char* uvc_store_result_name(uvc_store_result_t result);

#ifdef __cplusplus
}
#endif

#endif /* UVC_PROFILE_STORE_H */
