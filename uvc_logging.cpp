/**
 * @file uvc_logging.cpp
 * @brief Serial log sink for the firmware build.
 */
#include "uvc_logging.h"
#include "api.h"
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

#define UVC_LOG_LINE_MAX 160

const char* uvc_get_filename(const char* path) {
    const char* slash = strrchr(path, '/');
    const char* bslash = strrchr(path, '\\');
    if (bslash != NULL && (slash == NULL || bslash > slash)) {
        slash = bslash;
    }
    return (slash != NULL) ? slash + 1 : path;
}

void uvc_log_init(void) {
    serial_printf("\r\n[%lu] uv curing chamber log start\r\n", (unsigned long)get_millis());
}

void uvc_log(const char* file, int line, const char* msg) {
    serial_printf("[%lu] %s:%d %s\r\n", (unsigned long)get_millis(), uvc_get_filename(file), line, msg);
}

void uvc_logf(const char* file, int line, const char* format, ...) {
    char buffer[UVC_LOG_LINE_MAX];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    uvc_log(file, line, buffer);
}
