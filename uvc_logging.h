/**
 * @file uvc_logging.h
 * @brief Serial logging with file:line stamps.
 * @details Output goes through serial_printf(); %f is not supported, so callers
 *          log scaled integers (tenths of a percent, mV, ms).
 */
#ifndef UVC_LOGGING_H
#define UVC_LOGGING_H

#ifdef __cplusplus
extern "C" {
#endif

/** @brief Prepare the log sink (prints a banner). */
void uvc_log_init(void);

/** @brief Log a fixed message. */
void uvc_log(const char* file, int line, const char* msg);

/** @brief Log a printf-style message. */
void uvc_logf(const char* file, int line, const char* format, ...);

/** @brief Strip directories from a __FILE__ path. */
const char* uvc_get_filename(const char* path);

#ifdef __cplusplus
}
#endif

#define UVC_LOG(msg)        uvc_log(__FILE__, __LINE__, (msg))
#define UVC_LOGF(fmt, ...)  uvc_logf(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)

#endif /* UVC_LOGGING_H */
