/**
 * @file uvc_config.h
 * @brief Configuration parameters for the curing chamber controller
 * @details Centralized timing, interlock and profile limits.
 *          All parameters are runtime-configurable via setter functions;
 *          setters ignore values outside the accepted range.
 */
#ifndef UVC_CONFIG_H
#define UVC_CONFIG_H

#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Controller configuration structure with runtime-adjustable parameters
 */
typedef struct {
    uint32_t tick_period_ms;          /**< Control loop period (default: 20ms) */
    uint32_t debounce_ms;             /**< Lid reading must persist this long before the reported state changes (default: 50ms) */
    uint32_t sensor_fault_window_ms;  /**< Shorted/open lid line duration before latching a sensor fault (default: 200ms) */
    uint32_t periodic_log_ms;         /**< Interval between periodic status logs (default: 1000ms) */
    uint32_t blink_interval_ms;       /**< Indicator blink half-period (default: 500ms) */
    uint32_t max_total_duration_ms;   /**< Longest bounded profile accepted by validation (default: 24h) */

    /* Supervised lid line bands, strictly increasing */
    uint16_t lid_short_max_mv;        /**< At or below: line shorted to ground (default: 300mV) */
    uint16_t lid_closed_max_mv;       /**< At or below: lid closed (default: 1650mV) */
    uint16_t lid_open_max_mv;         /**< At or below: lid open; above: line disconnected (default: 3000mV) */

    bool     interlock_auto_resume;   /**< Resume an interlock-paused run when the lid closes again (default: true) */
} uvc_config_t;

/**
 * @brief Get pointer to current configuration (read-only access)
 * @return Pointer to const configuration structure
 */
const uvc_config_t* uvc_get_config(void);

/**
 * @brief Replace the whole configuration
 * @param config Pointer to new configuration structure
 * @return false (and nothing changed) if any field is out of range
 * @note Changes take effect on the next control tick
 */
bool uvc_set_config(const uvc_config_t* config);

/**
 * @brief Reset configuration to default values
 */
void uvc_reset_config_to_defaults(void);

/**
 * @brief Set control loop period (milliseconds, 10-50)
 */
void uvc_set_tick_period_ms(uint32_t period_ms);

/**
 * @brief Get control loop period (milliseconds)
 */
uint32_t uvc_get_tick_period_ms(void);

/**
 * @brief Set lid debounce window (milliseconds, 5-500)
 */
void uvc_set_debounce_ms(uint32_t debounce_ms);

/**
 * @brief Get lid debounce window (milliseconds)
 */
uint32_t uvc_get_debounce_ms(void);

/**
 * @brief Set lid sensor fault window (milliseconds, 20-5000)
 */
void uvc_set_sensor_fault_window_ms(uint32_t window_ms);

/**
 * @brief Get lid sensor fault window (milliseconds)
 */
uint32_t uvc_get_sensor_fault_window_ms(void);

/**
 * @brief Set periodic log interval (milliseconds, 100-60000)
 */
void uvc_set_periodic_log_ms(uint32_t interval_ms);

/**
 * @brief Get periodic log interval (milliseconds)
 */
uint32_t uvc_get_periodic_log_ms(void);

/**
 * @brief Set indicator blink half-period (milliseconds, 100-2000)
 */
void uvc_set_blink_interval_ms(uint32_t interval_ms);

/**
 * @brief Get indicator blink half-period (milliseconds)
 */
uint32_t uvc_get_blink_interval_ms(void);

/**
 * @brief Set the longest accepted bounded profile (milliseconds, 1s-72h)
 */
void uvc_set_max_total_duration_ms(uint32_t duration_ms);

/**
 * @brief Get the longest accepted bounded profile (milliseconds)
 */
uint32_t uvc_get_max_total_duration_ms(void);

/**
 * @brief Set the supervised lid line bands (millivolts)
 * @param short_max_mv  Upper bound of the shorted band
 * @param closed_max_mv Upper bound of the closed band
 * @param open_max_mv   Upper bound of the open band
 * @note Ignored unless short < closed < open
 */
void uvc_set_lid_bands_mv(uint16_t short_max_mv, uint16_t closed_max_mv, uint16_t open_max_mv);

/**
 * @brief Enable/disable automatic resume after the lid closes
 */
void uvc_set_interlock_auto_resume(bool enabled);

/**
 * @brief Get automatic resume setting
 */
bool uvc_get_interlock_auto_resume(void);

#ifdef __cplusplus
}
#endif

#endif /* UVC_CONFIG_H */
