/**
 * @file uvc_board.h
 * @brief Binds the board API (api.h) to the controller's hardware handles.
 */
#ifndef UVC_BOARD_H
#define UVC_BOARD_H

#include "uvc_mode_control.h"
#include "uvc_profile_store.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Clock, UV PWM port and lid reader backed by api.h.
 */
void uvc_board_hw(uvc_hw_t* hw);

/**
 * @brief Program store file backed by api.h.
 */
void uvc_board_storage(uvc_storage_port_t* port);

/**
 * @brief Read LID_SENSE and classify it with the configured bands.
 */
uvc_lid_reading_t uvc_board_read_lid(void);

#ifdef __cplusplus
}
#endif

#endif /* UVC_BOARD_H */
