#ifndef APP_INCLUDE_APP_EVENT_H_
#define APP_INCLUDE_APP_EVENT_H_

#include <app_event_manager.h> // Required for APP_EVENT_TYPE_DECLARE

#ifdef __cplusplus
extern "C"
{
#endif

typedef enum {
    APP_STATE_UNKNOWN,
    APP_STATE_INIT,
    APP_STATE_READY,
    APP_STATE_SHUTDOWN_PREPARING, // Stop sampling and tear the peripheral down
    APP_STATE_SHUTDOWN,
    APP_STATE_ERROR
} app_state_t;

struct app_state_event {
    struct app_event_header header;

    app_state_t state;
};

APP_EVENT_TYPE_DECLARE(app_state_event);

#ifdef __cplusplus
}
#endif

#endif // APP_INCLUDE_APP_EVENT_H_
