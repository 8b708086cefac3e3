#ifndef APP_INCLUDE_RSC_STATE_EVENT_H_
#define APP_INCLUDE_RSC_STATE_EVENT_H_

#include <app_event_manager.h>

#ifdef __cplusplus
extern "C"
{
#endif

enum rsc_state_t
{
    RSC_STATE_IDLE = 0,
    RSC_STATE_REGISTERED,
    RSC_STATE_ADVERTISING,
};

// Published on every RSC peripheral state change
struct rsc_state_event
{
    struct app_event_header header;

    enum rsc_state_t state;
};

APP_EVENT_TYPE_DECLARE(rsc_state_event);

#ifdef __cplusplus
}
#endif

#endif // APP_INCLUDE_RSC_STATE_EVENT_H_
