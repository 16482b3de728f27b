#ifndef _REQUESTMODULE_H_
#define _REQUESTMODULE_H_

#include "logger.h"
#include "requesthandler.h"

#include <pjsip.h>

namespace ivr {

// pjsip module in front of the user agent layer that hands incoming
// requests to a RequestHandler and sends its answers statelessly.
// Only one instance can be registered at a time.
class RequestModule
{
public:
    RequestModule(Logger &logger, RequestHandler &handler);
    ~RequestModule();

    RequestModule(const RequestModule &) = delete;
    RequestModule &operator=(const RequestModule &) = delete;

    // Throws SignalingError if the endpoint refuses the module.
    void registerModule(pjsip_endpoint *endpt);
    void unregisterModule();

    static SipRequest toSipRequest(const pjsip_rx_data *rdata);

private:
    static pj_bool_t onRxRequest(pjsip_rx_data *rdata);

    static RequestModule *instance_;

    Logger &logger_;
    RequestHandler &handler_;
    pjsip_endpoint *endpt_;
    pjsip_module module_;
};

} // namespace ivr

#endif // _REQUESTMODULE_H_
