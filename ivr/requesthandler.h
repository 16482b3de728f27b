#ifndef _REQUESTHANDLER_H_
#define _REQUESTHANDLER_H_

#include "logger.h"
#include "useragent.h"

#include <string>

namespace ivr {

const int SIP_OK = 200;
const int SIP_METHOD_NOT_ALLOWED = 405;
const int SIP_CALL_LEG_DOES_NOT_EXIST = 481;

class ResponseSender
{
public:
    virtual ~ResponseSender() {}

    virtual void
    sendResponse(const SipRequest &request, int status_code, const std::string &reason) = 0;
};

// Answers the housekeeping requests that reach us outside of a dialog.
// INVITEs and in-dialog requests are left to the call handling.
class RequestHandler
{
public:
    explicit RequestHandler(Logger &logger);

    // Returns true when a response was sent for the request.
    bool handle(const SipRequest &request, ResponseSender &sender);

    static bool isInDialog(const SipRequest &request);

private:
    void respond(const SipRequest &request, ResponseSender &sender, int status_code, const std::string &reason);

    Logger &logger_;
};

} // namespace ivr

#endif // _REQUESTHANDLER_H_
