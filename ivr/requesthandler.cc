#include "requesthandler.h"

ivr::RequestHandler::RequestHandler(Logger &logger) :
    logger_(logger)
{
}

bool ivr::RequestHandler::handle(const SipRequest &request, ResponseSender &sender)
{
    if (isInDialog(request)) {
        return false;
    }

    const std::string &method = request.method;
    if (method == "BYE") {
        respond(request, sender, SIP_CALL_LEG_DOES_NOT_EXIST, "Call Leg/Transaction Does Not Exist");
        return true;
    }
    if (method == "SUBSCRIBE") {
        respond(request, sender, SIP_METHOD_NOT_ALLOWED, "Method Not Allowed");
        return true;
    }
    if (method == "OPTIONS" || method == "REGISTER") {
        respond(request, sender, SIP_OK, "OK");
        return true;
    }
    return false;
}

bool ivr::RequestHandler::isInDialog(const SipRequest &request)
{
    return !request.from_tag.empty() && !request.to_tag.empty();
}

void ivr::RequestHandler::respond(const SipRequest &request,
                                  ResponseSender &sender,
                                  int status_code,
                                  const std::string &reason)
{
    logger_.debug(request.method + " from " + request.source + " answered with " + std::to_string(status_code)
                  + " " + reason + ".");
    sender.sendResponse(request, status_code, reason);
}
