#include "ivraccount.h"

#include <string>
#include <utility>

ivr::IvrAccount::IvrAccount(Logger &logger, IncomingCallHandler handler) :
    logger_(logger),
    on_incoming_call_(std::move(handler))
{
}

ivr::IvrAccount::~IvrAccount()
{
    shutdown();
}

void ivr::IvrAccount::onRegState(pj::OnRegStateParam &prm)
{
    pj::AccountInfo ai = getInfo();
    std::string text = std::string(ai.regIsActive ? "Registered:" : "Unregistered:")
                       + " code=" + std::to_string(prm.code) + " reason=" + prm.reason
                       + " (" + ai.uri + ")";
    if (prm.code / 100 == 2 || prm.code == 0) {
        logger_.info(text);
    }
    else {
        logger_.warning(text);
    }
}

void ivr::IvrAccount::onIncomingCall(pj::OnIncomingCallParam &iprm)
{
    logger_.debug("Incoming call " + std::to_string(iprm.callId) + " from " + iprm.rdata.srcAddress);

    on_incoming_call_(iprm);
}
