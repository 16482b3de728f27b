#include "ivrcall.h"
#include "pjuseragent.h"

#include <string>

ivr::IvrCall::IvrCall(ivr::PjUserAgent &agent, pj::Account &acc, int call_id) :
    Call(acc, call_id),
    agent_(agent)
{
}

ivr::IvrCall::~IvrCall()
{
}

void ivr::IvrCall::onCallState(pj::OnCallStateParam &prm)
{
    PJ_UNUSED_ARG(prm);
    try {
        pj::CallInfo ci = getInfo();
        agent_.callStateChanged(ci);
    }
    catch (const pj::Error &err) {
        agent_.logger().error("Error getting call info in onCallState: " + err.info());
    }
}

void ivr::IvrCall::onCallMediaState(pj::OnCallMediaStateParam &prm)
{
    PJ_UNUSED_ARG(prm);
    try {
        pj::CallInfo ci = getInfo();
        agent_.logger().debug("Call " + std::to_string(ci.id) + " media state changed");

        for (unsigned i = 0; i < ci.media.size(); ++i) {
            if (ci.media[i].type != PJMEDIA_TYPE_AUDIO) {
                agent_.logger().debug("Non-audio media stream detected (type: " + std::to_string(ci.media[i].type)
                                      + ")");
                continue;
            }

            if (ci.media[i].status == PJSUA_CALL_MEDIA_ACTIVE && getMedia(i)) {
                agent_.mediaActivated(getAudioMedia(i));
            }
            else {
                agent_.logger().debug("Audio media is not active (status: " + std::to_string(ci.media[i].status)
                                      + ") for call " + std::to_string(ci.id));
                agent_.mediaDeactivated();
            }
        }
    }
    catch (const pj::Error &err) {
        agent_.logger().error("Error in onCallMediaState: " + err.info());
    }
}

void ivr::IvrCall::onDtmfDigit(pj::OnDtmfDigitParam &prm)
{
    agent_.digitReceived(prm.digit, prm.duration);
}
