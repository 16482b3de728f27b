#ifndef _IVRCALL_H_
#define _IVRCALL_H_

#include <pjsua2.hpp>

namespace ivr {

class PjUserAgent;

// pjsua2 call object; forwards the callbacks the IVR cares about to the
// user agent that owns it.
class IvrCall : public pj::Call
{
public:
    IvrCall(PjUserAgent &agent, pj::Account &acc, int call_id = PJSUA_INVALID_ID);
    ~IvrCall();

    virtual void onCallState(pj::OnCallStateParam &prm) override;
    virtual void onCallMediaState(pj::OnCallMediaStateParam &prm) override;
    virtual void onDtmfDigit(pj::OnDtmfDigitParam &prm) override;

private:
    PjUserAgent &agent_;
};

} // namespace ivr

#endif // _IVRCALL_H_
