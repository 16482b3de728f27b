#ifndef _IVRACCOUNT_H_
#define _IVRACCOUNT_H_

#include "logger.h"

#include <pjsua2.hpp>

#include <functional>

namespace ivr {

class IvrAccount : public pj::Account
{
public:
    typedef std::function<void(pj::OnIncomingCallParam &)> IncomingCallHandler;

    IvrAccount(Logger &logger, IncomingCallHandler handler);
    ~IvrAccount();

    // 注册状态改变
    virtual void
    onRegState(pj::OnRegStateParam &prm) override;

    // 呼入
    virtual void
    onIncomingCall(pj::OnIncomingCallParam &iprm) override;

private:
    Logger &logger_;
    IncomingCallHandler on_incoming_call_;
};

} // namespace ivr

#endif // _IVRACCOUNT_H_
