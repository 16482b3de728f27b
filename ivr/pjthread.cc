#include "pjthread.h"

#include <pjsua2.hpp>

void ivr::registerPjThread(const char *name)
{
    pj::Endpoint &ep = pj::Endpoint::instance();
    if (!ep.libIsThreadRegistered()) {
        ep.libRegisterThread(name);
    }
}
