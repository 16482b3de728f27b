#ifndef _PJTHREAD_H_
#define _PJTHREAD_H_

namespace ivr {

// Threads not created by pjlib must be known to it before calling into
// pjsua2. Registers the calling thread once; later calls are no-ops.
void
registerPjThread(const char *name);

} // namespace ivr

#endif // _PJTHREAD_H_
