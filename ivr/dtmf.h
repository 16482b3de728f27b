#ifndef _DTMF_H_
#define _DTMF_H_

#include <cstdint>

namespace ivr {

// RFC 4733 telephone-event codes.
const uint8_t DTMF_STAR = 10;
const uint8_t DTMF_POUND = 11;

const char KEY_HELP = '*';
const char KEY_TERMINATOR = '#';

// Maps an event code to '0'..'9', '*' or '#'. A-D and anything above are
// not keys this service understands.
bool
toneToKey(uint8_t tone, char &key);

// Inverse of toneToKey, extended with A-D (12-15) so that the caller can
// still report them as tones.
bool
keyToTone(char key, uint8_t &tone);

} // namespace ivr

#endif // _DTMF_H_
