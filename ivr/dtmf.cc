#include "dtmf.h"

bool ivr::toneToKey(uint8_t tone, char &key)
{
    if (tone <= 9) {
        key = static_cast<char>('0' + tone);
        return true;
    }
    if (tone == DTMF_STAR) {
        key = KEY_HELP;
        return true;
    }
    if (tone == DTMF_POUND) {
        key = KEY_TERMINATOR;
        return true;
    }
    return false;
}

bool ivr::keyToTone(char key, uint8_t &tone)
{
    if (key >= '0' && key <= '9') {
        tone = static_cast<uint8_t>(key - '0');
        return true;
    }
    switch (key) {
    case KEY_HELP:
        tone = DTMF_STAR;
        return true;
    case KEY_TERMINATOR:
        tone = DTMF_POUND;
        return true;
    case 'A':
    case 'B':
    case 'C':
    case 'D':
        tone = static_cast<uint8_t>(12 + (key - 'A'));
        return true;
    case 'a':
    case 'b':
    case 'c':
    case 'd':
        tone = static_cast<uint8_t>(12 + (key - 'a'));
        return true;
    default:
        return false;
    }
}
