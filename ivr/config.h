#ifndef _CONFIG_H_
#define _CONFIG_H_

#include "logger.h"

#include <iostream>
#include <stdexcept>
#include <string>

#define IVR_SIP_PORT       5060
#define IVR_SIP_USER       ""
#define IVR_SIP_DOMAIN     ""
#define IVR_SIP_PASSWORD   ""
#define IVR_REG_EXPIRY     120
#define IVR_SOUNDS_DIR     "Sounds"
#define IVR_USER_AGENT     "ivr-dtmf-echo"

#define IVR_LOCALHOST_V4     "127.0.0.1"
#define IVR_LOCALHOST_V6     "::1"
#define IVR_LOCALHOST_V4_CMD "lv4"
#define IVR_LOCALHOST_V6_CMD "lv6"

namespace ivr {

class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &what) :
        std::runtime_error(what) {}
};

// Where prompts are rendered: into the call, or on the local sound device.
enum class AudioOutput
{
    Call,
    Device
};

struct Config
{
    std::string address;
    int port = IVR_SIP_PORT;

    std::string user = IVR_SIP_USER;
    std::string domain = IVR_SIP_DOMAIN;
    std::string password = IVR_SIP_PASSWORD;
    unsigned reg_expiry = IVR_REG_EXPIRY;

    std::string sounds_dir = IVR_SOUNDS_DIR;
    AudioOutput audio_output = AudioOutput::Call;
    bool null_audio = false;

    Logger::Level log_level = Logger::Level::Info;

    bool registers() const { return !user.empty() && !domain.empty(); }
};

// Overrides cfg from IVR_* environment variables that are set.
void
applyEnvironment(Config &cfg);

// Parses getopt flags into cfg. Returns false when usage was requested.
bool
parseArguments(int argc, char *argv[], Config &cfg);

// Expands the lazy commands (lv4, lv6) and validates the address.
std::string
resolveAddress(const std::string &input);

// Prints the lazy command banner to out and reads an address from in.
// Throws ConfigError like resolveAddress().
std::string
promptAddress(std::istream &in, std::ostream &out);

// "(IPV4 localhost)", "(IPV6 localhost)" or "".
std::string
localhostType(const std::string &address);

AudioOutput
parseAudioOutput(const std::string &value);

const char *
toString(AudioOutput output);

std::string
usage(const char *prog_name);

} // namespace ivr

#endif // _CONFIG_H_
