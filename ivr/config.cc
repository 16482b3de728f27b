#include "config.h"

#include <arpa/inet.h>
#include <getopt.h>
#include <netinet/in.h>

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace {

int parsePort(const std::string &value)
{
    char *end = nullptr;
    long port = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || port <= 0 || port > 65535) {
        throw ivr::ConfigError("Invalid SIP port: '" + value + "'");
    }
    return static_cast<int>(port);
}

unsigned parseExpiry(const std::string &value)
{
    char *end = nullptr;
    long expiry = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || expiry <= 0) {
        throw ivr::ConfigError("Invalid registration expiry: '" + value + "'");
    }
    return static_cast<unsigned>(expiry);
}

bool readEnv(const char *name, std::string &value)
{
    const char *env = std::getenv(name);
    if (env == nullptr || *env == '\0') {
        return false;
    }
    value = env;
    return true;
}

} // namespace

void ivr::applyEnvironment(Config &cfg)
{
    std::string value;

    if (readEnv("IVR_ADDRESS", value)) {
        cfg.address = resolveAddress(value);
    }
    if (readEnv("IVR_SIP_PORT", value)) {
        cfg.port = parsePort(value);
    }
    if (readEnv("IVR_SIP_USER", value)) {
        cfg.user = value;
    }
    if (readEnv("IVR_SIP_DOMAIN", value)) {
        cfg.domain = value;
    }
    if (readEnv("IVR_SIP_PASSWORD", value)) {
        cfg.password = value;
    }
    if (readEnv("IVR_SOUNDS_DIR", value)) {
        cfg.sounds_dir = value;
    }
    if (readEnv("IVR_AUDIO_OUTPUT", value)) {
        cfg.audio_output = parseAudioOutput(value);
    }
}

bool ivr::parseArguments(int argc, char *argv[], Config &cfg)
{
    int ch;

    optind = 1;
    opterr = 0;
    while ((ch = getopt(argc, argv, "a:p:u:d:w:e:s:o:nvh")) != -1) {
        switch (ch) {
        case 'a':
            cfg.address = resolveAddress(optarg);
            break;
        case 'p':
            cfg.port = parsePort(optarg);
            break;
        case 'u':
            cfg.user = optarg;
            break;
        case 'd':
            cfg.domain = optarg;
            break;
        case 'w':
            cfg.password = optarg;
            break;
        case 'e':
            cfg.reg_expiry = parseExpiry(optarg);
            break;
        case 's':
            cfg.sounds_dir = optarg;
            break;
        case 'o':
            cfg.audio_output = parseAudioOutput(optarg);
            break;
        case 'n':
            cfg.null_audio = true;
            break;
        case 'v':
            cfg.log_level = Logger::Level::Debug;
            break;
        case 'h':
            return false;
        default:
            throw ConfigError(std::string("Bad option: -") + static_cast<char>(optopt));
        }
    }

    if (optind < argc) {
        throw ConfigError(std::string("Unexpected argument: ") + argv[optind]);
    }
    return true;
}

std::string ivr::resolveAddress(const std::string &input)
{
    if (input.empty()) {
        throw ConfigError("IP Address cannot be empty.");
    }

    std::string ip = input;
    for (auto &c : ip) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (ip == IVR_LOCALHOST_V4_CMD) {
        return IVR_LOCALHOST_V4;
    }
    if (ip == IVR_LOCALHOST_V6_CMD) {
        return IVR_LOCALHOST_V6;
    }

    unsigned char buf[sizeof(struct in6_addr)];
    if (inet_pton(AF_INET, input.c_str(), buf) == 1 || inet_pton(AF_INET6, input.c_str(), buf) == 1) {
        return input;
    }
    throw ConfigError("Invalid IP Address: '" + input + "'");
}

ivr::AudioOutput ivr::parseAudioOutput(const std::string &value)
{
    if (value == "call") {
        return AudioOutput::Call;
    }
    if (value == "device") {
        return AudioOutput::Device;
    }
    throw ConfigError("Invalid audio output: '" + value + "' (expected call or device)");
}

const char *ivr::toString(AudioOutput output)
{
    return output == AudioOutput::Call ? "call" : "device";
}

std::string ivr::promptAddress(std::istream &in, std::ostream &out)
{
    out << "-----Lazy commands-----\n"
        << IVR_LOCALHOST_V4_CMD " - equivalent to " IVR_LOCALHOST_V4 " (IPV4 localhost)\n"
        << IVR_LOCALHOST_V6_CMD " - equivalent to " IVR_LOCALHOST_V6 " (IPV6 localhost)\n"
        << "\n"
        << "Please enter IP Address: " << std::flush;

    std::string line;
    std::getline(in, line);
    return resolveAddress(line);
}

std::string ivr::localhostType(const std::string &address)
{
    if (address == IVR_LOCALHOST_V4) {
        return "(IPV4 localhost)";
    }
    if (address == IVR_LOCALHOST_V6) {
        return "(IPV6 localhost)";
    }
    return "";
}

std::string ivr::usage(const char *prog_name)
{
    std::ostringstream os;
    os << "usage: " << prog_name << " [options]\n"
       << "  -a <address>   IP address to listen on (" IVR_LOCALHOST_V4_CMD ", " IVR_LOCALHOST_V6_CMD " accepted)\n"
       << "  -p <port>      SIP port (default " << IVR_SIP_PORT << ")\n"
       << "  -u <user>      SIP user to register\n"
       << "  -d <domain>    SIP registrar domain\n"
       << "  -w <password>  SIP password\n"
       << "  -e <seconds>   registration expiry (default " << IVR_REG_EXPIRY << ")\n"
       << "  -s <dir>       sounds directory (default " IVR_SOUNDS_DIR ")\n"
       << "  -o call|device play prompts into the call or on the local device\n"
       << "  -n             use the null audio device\n"
       << "  -v             debug logging\n"
       << "  -h             this help\n";
    return os.str();
}
