#include "config.h"
#include "ivrserver.h"
#include "logger.h"

#include <pjsua2.hpp>

#include <exception>
#include <iostream>
#include <limits>
#include <string>

int main(int argc, char *argv[])
{
    ivr::Config cfg;
    try {
        ivr::applyEnvironment(cfg);
        if (!ivr::parseArguments(argc, argv, cfg)) {
            std::cout << ivr::usage(argv[0]);
            return 0;
        }
        if (cfg.address.empty()) {
            cfg.address = ivr::promptAddress(std::cin, std::cout);
        }
    }
    catch (const ivr::ConfigError &err) {
        std::cerr << err.what() << std::endl;
        return 1;
    }

    ivr::Logger logger(std::cout, std::cerr, cfg.log_level);
    ivr::IvrServer server(logger, cfg);

    try {
        server.start();

        std::cout << std::endl;
        std::cout << "Started ivr server!" << std::endl;
        std::cout << "Server is running on IP: " << cfg.address << " " << ivr::localhostType(cfg.address)
                  << std::endl;

        std::cout << "\nCommands:\n";
        std::cout << "  l                    : List active calls\n";
        std::cout << "  q                    : Quit\n"
                  << std::endl;

        char cmd[100];
        while (true) {
            std::cout << "> ";
            if (!std::cin.getline(cmd, sizeof(cmd))) {
                if (std::cin.eof())
                    break;
                std::cin.clear();
                std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                std::cerr << "!!! Input error. Please try again." << std::endl;
                continue;
            }

            std::string command_line = cmd;
            if (command_line.empty())
                continue;

            char action = command_line[0];

            if (action == 'q') {
                break;
            }
            else if (action == 'l') {
                server.reap();
                std::cout << "*** " << server.activeCalls() << " active call(s)" << std::endl;
                for (const auto &call_id : server.callIds()) {
                    std::cout << "    " << call_id << std::endl;
                }
            }
            else {
                std::cerr << "!!! Unknown command: " << action << std::endl;
            }
        }

        std::cout << "Shutting down..." << std::endl;
        server.stop();
    }
    catch (const pj::Error &err) {
        std::cerr << "[Exception]: " << err.info() << std::endl;
        server.stop();
        return 1;
    }
    catch (const std::exception &e) {
        std::cerr << "[Exception]: " << e.what() << std::endl;
        server.stop();
        return 1;
    }

    return 0;
}
