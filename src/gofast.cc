#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

#include "common.hh"
#include "link.hh"
#include "log.hh"
#include "receiver_session.hh"
#include "sender_session.hh"

void printUsage(const char *command)
{
    std::cerr << "Usage: " << command << " send [-p PORT] [-l LOCAL_PORT] "
              << "[-i SYNC_MS] [-m MTU] [-g GAP_US] [-dqh] HOST FILE" << std::endl;
    std::cerr << "       " << command << " receive [-p PORT] [-o DIR] [-m MTU] "
              << "[-dqh]" << std::endl;
    std::cerr << "\t-p: receiver port (default 6666)" << std::endl;
    std::cerr << "\t-l: sender's local port (default 6667)" << std::endl;
    std::cerr << "\t-i: sync poll interval in milliseconds (default 200)" << std::endl;
    std::cerr << "\t-m: largest datagram to send (default 1500)" << std::endl;
    std::cerr << "\t-g: pause between parts in microseconds (default 0)" << std::endl;
    std::cerr << "\t-o: directory to write the received file to (default .)" << std::endl;
    std::cerr << "\t-q: quiet (no progress bar)" << std::endl;
    std::cerr << "\t-d: debug (per-part messages instead of a progress bar)" << std::endl;
    std::cerr << "\t-h: help" << std::endl;
}

/**
 * Parses a decimal number in [1, max].
 *
 * \return
 *      False if \p text is not such a number.
 */
bool parseNumber(const char *text, unsigned long max, unsigned long& value)
{
    char *end;
    errno = 0;
    value = std::strtoul(text, &end, 10);
    return errno == 0 && end != text && *end == '\0' && value > 0 &&
           value <= max;
}

int parseArgs(int argc,
              char *argv[],
              const std::string& mode,
              Config& config,
              std::string& host,
              std::string& path)
{
    DEBUG_F = 0;
    const char *options = mode == "send" ? "p:l:i:m:g:dqh" : "p:o:m:dqh";
    unsigned long value;
    int c;

    // argv[0] is the mode; options and operands follow it
    optind = 1;
    while ((c = getopt(argc, argv, options)) != -1) {
        switch (c) {
            case 'p':
                if (!parseNumber(optarg, 65535, value))
                    return -1;
                config.receiverPort = static_cast<uint16_t>(value);
                break;
            case 'l':
                if (!parseNumber(optarg, 65535, value))
                    return -1;
                config.senderPort = static_cast<uint16_t>(value);
                break;
            case 'i':
                if (!parseNumber(optarg, 3600 * 1000, value))
                    return -1;
                config.syncInterval = std::chrono::milliseconds(value);
                break;
            case 'm':
                if (!parseNumber(optarg, MAX_UDP_PAYLOAD, value))
                    return -1;
                config.mtu = value;
                break;
            case 'g':
                if (!parseNumber(optarg, 1000 * 1000, value))
                    return -1;
                config.sendGap = std::chrono::microseconds(value);
                break;
            case 'o':
                path = optarg;
                break;
            case 'd':
                DEBUG_F = 1;
                break;
            case 'q':
                config.quiet = true;
                break;
            case 'h':
            case '?':
            default:
                return -1;
        }
    }

    if (mode == "send") {
        if (argc - optind != 2) {
            return -1;
        }
        host = argv[optind];
        path = argv[optind + 1];
    } else if (optind != argc) {
        return -1;
    }

    return 0;
}

int main(int argc, char *argv[])
{
    if (argc < 2) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string mode = argv[1];
    if (mode != "send" && mode != "receive") {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    Config config;
    std::string host;
    std::string path = mode == "receive" ? "." : "";
    if (parseArgs(argc - 1, argv + 1, mode, config, host, path) == -1) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        config.validate();
        if (mode == "send") {
            UDPLink link(Address("0.0.0.0", config.senderPort),
                         Address(host, std::to_string(config.receiverPort)));
            SenderSession session(config, link, path);
            session.run();
        } else {
            UDPLink link(Address("0.0.0.0", config.receiverPort));
            logInfo("listening at %s", link.localAddress().to_string().c_str());
            ReceiverSession session(config, link, path);
            session.run();
        }
    } catch (const std::exception& e) {
        logError("%s", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
