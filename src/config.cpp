#include "config.hpp"
#include "util.hpp"
#include "net.hpp"

#include <getopt.h>

enum LongOnly {
    OPT_NO_CLEAR = 256,
    OPT_NO_AUTH,
    OPT_NO_BEACON,
};

static const option LONG_OPTIONS[] = {
    { "url",       required_argument, nullptr, 'u' },
    { "port",      required_argument, nullptr, 'p' },
    { "key",       required_argument, nullptr, 'k' },
    { "log-file",  required_argument, nullptr, 'l' },
    { "verbose",   no_argument,       nullptr, 'v' },
    { "help",      no_argument,       nullptr, 'h' },
    { "no-clear",  no_argument,       nullptr, OPT_NO_CLEAR },
    { "no-auth",   no_argument,       nullptr, OPT_NO_AUTH },
    { "no-beacon", no_argument,       nullptr, OPT_NO_BEACON },
    { nullptr,     0,                 nullptr, 0 },
};

// bare number = discovery port, otherwise host:port
static bool set_remote(Config& c, const std::string& addr, std::string& error) {
    if (c.is_client()) {
        error = "remote address given more than once";
        return false;
    }
    if (is_all_digits(addr)) {
        uint16_t p = 0;
        if (!parse_port(addr, p) || p == 0) {
            error = "invalid clipboard id '" + addr + "'";
            return false;
        }
        c.discovery = true;
        c.discovery_port = p;
        return true;
    }
    std::string host;
    uint16_t p = 0;
    if (!split_host_port(addr, host, p)) {
        error = "invalid address '" + addr + "', expected host:port";
        return false;
    }
    c.url = addr;
    return true;
}

static bool validate_key(const std::string& key, const char* source, std::string& error) {
    if (key.size() > MAX_KEY_LEN) {
        error = std::string(source) + " is longer than " + std::to_string(MAX_KEY_LEN) + " bytes";
        return false;
    }
    if (!is_valid_utf8(key)) {
        error = std::string(source) + " is not valid UTF-8";
        return false;
    }
    return true;
}

const char* system_env(const char* name) {
    return std::getenv(name);
}

SyncError parse_config(int argc, char** argv, Config& out, std::string& error, EnvLookup env) {
    Config c;
    bool key_flag = false;

    optind = 0; // full rescan, parse_config may run more than once
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, ":u:p:k:l:vh", LONG_OPTIONS, nullptr)) != -1) {
        switch (opt) {
        case 'u':
            if (!set_remote(c, optarg, error)) return SyncError::ConfigError;
            break;
        case 'p':
            if (!parse_port(optarg, c.port)) {
                error = std::string("invalid port '") + optarg + "'";
                return SyncError::ConfigError;
            }
            break;
        case 'k':
            c.key = optarg;
            key_flag = true;
            break;
        case 'l':
            c.log_path = optarg;
            break;
        case 'v':
            ++c.verbosity;
            break;
        case 'h':
            c.show_help = true;
            break;
        case OPT_NO_CLEAR:
            c.clear = false;
            break;
        case OPT_NO_AUTH:
            c.auth = false;
            break;
        case OPT_NO_BEACON:
            c.beacon = false;
            break;
        case ':':
            error = std::string("option '") + (argv[optind - 1] ? argv[optind - 1] : "?") + "' needs a value";
            return SyncError::ConfigError;
        default:
            error = std::string("unknown option '") + (argv[optind - 1] ? argv[optind - 1] : "?") + "'";
            return SyncError::ConfigError;
        }
    }

    for (int i = optind; i < argc; ++i) {
        if (!set_remote(c, argv[i], error)) return SyncError::ConfigError;
    }

    if (key_flag && !validate_key(c.key, "--key", error)) {
        return SyncError::ConfigError;
    }

    const char* env_key = env ? env(KEY_ENV) : nullptr;
    if (env_key) {
        c.key = env_key;
        if (!validate_key(c.key, KEY_ENV, error)) return SyncError::ConfigError;
    }
    const char* env_log = env ? env(LOG_ENV) : nullptr;
    if (env_log && *env_log) {
        c.log_path = env_log;
    }

    out = std::move(c);
    return SyncError::None;
}

void print_usage(FILE* out, const char* prog) {
    std::fprintf(out,
        "Usage: %s [OPTIONS] [ADDR]\n"
        "\n"
        "Share the clipboard with another machine of your network.\n"
        "Without ADDR this machine waits for a peer.\n"
        "\n"
        "  ADDR                 host:port to connect to, or a clipboard id\n"
        "                       (port number) to find on the local network\n"
        "  -u, --url ADDR       same as ADDR\n"
        "  -p, --port PORT      port to listen on (default: any free port)\n"
        "  -k, --key KEY        shared key (env %s overrides)\n"
        "      --no-clear       keep the current clipboard contents at start\n"
        "      --no-auth        skip the key exchange (both sides)\n"
        "      --no-beacon      do not announce the server on the network\n"
        "  -l, --log-file PATH  append log lines to PATH (env %s overrides)\n"
        "  -v, --verbose        more logging, repeat for trace output\n"
        "  -h, --help           show this help\n",
        prog, KEY_ENV, LOG_ENV);
}
