#pragma once
#include "clipshare_common.hpp"

struct Config {
    // client role when either is set
    std::string url;              // host:port
    bool discovery = false;
    uint16_t discovery_port = 0;

    uint16_t port = 0;            // server bind port, 0 = OS-chosen
    std::string key = DEFAULT_KEY;
    bool clear = true;
    bool auth = true;
    bool beacon = true;
    int verbosity = 0;
    std::string log_path;
    bool show_help = false;

    bool is_client() const { return discovery || !url.empty(); }
};

using EnvLookup = const char* (*)(const char*);

// getenv with the EnvLookup signature
const char* system_env(const char* name);

// Precedence: environment > flag > default. On ConfigError 'error'
// holds a one-line reason.
SyncError parse_config(int argc, char** argv, Config& out, std::string& error,
    EnvLookup env = system_env);

void print_usage(FILE* out, const char* prog);
