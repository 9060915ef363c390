#include "clipshare_common.hpp"
#include "clipboard.hpp"
#include "clipboard_adapter.hpp"
#include "config.hpp"
#include "controller.hpp"
#include "logging.hpp"
#include "secure_buffer.hpp"

#include <csignal>
#include <stdexcept>

static LogLevel threshold_for(int verbosity) {
    if (verbosity >= 2) return LogLevel::TRACE;
    if (verbosity == 1) return LogLevel::DEBUG;
    return LogLevel::INFO;
}

// -----------------------------------------------------------------------
// main
// -----------------------------------------------------------------------
int main(int argc, char** argv) {
    // peers hanging up must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    Config cfg;
    std::string error;
    if (parse_config(argc, argv, cfg, error) != SyncError::None) {
        std::fprintf(stderr, "%s: %s\n\n", argv[0], error.c_str());
        print_usage(stderr, argv[0]);
        return 2;
    }
    if (cfg.show_help) {
        print_usage(stdout, argv[0]);
        return 0;
    }

    set_log_path(cfg.log_path);
    set_log_threshold(threshold_for(cfg.verbosity));

    if (sodium_init() < 0) {
        std::fprintf(stderr, "An unexpected error occurred: libsodium initialization failed.\n");
        return 1;
    }

    init_log_context(cfg.is_client() ? "client" : "server");
    audit_log_level(LogLevel::DEBUG,
        "clipshare starting",
        "startup",
        "notify");

    std::shared_ptr<const SecureBuffer> key;
    try {
        auto k = std::make_shared<SecureBuffer>(cfg.key.data(), cfg.key.size());
        k->protect_readonly();
        key = std::move(k);
    }
    catch (const std::runtime_error& e) {
        std::fprintf(stderr, "An unexpected error occurred: %s\n", e.what());
        return 1;
    }
    if (!cfg.key.empty()) {
        sodium_memzero(&cfg.key[0], cfg.key.size());
    }
    cfg.key.clear();

    std::shared_ptr<ClipboardAdapter> adapter;
    try {
        auto backend = make_system_clipboard();
        adapter = cfg.clear ? ClipboardAdapter::cleared(backend)
            : ClipboardAdapter::create(backend);
    }
    catch (const std::runtime_error& e) {
        std::fprintf(stderr, "Clipboard unavailable: %s\n", e.what());
        audit_log_level(LogLevel::ERROR,
            "Clipboard initialization failed",
            "startup",
            "failure");
        return 1;
    }

    if (cfg.is_client()) {
        return run_client(cfg, adapter, *key);
    }
    return run_server(cfg, adapter, key);
}
