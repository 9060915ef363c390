#include <catch2/catch.hpp>

#include "config.hpp"

#include <map>

// getopt wants mutable argv
struct Args {
    explicit Args(std::vector<std::string> v) : storage(std::move(v)) {
        for (auto& s : storage) ptrs.push_back(&s[0]);
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

static std::map<std::string, std::string> g_fake_env;

static const char* fake_env(const char* name) {
    auto it = g_fake_env.find(name);
    return it == g_fake_env.end() ? nullptr : it->second.c_str();
}

static SyncError parse(std::vector<std::string> v, Config& cfg, std::string& err) {
    Args args(std::move(v));
    return parse_config(args.argc(), args.argv(), cfg, err, fake_env);
}

TEST_CASE("No address selects the server role with defaults", "[config]") {
    g_fake_env.clear();
    Config cfg;
    std::string err;
    REQUIRE(parse({ "clipshare" }, cfg, err) == SyncError::None);

    REQUIRE_FALSE(cfg.is_client());
    REQUIRE(cfg.port == 0);
    REQUIRE(cfg.key == DEFAULT_KEY);
    REQUIRE(cfg.clear);
    REQUIRE(cfg.auth);
    REQUIRE(cfg.beacon);
}

TEST_CASE("Flags are read", "[config]") {
    g_fake_env.clear();
    Config cfg;
    std::string err;
    REQUIRE(parse({ "clipshare", "-p", "37000", "--key", "s3cret", "--no-clear", "-vv",
        "--log-file", "/tmp/clipshare.log", "--no-beacon" }, cfg, err) == SyncError::None);

    REQUIRE(cfg.port == 37000);
    REQUIRE(cfg.key == "s3cret");
    REQUIRE_FALSE(cfg.clear);
    REQUIRE(cfg.verbosity == 2);
    REQUIRE(cfg.log_path == "/tmp/clipshare.log");
    REQUIRE_FALSE(cfg.beacon);
    REQUIRE(cfg.auth);
}

TEST_CASE("Address forms select the client role", "[config]") {
    g_fake_env.clear();
    Config cfg;
    std::string err;

    SECTION("host:port positional") {
        REQUIRE(parse({ "clipshare", "192.168.1.20:37000" }, cfg, err) == SyncError::None);
        REQUIRE(cfg.is_client());
        REQUIRE(cfg.url == "192.168.1.20:37000");
        REQUIRE_FALSE(cfg.discovery);
    }
    SECTION("--url") {
        REQUIRE(parse({ "clipshare", "-u", "[::1]:4000" }, cfg, err) == SyncError::None);
        REQUIRE(cfg.url == "[::1]:4000");
    }
    SECTION("bare number is a clipboard id") {
        REQUIRE(parse({ "clipshare", "40000" }, cfg, err) == SyncError::None);
        REQUIRE(cfg.is_client());
        REQUIRE(cfg.discovery);
        REQUIRE(cfg.discovery_port == 40000);
    }
}

TEST_CASE("Environment key overrides the flag", "[config]") {
    g_fake_env.clear();
    g_fake_env[KEY_ENV] = "from-env";
    g_fake_env[LOG_ENV] = "/tmp/env.log";

    Config cfg;
    std::string err;
    REQUIRE(parse({ "clipshare", "-k", "from-flag", "-l", "/tmp/flag.log" }, cfg, err) == SyncError::None);
    REQUIRE(cfg.key == "from-env");
    REQUIRE(cfg.log_path == "/tmp/env.log");
    g_fake_env.clear();
}

TEST_CASE("Bad command lines are configuration errors", "[config]") {
    g_fake_env.clear();
    Config cfg;
    std::string err;

    REQUIRE(parse({ "clipshare", "-p", "70000" }, cfg, err) == SyncError::ConfigError);
    REQUIRE(parse({ "clipshare", "-p", "abc" }, cfg, err) == SyncError::ConfigError);
    REQUIRE(parse({ "clipshare", "--bogus" }, cfg, err) == SyncError::ConfigError);
    REQUIRE(parse({ "clipshare", "-k" }, cfg, err) == SyncError::ConfigError);
    REQUIRE(parse({ "clipshare", "host-without-port" }, cfg, err) == SyncError::ConfigError);
    REQUIRE(parse({ "clipshare", "a:1", "b:2" }, cfg, err) == SyncError::ConfigError);
    REQUIRE(parse({ "clipshare", "0" }, cfg, err) == SyncError::ConfigError);
    REQUIRE(parse({ "clipshare", "-k", std::string(MAX_KEY_LEN + 1, 'k') }, cfg, err) == SyncError::ConfigError);
    REQUIRE_FALSE(err.empty());

    g_fake_env[KEY_ENV] = "\xff";
    REQUIRE(parse({ "clipshare" }, cfg, err) == SyncError::ConfigError);
    g_fake_env.clear();
}

TEST_CASE("Parsing twice in one process starts from scratch", "[config]") {
    g_fake_env.clear();
    Config a, b;
    std::string err;
    REQUIRE(parse({ "clipshare", "--no-auth", "10.0.0.1:5000" }, a, err) == SyncError::None);
    REQUIRE(parse({ "clipshare" }, b, err) == SyncError::None);

    REQUIRE_FALSE(a.auth);
    REQUIRE(b.auth);
    REQUIRE_FALSE(b.is_client());
}
