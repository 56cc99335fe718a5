// SPDX-License-Identifier: Apache-2.0
// Part of KeyGate (KG) project.
// apps/kg_gateway.cpp

#include "kg/server.hpp"
#include "kg/gateway_config.hpp"
#include "kg/config_loader.hpp"
#include "kg/log.hpp"

#include <iostream>
#include <string>
#include <csignal>
#include <cstdlib>
#include <stdexcept>

static kg::Server* g_server = nullptr;

static void on_signal(int) {
    if (g_server) g_server->stop();
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " [--env_file .env] [--keys 'k1;k2;k3'] [--target https://host/base]\n"
         "  [--rate_limit 15] [--port 8000] [--prefix /proxy]\n"
         "  [--inject header|query] [--key_header Authorization] [--key_prefix 'Bearer ']\n"
         "  [--key_param key]\n"
         "  [--connect_timeout 10] [--upstream_timeout 180] [--pool 16]\n"
         "  [--insecure 0|1] [--tls_ca <ca.pem>]        (upstream TLS)\n"
         "  [--tls_cert <crt> --tls_key <key>]          (serve HTTPS)\n"
         "  [--max_body <bytes>] [--redact_errors 0|1]\n"
         "  [--log_file gateway.log] [--quiet 0|1]     (suppress console logs when 1)\n"
         "\n"
         "Environment / .env: API_KEYS, TARGET_API_URL, RATE_LIMIT, LISTEN_PORT,\n"
         "  ROUTE_PREFIX, KEY_INJECTION, KEY_HEADER, KEY_PREFIX, KEY_PARAM,\n"
         "  UPSTREAM_CONNECT_TIMEOUT, UPSTREAM_TIMEOUT, TLS_VERIFY_UPSTREAM,\n"
         "  TLS_CA_FILE, LOG_FILE. Command-line flags take precedence.\n";
}

static bool to_int(const std::string& s, long long& out) {
    try {
        std::size_t used = 0;
        out = std::stoll(s, &used);
        return used == s.size() && out >= 0;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char** argv) {
    // Flags that mirror an environment variable go through the same parser.
    kg::EnvMap cli;
    std::string env_file = ".env";
    long long pool = -1, max_body = -1, redact = -1, quiet = 0;
    std::string tls_cert, tls_key;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        const bool has_val = i + 1 < argc;
        if (a == "--env_file" && has_val)              env_file = argv[++i];
        else if (a == "--keys" && has_val)             cli["API_KEYS"] = argv[++i];
        else if (a == "--target" && has_val)           cli["TARGET_API_URL"] = argv[++i];
        else if (a == "--rate_limit" && has_val)       cli["RATE_LIMIT"] = argv[++i];
        else if (a == "--port" && has_val)             cli["LISTEN_PORT"] = argv[++i];
        else if (a == "--prefix" && has_val)           cli["ROUTE_PREFIX"] = argv[++i];
        else if (a == "--inject" && has_val)           cli["KEY_INJECTION"] = argv[++i];
        else if (a == "--key_header" && has_val)       cli["KEY_HEADER"] = argv[++i];
        else if (a == "--key_prefix" && has_val)       cli["KEY_PREFIX"] = argv[++i];
        else if (a == "--key_param" && has_val)        cli["KEY_PARAM"] = argv[++i];
        else if (a == "--connect_timeout" && has_val)  cli["UPSTREAM_CONNECT_TIMEOUT"] = argv[++i];
        else if (a == "--upstream_timeout" && has_val) cli["UPSTREAM_TIMEOUT"] = argv[++i];
        else if (a == "--tls_ca" && has_val)           cli["TLS_CA_FILE"] = argv[++i];
        else if (a == "--log_file" && has_val)         cli["LOG_FILE"] = argv[++i];
        else if (a == "--insecure" && has_val) {
            long long v = 0;
            if (!to_int(argv[++i], v)) { usage(argv[0]); return 2; }
            cli["TLS_VERIFY_UPSTREAM"] = v ? "0" : "1";
        }
        else if (a == "--tls_cert" && has_val)         tls_cert = argv[++i];
        else if (a == "--tls_key" && has_val)          tls_key  = argv[++i];
        else if (a == "--pool" && has_val)          { if (!to_int(argv[++i], pool))     { usage(argv[0]); return 2; } }
        else if (a == "--max_body" && has_val)      { if (!to_int(argv[++i], max_body)) { usage(argv[0]); return 2; } }
        else if (a == "--redact_errors" && has_val) { if (!to_int(argv[++i], redact))   { usage(argv[0]); return 2; } }
        else if (a == "--quiet" && has_val)         { if (!to_int(argv[++i], quiet))    { usage(argv[0]); return 2; } }
        else { usage(argv[0]); return 2; }
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        kg::set_log_console(false);
    }

    kg::GatewayConfig cfg;
    try {
        // defaults < .env < process environment < command line
        kg::EnvMap env = kg::process_env();
        const bool have_dotenv = kg::load_dotenv(env_file, env);
        for (const auto& kv : cli) env[kv.first] = kv.second;
        kg::apply_env(env, cfg);

        if (pool >= 0)     cfg.upstream_pool_size = static_cast<int>(pool);
        if (max_body >= 0) cfg.max_body = static_cast<std::size_t>(max_body);
        if (redact >= 0)   cfg.redact_errors = (redact != 0);
        if (!tls_cert.empty()) cfg.tls_cert_file = tls_cert;
        if (!tls_key.empty())  cfg.tls_key_file  = tls_key;

        kg::validate_config(cfg);
        kg::set_log_file(cfg.log_file);
        if (have_dotenv) kg::log_line("[INFO] Loaded settings from " + env_file);
    } catch (const kg::ConfigError& e) {
        std::cerr << "[FATAL] config: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGPIPE, SIG_IGN);

    try {
        kg::Server srv(cfg);
        g_server = &srv;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        srv.run();  // blocking
        g_server = nullptr;
    } catch (const std::exception& e) {
        g_server = nullptr;
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
