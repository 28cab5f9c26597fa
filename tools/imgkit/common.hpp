/**
 * imgkit CLI - Common utilities and types
 */

#pragma once

#include <imgkit/logging.hpp>
#include <imgkit/registry.hpp>
#include <imgkit/types.hpp>

#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

namespace imgkit::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Registry flags shared by pull and push. The CLI11 option pointers are kept
 * so that "given on the command line" can be told apart from defaults.
 */
struct RegistryCliOptions {
    std::string username;
    std::string password;
    std::string token;
    std::string ca_cert_path;
    bool verify_certs = true;
    bool insecure = false;

    CLI::Option* verify_certs_opt = nullptr;
    CLI::Option* insecure_opt = nullptr;
};

inline void add_registry_options(CLI::App* app, RegistryCliOptions& reg) {
    app->add_option("--registry-username", reg.username, "Set username for auth ($IMGKIT_USERNAME)");
    app->add_option("--registry-password", reg.password, "Set password for auth ($IMGKIT_PASSWORD)");
    app->add_option("--registry-token", reg.token, "Set token for auth ($IMGKIT_TOKEN)");
    app->add_option("--registry-ca-cert-path", reg.ca_cert_path,
                    "Add CA certificates for registry API ($IMGKIT_REGISTRY_CA_CERT_PATH)");
    reg.verify_certs_opt = app->add_option("--registry-verify-certs", reg.verify_certs,
                                           "Set whether to verify server's certificate chain and host name ($IMGKIT_REGISTRY_VERIFY_CERTS)");
    reg.insecure_opt = app->add_flag("--registry-insecure", reg.insecure,
                                     "Allow the use of http when interacting with registries ($IMGKIT_REGISTRY_INSECURE)");
}

/**
 * Resolve registry options.
 * Priority: flag > IMGKIT_* env > default
 */
inline RegistryOptions resolve_registry(const RegistryCliOptions& reg) {
    RegistryFlags flags;
    if (!reg.username.empty()) flags.username = reg.username;
    if (!reg.password.empty()) flags.password = reg.password;
    if (!reg.token.empty()) flags.token = reg.token;
    if (!reg.ca_cert_path.empty()) flags.ca_cert_path = reg.ca_cert_path;
    if (reg.verify_certs_opt && reg.verify_certs_opt->count() > 0) flags.verify_certs = reg.verify_certs;
    if (reg.insecure_opt && reg.insecure_opt->count() > 0) flags.insecure = reg.insecure;
    return resolve_registry_options(flags);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << std::endl;
}

inline std::shared_ptr<spdlog::logger> make_logger(const GlobalOptions& opts) {
    return make_ui_logger(opts.verbose, opts.quiet);
}

} // namespace imgkit::cli
