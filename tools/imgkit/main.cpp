/**
 * imgkit CLI - Entry Point
 *
 * Pull and push images and bundles stored in OCI registries.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace imgkit::cli::commands {
    void setup_pull(CLI::App* app, GlobalOptions& opts);
    void setup_push(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace imgkit::cli;

    CLI::App app{"imgkit - store files as images and bundles in OCI registries"};
    app.set_version_flag("-V,--version", IMGKIT_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* pull_cmd = app.add_subcommand("pull", "Pull files from bundle, image, or bundle lock file");
    commands::setup_pull(pull_cmd, opts);

    auto* push_cmd = app.add_subcommand("push", "Push files as an image or bundle");
    commands::setup_push(push_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
