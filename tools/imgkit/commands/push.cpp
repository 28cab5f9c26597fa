/**
 * imgkit CLI - push command
 *
 * Package files and directories as an image or bundle and upload them.
 */

#include "../common.hpp"
#include <imgkit/push.hpp>
#include <CLI/CLI.hpp>

namespace imgkit::cli::commands {

namespace {

struct PushCliOptions {
    std::string image;
    std::string bundle;
    std::vector<std::string> files;
    std::vector<std::string> exclusions;
    std::string lock_output;
    RegistryCliOptions registry;
};

int cmd_push(const GlobalOptions& opts, const PushCliOptions& push_opts) {
    auto logger = make_logger(opts);

    if (push_opts.image.empty() == push_opts.bundle.empty()) {
        print_error("Expected either image or bundle");
        return 1;
    }

    PushOptions options;
    options.bundle = !push_opts.bundle.empty();
    options.reference = options.bundle ? push_opts.bundle : push_opts.image;
    options.files = push_opts.files;
    options.exclusions = push_opts.exclusions;
    options.lock_output = push_opts.lock_output;

    Registry registry(resolve_registry(push_opts.registry), *logger);

    auto result = run_push(options, registry, *logger);
    if (!result.ok) {
        logger->debug("{} failure", error_kind_name(result.kind));
        print_error(result.error);
        return 1;
    }

    logger->info("");
    logger->info("Succeeded");
    return 0;
}

} // namespace

void setup_push(CLI::App* app, GlobalOptions& opts) {
    static PushCliOptions push_opts;

    app->add_option("-i,--image", push_opts.image, "Set image (example: docker.io/dkalinin/test-content)");
    app->add_option("-b,--bundle", push_opts.bundle, "Set bundle (example: docker.io/dkalinin/app1-bundle)");
    app->add_option("-f,--file", push_opts.files, "Set file (format: /tmp/foo) (can be specified multiple times)")
        ->required();
    app->add_option("--file-exclusion", push_opts.exclusions,
                    "Exclude file whose path, relative to the bundle root, matches (format: bar.yaml, nested-dir/baz.txt) (can be specified multiple times)");
    app->add_option("--lock-output", push_opts.lock_output, "Location to output the generated lockfile");
    add_registry_options(app, push_opts.registry);

    app->callback([&opts]() {
        std::exit(cmd_push(opts, push_opts));
    });
}

} // namespace imgkit::cli::commands
