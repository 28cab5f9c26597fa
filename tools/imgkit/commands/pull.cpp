/**
 * imgkit CLI - pull command
 *
 * Extract an image or bundle into a directory.
 */

#include "../common.hpp"
#include <imgkit/pull.hpp>
#include <CLI/CLI.hpp>

namespace imgkit::cli::commands {

namespace {

struct PullCliOptions {
    std::string image;
    std::string bundle;
    std::string lock;
    std::string output;
    RegistryCliOptions registry;
};

int cmd_pull(const GlobalOptions& opts, const PullCliOptions& pull_opts) {
    auto logger = make_logger(opts);

    PullOptions options;
    options.image = pull_opts.image;
    options.bundle = pull_opts.bundle;
    options.lock_path = pull_opts.lock;
    options.output_path = pull_opts.output;

    Registry registry(resolve_registry(pull_opts.registry), *logger);

    auto result = run_pull(options, registry, *logger);
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

void setup_pull(CLI::App* app, GlobalOptions& opts) {
    static PullCliOptions pull_opts;

    app->add_option("-i,--image", pull_opts.image, "Set image (example: docker.io/dkalinin/test-content)");
    app->add_option("-b,--bundle", pull_opts.bundle, "Set bundle (example: docker.io/dkalinin/app1-bundle)");
    app->add_option("--lock", pull_opts.lock, "Path to BundleLock file");
    app->add_option("-o,--output", pull_opts.output, "Output directory path")->required();
    add_registry_options(app, pull_opts.registry);

    app->footer(
        "Examples:\n"
        "  # Pull bundle dkalinin/app1-bundle and extract into /tmp/app1-bundle\n"
        "  imgkit pull -b dkalinin/app1-bundle -o /tmp/app1-bundle\n"
        "\n"
        "  # Pull image dkalinin/app1-image and extract into /tmp/app1-image\n"
        "  imgkit pull -i dkalinin/app1-image -o /tmp/app1-image");

    app->callback([&opts]() {
        std::exit(cmd_pull(opts, pull_opts));
    });
}

} // namespace imgkit::cli::commands
