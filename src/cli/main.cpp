#include <shortid/cli.hpp>
#include <shortid/log.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace shortid;

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto opts = cli::parse_args(args);
    if (opts.is_err()) {
        log::error("%s", opts.error().format().c_str());
        return cli::kExitUsage;
    }

    auto cfg = cli::load_config(opts.value());
    if (cfg.is_err()) {
        log::error("%s", cfg.error().format().c_str());
        return cli::kExitUsage;
    }

    cli::configure_logging(cfg.value(), opts.value());
    return cli::run(opts.value(), cfg.value(), std::cout);
}
