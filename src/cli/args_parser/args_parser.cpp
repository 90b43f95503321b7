#include "args_parser.hpp"

#include <boost/program_options.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <iostream>

namespace po = boost::program_options;

namespace antig::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args{};

    po::options_description visible{"Usage: antig [options] <source>... <destination>\nOptions"};
    visible.add_options()
        ("help,h", "Show this help and exit")
        ("version,V", "Show build information and exit")
        ("recursive,r", po::bool_switch(&args.recursive),
            "Copy contents recursively. Usually it is used to copy a directory")
        ("noise", po::bool_switch(&args.noise), "To show coping infos")
        ("no-progress", po::bool_switch(&args.no_progress), "Disable showing the progress bar")
        ("verify", po::bool_switch(&args.verify), "Verify every written file by xxHash64")
        ("quiet,q", po::bool_switch(&args.quiet), "Do not print the final summary")
        ("log-level", po::value<std::string>(),
            "Log level: trace, debug, info, warn, err, critical, off");

    po::options_description hidden;
    hidden.add_options()
        ("paths", po::value<std::vector<std::string>>(), "sources and destination");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("paths", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        spdlog::error("{}", e.what());
        return std::nullopt;
    }

    if (vm.count("help")) {
        std::cout << visible << std::endl;
        args.help = true;
        return args;
    }
    if (vm.count("version")) {
        args.version = true;
        return args;
    }

    if (vm.count("log-level")) {
        args.log_level = vm["log-level"].as<std::string>();
    }

    std::vector<std::string> paths;
    if (vm.count("paths")) {
        paths = vm["paths"].as<std::vector<std::string>>();
    }
    if (paths.size() < 2) {
        spdlog::error("Expected at least one source and a destination (got {} path(s))", paths.size());
        return std::nullopt;
    }

    args.destination = paths.back();
    paths.pop_back();
    args.sources = std::move(paths);
    return args;
}

} // namespace antig::args_parser
