#include <iostream>

#include <boost/program_options.hpp>

#include <cursetool/config.hpp>
#include <cursetool/core/logging.hpp>
#include <cursetool/manifest/conversion.h>

using namespace cursetool;

#ifndef CURSETOOL_VERSION
#define CURSETOOL_VERSION "unknown"
#endif

void static
show_version_info()
{
    std::cout << "cursetool " << CURSETOOL_VERSION << "\n";
}

void static
show_usage(boost::program_options::options_description const& desc)
{
    std::cout << "usage: cursetool [options] <mode> <input> <output>\n\n"
                 "  mode    curse: convert a Curse manifest (JSON) to YAML\n"
                 "          yaml: convert a YAML manifest to Nix\n"
                 "  input   the manifest to read\n"
                 "  output  the manifest to write\n\n"
              << desc;
}

int
main(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    desc.add_options()
        ("help", "show help message")
        ("version", "show version information")
        ("config-file", po::value<string>(), "specify the configuration file to use")
        ("verbose,v", "log debugging information")
        ("quiet,q", "only log warnings and errors")
        ("skip-failures", "leave out mods that can't be resolved instead of failing")
    ;

    po::options_description positional_desc;
    positional_desc.add_options()
        ("mode", po::value<string>())
        ("input", po::value<string>())
        ("output", po::value<string>())
    ;

    po::options_description all_options;
    all_options.add(desc).add(positional_desc);

    po::positional_options_description positional;
    positional.add("mode", 1).add("input", 1).add("output", 1);

    po::variables_map vm;
    try
    {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all_options)
                .positional(positional)
                .run(),
            vm);
        po::notify(vm);
    }
    catch (po::error& e)
    {
        std::cerr << "cursetool: " << e.what() << "\n";
        show_usage(desc);
        return 1;
    }

    if (vm.count("help"))
    {
        show_version_info();
        show_usage(desc);
        return 0;
    }

    if (vm.count("version"))
    {
        show_version_info();
        return 0;
    }

    if (!vm.count("mode") || !vm.count("input") || !vm.count("output"))
    {
        show_usage(desc);
        return 1;
    }
    auto mode = vm["mode"].as<string>();
    if (mode != "curse" && mode != "yaml")
    {
        std::cerr << "cursetool: unknown mode: " << mode << "\n";
        show_usage(desc);
        return 1;
    }

    initialize_logging(
        vm.count("verbose") ? log_verbosity::VERBOSE
        : vm.count("quiet") ? log_verbosity::QUIET
                            : log_verbosity::NORMAL);

    try
    {
        optional<file_path> config_path;
        if (vm.count("config-file"))
            config_path = file_path(vm["config-file"].as<string>());
        auto config = load_tool_config(config_path);

        service_core service(config);
        auto session = make_curse_session(config);

        conversion_options options;
        options.skip_failures = vm.count("skip-failures") != 0;

        file_path input(vm["input"].as<string>());
        file_path output(vm["output"].as<string>());
        if (mode == "curse")
            convert_curse_to_yaml(service, session, input, output, options);
        else
            convert_yaml_to_nix(service, session, input, output, options);
    }
    catch (std::exception& e)
    {
        spdlog::get("cursetool")->error("{}", e.what());
        return 1;
    }
    return 0;
}
