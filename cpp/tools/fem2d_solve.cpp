#include "fem2d/analysis_settings.hpp"
#include "fem2d/json_io.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace
{
struct CliArgs
{
    std::string input_path;   // empty = stdin
    std::string log_level = "warn";
    fem2d::AnalysisSettings settings;
};

void print_usage(std::ostream &out)
{
    out << "usage: fem2d_solve [--stations N] [--rigid-stiffness K] [--log-level LEVEL] "
           "[request.json]\n"
           "Reads an analysis request (stdin when no file is given) and prints the "
           "response JSON.\n";
}

std::string flag_value(int argc, char **argv, int &i)
{
    if (i + 1 >= argc) { throw std::runtime_error(std::string("Missing value for ") + argv[i]); }
    return argv[++i];
}

CliArgs parse_args(int argc, char **argv)
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--stations")
        {
            args.settings.num_stations = std::stoi(flag_value(argc, argv, i));
        }
        else if (arg == "--rigid-stiffness")
        {
            args.settings.rigid_spring_stiffness = std::stod(flag_value(argc, argv, i));
        }
        else if (arg == "--log-level")
        {
            args.log_level = flag_value(argc, argv, i);
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw std::runtime_error("Unknown flag: " + arg);
        }
        else if (args.input_path.empty())
        {
            args.input_path = arg;
        }
        else
        {
            throw std::runtime_error("Only one request file may be given");
        }
    }
    args.settings.validate();
    return args;
}

std::string read_text(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) { throw std::runtime_error("Unable to open file for reading: " + path); }
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string read_stdin()
{
    return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
}
}  // namespace

int main(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::string(argv[i]) == "--help" || std::string(argv[i]) == "-h")
        {
            print_usage(std::cout);
            return 0;
        }
    }

    CliArgs args;
    std::string text;
    try
    {
        args = parse_args(argc, argv);
        text = args.input_path.empty() ? read_stdin() : read_text(args.input_path);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "fem2d_solve error: " << ex.what() << std::endl;
        print_usage(std::cerr);
        return 2;
    }

    auto logger = spdlog::stderr_color_mt("fem2d");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(args.log_level));

    const json response = fem2d::json_io::solve_document(text, args.settings);
    std::cout << response.dump(2) << std::endl;
    return response.value("success", false) ? 0 : 1;
}
