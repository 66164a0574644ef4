// ____________________________________ LICENSE ____________________________________
//
// Source repo: qtutil
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Program entry point. Handles CLI args and invokes the helpers.
// _________________________________________________________________________________

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "config.hpp"
#include "table_input.hpp"
#include "utility/clamp.hpp"
#include "utility/exception.hpp"
#include "utility/powerset.hpp"
#include "version.hpp"


constexpr auto style_step    = fmt::fg(fmt::color::dark_blue) | fmt::emphasis::bold;
constexpr auto style_hint    = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
constexpr auto style_error   = fmt::fg(fmt::color::indian_red) | fmt::emphasis::bold;
constexpr auto style_path    = fmt::fg(fmt::color::saddle_brown);
constexpr auto style_command = fmt::fg(fmt::color::purple) | fmt::emphasis::bold;

template <class... Args>
[[noreturn]] void exit_failure(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::println("Execution failed with code {}", EXIT_FAILURE);
    fmt::println(fmt, std::forward<Args>(args)...);

    std::exit(EXIT_FAILURE);
}

template <class... Args>
[[noreturn]] void exit_failure_quiet(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::println(fmt, std::forward<Args>(args)...);

    std::exit(EXIT_FAILURE);
}

template <class... Args>
[[noreturn]] void exit_success_quiet(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::println(fmt, std::forward<Args>(args)...);

    std::exit(EXIT_SUCCESS);
}

[[nodiscard]] qtu::config load_config(const std::string& path) {
    const qtu::config config = std::filesystem::exists(path) ? qtu::config::from_file(path) : qtu::config{};

    if (const auto err = config.validate()) exit_failure("Config validation error:\n{}", err.value());

    return config;
}

int main(int argc, char* argv[]) try {
    // Handle CLI args
    const std::string version = qtu::version::banner();

    argparse::ArgumentParser cli(qtu::version::program, version, argparse::default_arguments::none);

    cli.add_description("Command line access to table formatting, index clamping & subset enumeration");

    cli                                //
        .add_argument("-h", "--help")  //
        .flag()                        //
        .help("Displays help message") //
        .action([&](const auto&) {     //
            exit_success_quiet("{}", cli.help().str());
        });

    cli                                       //
        .add_argument("-v", "--version")      //
        .flag()                               //
        .help("Displays application version") //
        .action([&](const auto&) {            //
            exit_success_quiet("{}", version);
        });

    cli                                                                         //
        .add_argument("-w", "--write-config")                                   //
        .flag()                                                                 //
        .help("Creates config file corresponding to the default configuration") //
        .action([](const auto&) {                                               //
            const std::string path = qtu::config::default_path;
            qtu::config{}.to_file(path);
            exit_success_quiet("Serialized a copy of default config to {{ {} }}", path);
        });

    cli                                                        //
        .add_argument("-c", "--config")                        //
        .default_value(std::string{qtu::config::default_path}) //
        .help("Specifies custom config path");                 //

    // 'table' subcommand
    argparse::ArgumentParser table_cmd("table", version, argparse::default_arguments::help);

    table_cmd.add_description("Formats a YAML table description as a plain-text table");

    table_cmd                                        //
        .add_argument("file")                        //
        .help("Path to the YAML table description"); //

    table_cmd                                                      //
        .add_argument("-g", "--group-by")                          //
        .scan<'u', std::size_t>()                                  //
        .help("Groups rows by the column at this index, 0-based"); //

    // 'powerset' subcommand
    argparse::ArgumentParser powerset_cmd("powerset", version, argparse::default_arguments::help);

    powerset_cmd.add_description("Lists all subsets of the given items");

    powerset_cmd                            //
        .add_argument("items")              //
        .remaining()                        //
        .help("Items to build subsets of"); //

    // 'clamp' subcommand
    argparse::ArgumentParser clamp_cmd("clamp", version, argparse::default_arguments::help);

    clamp_cmd.add_description("Clamps an index into the range [0, stop)");

    clamp_cmd                      //
        .add_argument("index")     //
        .scan<'i', std::int64_t>() //
        .help("Index to clamp");   //

    clamp_cmd                      //
        .add_argument("stop")      //
        .scan<'i', std::int64_t>() //
        .help("End of the range"); //

    clamp_cmd                                                              //
        .add_argument("-s", "--saturate")                                  //
        .flag()                                                            //
        .help("Saturates to the range bounds instead of wrapping around"); //

    cli.add_subparser(table_cmd);
    cli.add_subparser(powerset_cmd);
    cli.add_subparser(clamp_cmd);

    try {
        cli.parse_args(argc, argv);
    } catch (std::exception& e) {
        fmt::println("{}", fmt::styled("Error parsing CLI arguments:", style_error));
        fmt::println("");
        fmt::println("{}", e.what());
        fmt::println("");
        fmt::println("Run {} to see the full usage guide.", fmt::styled("qtutil --help", style_command));
        exit_failure_quiet("");
    }

    // Invoke the selected helper
    if (cli.is_subcommand_used(table_cmd)) {
        const std::string config_path = cli.get<std::string>("--config");
        const std::string input_path  = table_cmd.get<std::string>("file");

        fmt::print(style_step, "Step 1/3: ");
        fmt::println("Parsing config {{ {} }}...", fmt::styled(config_path, style_path));

        const qtu::config config = load_config(config_path);

        fmt::print(style_step, "Step 2/3: ");
        fmt::println("Parsing table {{ {} }}...", fmt::styled(input_path, style_path));

        qtu::table_input input = qtu::table_input::from_file(input_path);

        if (const auto group_by = table_cmd.present<std::size_t>("--group-by")) input.group_by = group_by;

        fmt::print(style_step, "Step 3/3: ");
        fmt::println("Formatting table...");
        fmt::println("");

        fmt::print("{}", input.format(config.table_style()));

    } else if (cli.is_subcommand_used(powerset_cmd)) {
        std::vector<std::string> items;
        if (powerset_cmd.is_used("items")) items = powerset_cmd.get<std::vector<std::string>>("items");

        for (const auto& subset : qtu::powerset(items)) fmt::println("({})", fmt::join(subset, ", "));

    } else if (cli.is_subcommand_used(clamp_cmd)) {
        const auto index = clamp_cmd.get<std::int64_t>("index");
        const auto stop  = clamp_cmd.get<std::int64_t>("stop");
        const bool wrap  = !clamp_cmd.get<bool>("--saturate");

        fmt::println("{}", qtu::clamp_idx(index, stop, wrap));

    } else {
        fmt::print(style_hint, "Hint: ");
        fmt::print("No command selected, run ");
        fmt::print(style_command, "qtutil --help");
        fmt::println(" to see the available ones.");
        exit_failure_quiet("");
    }

    return EXIT_SUCCESS;

} catch (qtu::domain_failure& e) {
    fmt::println("Terminated due to a failure outside of the program:\n{}", e.what());
    return EXIT_FAILURE;
    // not a bug on our side, the environment (file system, permissions) is at fault
} catch (qtu::exception& e) {
    fmt::println("Terminated due to exception:\n{}", e.what());
    return EXIT_FAILURE;
    // we use a custom exception class with more debug info & colored formatting
} catch (std::exception& e) {
    fmt::println("Terminated due to unhandled exception:\n{}", e.what());
    return EXIT_FAILURE;
    // there should be no other exceptions unless we run into an 'std::bad_alloc'
}
