#include <arguments.hpp>

#include <algorithm>    // std::ranges::find_if, std::ranges::max_element
#include <array>        // std::array
#include <charconv>     // std::from_chars
#include <chrono>       // std::chrono::milliseconds
#include <cmath>        // std::abs
#include <cstddef>      // std::size_t
#include <cstdlib>      // EXIT_FAILURE, EXIT_SUCCESS
#include <filesystem>   // std::filesystem::is_directory, std::filesystem::path
#include <format>       // std::format
#include <iostream>     // std::cerr, std::cin
#include <optional>     // std::optional
#include <print>        // std::println
#include <ranges>       // std::views::filter
#include <span>         // std::span
#include <sstream>      // std::ostringstream
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::errc, std::error_code
#include <utility>      // std::move
#include <vector>       // std::vector

#include <nlohmann/json.hpp> // nlohmann::json

#include <build/config.hpp>        // KataJudge::config::executable_name, KataJudge::config::is_debug_build, KataJudge::config::project_fancy_name, KataJudge::config::project_version
#include <katajudge/executor.hpp>  // KataJudge::Executor, KataJudge::default_timeout
#include <katajudge/logging.hpp>   // logging::code, logging::color_support, logging::Color, logging::output, logging::Style, logging::warn
#include <katajudge/parser.hpp>    // KataJudge::trim
#include <katajudge/pipeline.hpp>  // KataJudge::entry_file_name, KataJudge::execution_args
#include <katajudge/runner.hpp>    // KataJudge::SubprocessRunner
#include <katajudge/scoring.hpp>   // KataJudge::combine_results, KataJudge::get_scoring_summary
#include <katajudge/toolchain.hpp> // KataJudge::check_dependencies, KataJudge::ToolchainConfig
#include <katajudge/types.hpp>     // KataJudge::available_languages, KataJudge::Language, KataJudge::parse_language, KataJudge::ScoringConfig
#include <katajudge/validator.hpp> // KataJudge::SyntaxValidator
#include <katajudge/workspace.hpp> // KataJudge::read_file

namespace
{

using command_pointer = int (*)(std::span<const std::string_view>);

using namespace std::string_view_literals;

constexpr auto end_of_options_token { "--"sv };
constexpr auto standard_input_token { "-"sv };

constexpr double weight_tolerance { 1e-9 };

struct Option
{
    const std::string_view name;
    const std::string_view short_name;
    const std::string_view help;
};

struct Command
{
    Option option;
    const command_pointer operation;
    std::span<const Option> options;

    /** Positional arguments, shown by the help of the command. */
    std::string_view usage;

    bool is_hidden { false };

    [[nodiscard]] constexpr bool is_option() const noexcept { return option.name.starts_with("--"); };
};

[[nodiscard]] constexpr auto operator==(const Option& option, std::string_view rhs) noexcept
{
    return option.name == rhs || option.short_name == rhs;
}

int run(std::span<const std::string_view> arguments);
int grade(std::span<const std::string_view> arguments);
int check(std::span<const std::string_view> arguments);
int deps(std::span<const std::string_view> arguments);
int help_subcommand(std::span<const std::string_view> arguments);

constexpr Option option_help {
    .name = "--help",
    .short_name = "-h",
    .help = "Print this message or the help of the given subcommand",
};

constexpr Option option_color {
    .name = "--color",
    .short_name = "-c",
    .help = R"(Enables color output with "true" or disables it with "false". By default it's automatic)",
};

constexpr Option option_code {
    .name = "--code",
    .short_name = "-s",
    .help = "The file holding the submission, or `-` to read it from stdin. By default it's the entry file of the kata"
};

constexpr Option option_hidden {
    .name = "--hidden",
    .short_name = {},
    .help = "Runs the hidden tests instead of the public ones"
};

constexpr Option option_timeout {
    .name = "--timeout",
    .short_name = "-t",
    .help = "Timeout of every started process in milliseconds. By default it's 5000 milliseconds"
};

constexpr Option option_json {
    .name = "--json",
    .short_name = {},
    .help = "Prints the result in JSON format"
};

constexpr Option option_python {
    .name = "--python",
    .short_name = {},
    .help = "The Python interpreter. By default it's `python3`"
};

constexpr Option option_node {
    .name = "--node",
    .short_name = {},
    .help = "The Node.js executable. By default it's `node`"
};

constexpr Option option_tsc {
    .name = "--tsc",
    .short_name = {},
    .help = "The TypeScript compiler. By default it's `tsc`"
};

constexpr Option option_cxx {
    .name = "--cxx",
    .short_name = {},
    .help = "The C++ compiler. By default it's `g++`"
};

constexpr Option option_public_weight {
    .name = "--public-weight",
    .short_name = {},
    .help = "Weight of the public score in the final score. By default it's 0.3"
};

constexpr Option option_hidden_weight {
    .name = "--hidden-weight",
    .short_name = {},
    .help = "Weight of the hidden score in the final score. By default it's 0.7"
};

constexpr Option option_threshold {
    .name = "--threshold",
    .short_name = {},
    .help = "The final score needed to pass. By default it's 70"
};

constexpr std::array run_parameters {
    option_code,
    option_hidden,
    option_timeout,
    option_json,
    option_python,
    option_node,
    option_tsc,
    option_cxx,
    option_help
};

constexpr std::array grade_parameters {
    option_code,
    option_timeout,
    option_public_weight,
    option_hidden_weight,
    option_threshold,
    option_json,
    option_python,
    option_node,
    option_tsc,
    option_cxx,
    option_help
};

constexpr std::array check_parameters {
    option_json,
    option_python,
    option_node,
    option_tsc,
    option_cxx,
    option_help
};

constexpr std::array deps_parameters {
    option_json,
    option_python,
    option_node,
    option_tsc,
    option_cxx,
    option_help
};

constexpr Command command_run {
    .option {
        .name = "run",
        .short_name = {},
        .help = "Runs a submission against the public or the hidden tests of a kata" },
    .operation = run,
    .options = run_parameters,
    .usage = "<LANGUAGE> <KATA_DIRECTORY>"
};

constexpr Command command_grade {
    .option {
        .name = "grade",
        .short_name = {},
        .help = "Runs a submission against both test suites of a kata and computes its final score" },
    .operation = grade,
    .options = grade_parameters,
    .usage = "<LANGUAGE> <KATA_DIRECTORY>"
};

constexpr Command command_check {
    .option {
        .name = "check",
        .short_name = {},
        .help = "Checks the syntax and the style of a source file without running it" },
    .operation = check,
    .options = check_parameters,
    .usage = "<LANGUAGE> <FILE>"
};

constexpr Command command_deps {
    .option {
        .name = "deps",
        .short_name = {},
        .help = "Reports which interpreters and compilers are available" },
    .operation = deps,
    .options = deps_parameters,
    .usage = {}
};

constexpr Command command_hidden_dependencies {
    .option {
        .name = "dependencies",
        .short_name = command_deps.option.short_name,
        .help = command_deps.option.help },
    .operation = command_deps.operation,
    .options = deps_parameters,
    .usage = {},
    .is_hidden = true
};

constexpr Command command_help {
    .option {
        .name = "help",
        .short_name = {},
        .help = "Print this message or the help of the given subcommand" },
    .operation = help_subcommand,
    .options = {},
    .usage = "[COMMAND]"
};

constexpr Command command_help_option {
    .option = option_help,
    .operation = nullptr,
    .options = {}
};

constexpr Command command_version {
    .option {
        .name = "--version",
        .short_name = "-v",
        .help = "Prints the version" },
    .operation = nullptr,
    .options = {}
};

constexpr Command command_color_option {
    .option = option_color,
    .operation = nullptr,
    .options = {}
};

constexpr std::array commands {
    command_run,
    command_grade,
    command_check,
    command_deps,
    command_hidden_dependencies,
    command_help,
    command_help_option,
    command_version,
    command_color_option
};

/** What the options of a command asked for, plus its positional arguments. */
struct Parameters
{
    std::vector<std::string_view> positional;
    std::optional<std::string_view> code_path;
    bool hidden { false };
    bool is_json { false };
    bool show_help { false };
    std::chrono::milliseconds timeout { KataJudge::default_timeout };
    KataJudge::ToolchainConfig toolchain;
    KataJudge::ScoringConfig scoring;
};

std::string_view parameter_of(std::span<const std::string_view> arguments, std::size_t i, const Option& option)
{
    if (i + 1 >= arguments.size())
        throw BadArgument { std::format("{:s}: {:s}: Missing parameter.", arguments.front(), option.name) };

    return arguments[i + 1];
}

template<typename Number>
Number number_of(std::span<const std::string_view> arguments, std::size_t i, const Option& option)
{
    const auto parameter { parameter_of(arguments, i, option) };

    Number value {};
    const auto [end, ec] = std::from_chars(parameter.data(), parameter.data() + parameter.size(), value);

    if (ec == std::errc::invalid_argument || end != parameter.data() + parameter.size())
        throw BadArgument { std::format("{:s}: {:s}: Invalid number.", arguments.front(), option.name) };

    if (ec == std::errc::result_out_of_range)
        throw BadArgument { std::format("{:s}: {:s}: The specified number is too big.", arguments.front(), option.name) };

    return value;
}

double weight_of(std::span<const std::string_view> arguments, std::size_t i, const Option& option)
{
    const auto value = number_of<double>(arguments, i, option);

    if (value < 0.0)
        throw BadArgument { std::format("{:s}: {:s}: The number must not be negative.", arguments.front(), option.name) };

    return value;
}

Parameters parse_parameters(std::span<const std::string_view> arguments, const Command& command)
{
    Parameters parameters;

    for (std::size_t i { 1 }; i < arguments.size(); ++i)
    {
        const auto argument { arguments[i] };

        const auto option = std::ranges::find_if(command.options, [argument](const Option& candidate)
            { return candidate == argument; });

        if (option == command.options.end())
        {
            if (argument.size() > 1 && argument.starts_with('-'))
                throw BadArgument { std::format("{:s}: Unknown parameter `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), argument, logging::code(logging::Style::Reset)) };

            parameters.positional.push_back(argument);
            continue;
        }

        const auto name { option->name };

        if (name == option_help.name)
        {
            parameters.show_help = true;
            break;
        }

        if (name == option_json.name)
            parameters.is_json = true;
        else if (name == option_hidden.name)
            parameters.hidden = true;
        else if (name == option_code.name)
            parameters.code_path = parameter_of(arguments, i++, *option);
        else if (name == option_python.name)
            parameters.toolchain.python = parameter_of(arguments, i++, *option);
        else if (name == option_node.name)
            parameters.toolchain.node = parameter_of(arguments, i++, *option);
        else if (name == option_tsc.name)
            parameters.toolchain.tsc = parameter_of(arguments, i++, *option);
        else if (name == option_cxx.name)
            parameters.toolchain.cxx = parameter_of(arguments, i++, *option);
        else if (name == option_timeout.name)
        {
            const auto milliseconds = number_of<std::chrono::milliseconds::rep>(arguments, i++, *option);

            if (milliseconds <= 0)
                throw BadArgument { std::format("{:s}: {:s}: The timeout must be greater than zero.", arguments.front(), option->name) };

            parameters.timeout = std::chrono::milliseconds { milliseconds };
        }
        else if (name == option_public_weight.name)
            parameters.scoring.public_weight = weight_of(arguments, i++, *option);
        else if (name == option_hidden_weight.name)
            parameters.scoring.hidden_weight = weight_of(arguments, i++, *option);
        else if (name == option_threshold.name)
            parameters.scoring.passing_threshold = number_of<double>(arguments, i++, *option);
    }

    return parameters;
}

void expect_positional(std::span<const std::string_view> arguments, const Parameters& parameters, std::span<const std::string_view> names)
{
    if (parameters.positional.size() < names.size())
        throw BadArgument { std::format("{:s}: Missing {:s}.", arguments.front(), names[parameters.positional.size()]) };

    if (parameters.positional.size() > names.size())
        throw BadArgument { std::format("{:s}: Unknown parameter `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), parameters.positional[names.size()], logging::code(logging::Style::Reset)) };
}

std::string language_list()
{
    std::string list;

    for (const auto& info : KataJudge::available_languages)
        list += std::format("{:s}\"{:s}\"", list.empty() ? "" : ", ", info.tag);

    return list;
}

KataJudge::Language language_of(std::span<const std::string_view> arguments, std::string_view tag)
{
    const auto language = KataJudge::parse_language(tag);

    if (!language.has_value())
        throw BadArgument { std::format("{:s}: Unknown language `{:s}{:s}{:s}`. Valid values are {:s}.", arguments.front(), logging::code(logging::Color::Blue), tag, logging::code(logging::Style::Reset), language_list()) };

    return *language;
}

std::filesystem::path kata_directory_of(std::span<const std::string_view> arguments, std::string_view given_path)
{
    std::filesystem::path directory { given_path };

    std::error_code error_code;

    if (!std::filesystem::is_directory(directory, error_code))
        throw BadArgument { std::format("{:s}: The kata directory `{:s}{:s}{:s}` does not exist.", arguments.front(), logging::code(logging::Color::Blue), given_path, logging::code(logging::Style::Reset)) };

    return directory;
}

std::string read_source(std::string_view path)
{
    if (path == standard_input_token)
    {
        std::ostringstream ostringstream;
        ostringstream << std::cin.rdbuf();

        return std::move(ostringstream).str();
    }

    return KataJudge::read_file(std::filesystem::path { path });
}

std::string read_submission(const Parameters& parameters, KataJudge::Language language, const std::filesystem::path& kata_directory)
{
    if (parameters.code_path.has_value())
        return read_source(*parameters.code_path);

    return KataJudge::read_file(kata_directory / KataJudge::entry_file_name(language));
}

void print_heading(std::string_view heading)
{
    std::println("{:s}{:s}{:s}{:s}:", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), heading, logging::code(logging::Style::Reset));
}

void print_test_results(std::span<const KataJudge::TestResult> results)
{
    if (results.empty())
    {
        std::println("  No test results.");
        return;
    }

    for (const auto& result : results)
    {
        if (result.passed)
        {
            std::println("  {:s}{:s}PASS{:s} {:s}", logging::code(logging::Style::Bold), logging::code(logging::Color::Green), logging::code(logging::Style::Reset), result.name);
            continue;
        }

        std::println("  {:s}{:s}FAIL{:s} {:s}{:s}", logging::code(logging::Style::Bold), logging::code(logging::Color::Red), logging::code(logging::Style::Reset), result.name, result.message.has_value() ? std::format(": {:s}", *result.message) : std::string {});

        if (result.input.has_value())
            std::println("       Input:    {:s}", *result.input);

        if (result.expected.has_value())
            std::println("       Expected: {:s}", result.expected->dump());

        if (result.actual.has_value())
            std::println("       Actual:   {:s}", result.actual->dump());
    }
}

void print_execution_result(const KataJudge::ExecutionResult& result)
{
    print_heading("Tests");
    print_test_results(result.test_results);

    if (!result.success)
    {
        if (const auto output = KataJudge::trim(result.output); !output.empty())
        {
            std::println();
            print_heading("Output");
            std::println("{:s}", output);
        }

        if (const auto errors = KataJudge::trim(result.errors); !errors.empty())
        {
            std::println();
            print_heading("Errors");
            std::println("{:s}", errors);
        }
    }

    std::println("\n{0:s}Score{1:s}: {2:s}{3:.1f}%{1:s} in {2:s}{4:d}{1:s} ms.", logging::code(logging::Style::Bold), logging::code(logging::Style::Reset), logging::code(logging::Color::Blue), result.score.value_or(0.0), result.duration.count());
}

int print_help()
{
    static constexpr auto largest_command = std::ranges::max_element(commands,
        {}, [](const Command& command)
        { return command.is_option() || command.is_hidden ? std::string_view::size_type {} : command.option.name.length(); })
                                                ->option.name.length();

    static constexpr auto largest_option = std::ranges::max_element(commands,
        {}, [](const Command& command)
        { return !command.is_option() ? std::string_view::size_type {} : command.option.name.length(); })
                                               ->option.name.length();

    std::println("{:s} runs and grades kata submissions written in Python, JavaScript, TypeScript and C++.", KataJudge::config::project_fancy_name);

    std::println("\n{0:}{1:}Usage{2:}: ./{3:s} [COMMAND]\n\n{0:}{1:}Commands{2:}:", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset), KataJudge::config::executable_name);

    for (const auto& command : commands | std::views::filter([](const auto& command)
                                   { return !command.is_option() && !command.is_hidden; }))
        std::println("  {:<{}}  {}", command.option.name, largest_command, command.option.help);

    std::println("\n{}{}Options{}:", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset));
    for (const auto& option : commands | std::views::filter([](const auto& option)
                                  { return option.is_option() && !option.is_hidden; }))
        std::println("  {}, {:<{}}  {}", option.option.short_name, option.option.name, largest_option, option.option.help);

    std::println("\n{:s}{:s}Languages{:s}: {:s}", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset), language_list());

    return EXIT_SUCCESS;
}

int help_subcommand(const Command& command)
{
    std::println("{}", command.option.help);

    std::println("\n{:s}{:s}Usage{:s}: ./{:s} {:s} {:s}", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset), KataJudge::config::executable_name, command.option.name, command.usage);

    const auto largest_option = std::ranges::max_element(command.options,
        {}, [](const Option& option)
        { return option.name.length(); });

    if (largest_option != command.options.end())
    {
        const auto largest_option_length = largest_option->name.length();

        std::println("\n{:s}{:s}Options{:s}:", logging::code(logging::Style::Bold), logging::code(logging::Style::Underline), logging::code(logging::Style::Reset));
        for (const auto& option : command.options)
        {
            if (option.short_name.empty())
                std::println("      {:<{}}  {}", option.name, largest_option_length, option.help);
            else
                std::println("  {}, {:<{}}  {}", option.short_name, option.name, largest_option_length, option.help);
        }
    }

    return EXIT_SUCCESS;
}

int help_subcommand(std::span<const std::string_view> arguments)
{
    // No arguments, or asking for help for ourselves.
    if (arguments.size() < 2 || arguments[1] == option_help || arguments[1] == arguments.front())
        return print_help();

    if (arguments.size() > 2)
        throw BadArgument { std::format("{:s}: Too many arguments.", arguments.front()) };

    const auto* const command = std::ranges::find_if(commands, [subcommand = arguments.back()](const auto& command)
        { return !command.is_option() && command.option.name == subcommand; });

    if (command == commands.end())
        throw BadArgument { std::format("{:s}: Unknown command `{:s}{:s}{:s}`.", arguments.front(), logging::code(logging::Color::Blue), arguments.back(), logging::code(logging::Style::Reset)) };

    return help_subcommand(*command);
}

int run(std::span<const std::string_view> arguments)
{
    const auto parameters = parse_parameters(arguments, command_run);

    if (parameters.show_help)
        return help_subcommand(command_run);

    static constexpr std::array positional_names { "language"sv, "kata directory"sv };
    expect_positional(arguments, parameters, positional_names);

    const auto language = language_of(arguments, parameters.positional[0]);
    const auto kata_directory = kata_directory_of(arguments, parameters.positional[1]);
    const auto code = read_submission(parameters, language, kata_directory);

    KataJudge::SubprocessRunner runner;
    const KataJudge::Executor executor { runner, parameters.toolchain };

    const auto result = executor.execute_code(language, KataJudge::execution_args { .user_code = code, .test_file_name = {}, .kata_dir = kata_directory, .hidden = parameters.hidden, .timeout = parameters.timeout });

    if (parameters.is_json)
        std::println("{:s}", nlohmann::json(result).dump());
    else
        print_execution_result(result);

    return result.success ? EXIT_SUCCESS : EXIT_FAILURE;
}

int grade(std::span<const std::string_view> arguments)
{
    const auto parameters = parse_parameters(arguments, command_grade);

    if (parameters.show_help)
        return help_subcommand(command_grade);

    static constexpr std::array positional_names { "language"sv, "kata directory"sv };
    expect_positional(arguments, parameters, positional_names);

    const auto language = language_of(arguments, parameters.positional[0]);
    const auto kata_directory = kata_directory_of(arguments, parameters.positional[1]);
    const auto code = read_submission(parameters, language, kata_directory);

    if (const auto total_weight = parameters.scoring.public_weight + parameters.scoring.hidden_weight; std::abs(total_weight - 1.0) > weight_tolerance)
        logging::warn("The weights add up to {:g} instead of 1.", total_weight);

    // Progress goes to stderr and is silenced for JSON output.
    auto progress = parameters.is_json ? logging::output {} : logging::output { std::cerr };

    KataJudge::SubprocessRunner runner;
    const KataJudge::Executor executor { runner, parameters.toolchain };

    progress.println("Running the public tests...");
    const auto public_result = executor.execute_code(language, KataJudge::execution_args { .user_code = code, .test_file_name = {}, .kata_dir = kata_directory, .hidden = false, .timeout = parameters.timeout });

    progress.println("Running the hidden tests...");
    const auto hidden_result = executor.execute_code(language, KataJudge::execution_args { .user_code = code, .test_file_name = {}, .kata_dir = kata_directory, .hidden = true, .timeout = parameters.timeout });

    const auto combined = KataJudge::combine_results(public_result, hidden_result, parameters.scoring);
    const auto summary = KataJudge::get_scoring_summary(combined, parameters.scoring);

    if (parameters.is_json)
    {
        const nlohmann::json json {
            { "result", combined },
            { "summary", summary }
        };

        std::println("{:s}", json.dump());
    }
    else
    {
        print_execution_result(combined);

        std::println();
        print_heading("Summary");
        std::println("  Public score: {0:s}{2:.1f}%{1:s} (weight {3:g})\n  Hidden score: {0:s}{4:.1f}%{1:s} (weight {5:g})\n  Final score:  {0:s}{6:.1f}%{1:s} (threshold {7:g})", logging::code(logging::Color::Blue), logging::code(logging::Style::Reset), summary.public_score, summary.public_weight, summary.hidden_score, summary.hidden_weight, summary.final_score, parameters.scoring.passing_threshold);

        if (summary.passed)
            std::println("\n{:s}{:s}Passed{:s}", logging::code(logging::Style::Bold), logging::code(logging::Color::Green), logging::code(logging::Style::Reset));
        else
            std::println("\n{:s}{:s}Failed{:s}", logging::code(logging::Style::Bold), logging::code(logging::Color::Red), logging::code(logging::Style::Reset));
    }

    return summary.passed ? EXIT_SUCCESS : EXIT_FAILURE;
}

int check(std::span<const std::string_view> arguments)
{
    const auto parameters = parse_parameters(arguments, command_check);

    if (parameters.show_help)
        return help_subcommand(command_check);

    static constexpr std::array positional_names { "language"sv, "file"sv };
    expect_positional(arguments, parameters, positional_names);

    const auto code = read_source(parameters.positional[1]);

    KataJudge::SubprocessRunner runner;
    const KataJudge::SyntaxValidator validator { runner, parameters.toolchain };

    const auto result = validator.check_syntax(code, parameters.positional[0]);

    if (parameters.is_json)
    {
        std::println("{:s}", nlohmann::json(result).dump());

        return result.is_valid ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    for (const auto& error : result.errors)
    {
        const auto location = error.file.has_value()
            ? std::format("{:s}{:s}: ", *error.file, error.line.has_value() ? std::format(":{:d}", *error.line) : std::string {})
            : std::string {};

        std::println("{:s}{:s}{:s}{:s} error{:s}: {:s}", location, logging::code(logging::Style::Bold), logging::code(logging::Color::Red), KataJudge::to_string(error.type), logging::code(logging::Style::Reset), error.message);
    }

    for (const auto& warning : result.warnings)
    {
        std::println("{:s}{:s}{:s} warning{:s}: {:s}", logging::code(logging::Style::Bold), logging::code(logging::Color::Yellow), KataJudge::to_string(warning.type), logging::code(logging::Style::Reset), warning.message);

        if (warning.suggestion.has_value())
            std::println("  {:s}", *warning.suggestion);
    }

    for (const auto& suggestion : result.suggestions)
        std::println("{:s}{:s}note{:s}: {:s}", logging::code(logging::Style::Bold), logging::code(logging::Color::Cyan), logging::code(logging::Style::Reset), suggestion);

    if (result.is_valid)
        std::println("{:s}{:s}No errors found{:s}", logging::code(logging::Style::Bold), logging::code(logging::Color::Green), logging::code(logging::Style::Reset));

    return result.is_valid ? EXIT_SUCCESS : EXIT_FAILURE;
}

void print_dependency(const KataJudge::DependencyStatus& status)
{
    if (status.available)
    {
        std::println("  {:s}: {:s}{:s}{:s}", status.name, logging::code(logging::Color::Green), status.version.value_or("available"), logging::code(logging::Style::Reset));
        return;
    }

    std::println("  {:s}: {:s}{:s}{:s}", status.name, logging::code(logging::Color::Red), status.error.value_or("not available"), logging::code(logging::Style::Reset));

    if (status.installation_guide.has_value())
        std::println("    {:s}", *status.installation_guide);
}

int deps(std::span<const std::string_view> arguments)
{
    const auto parameters = parse_parameters(arguments, command_deps);

    if (parameters.show_help)
        return help_subcommand(command_deps);

    expect_positional(arguments, parameters, {});

    KataJudge::SubprocessRunner runner;

    const auto dependencies = KataJudge::check_dependencies(runner, parameters.toolchain);

    if (parameters.is_json)
        std::println("{:s}", nlohmann::json(dependencies).dump());
    else
    {
        print_heading("Dependencies");

        for (const auto* status : { &dependencies.python, &dependencies.nodejs, &dependencies.typescript, &dependencies.cpp })
            print_dependency(*status);
    }

    return dependencies.all_available ? EXIT_SUCCESS : EXIT_FAILURE;
}

int print_version()
{
    std::println("{:s} {:s}", KataJudge::config::project_fancy_name, KataJudge::config::project_version);

    if constexpr (KataJudge::config::is_debug_build)
        std::println("\nDebug build.");

    return EXIT_SUCCESS;
}
}

int parse_arguments(std::span<const char* const> argv)
{
    if (argv.size() < 2)
        return print_help();

    std::vector<std::string_view> arguments;

    // Identify global toggles and remove them from the argument list.
    for (std::size_t i { 1 }; i < argv.size(); ++i)
    {
        const std::string_view argument { argv[i] };

        if (argument == option_help && arguments.empty())
            return print_help();

        if (argument == command_version.option && arguments.empty())
            return print_version();

        if (argument == option_color)
        {
            if (i + 1 >= argv.size())
                throw BadArgument { std::format("{:s}: Missing parameter.", option_color.name) };

            const std::string_view value { argv[i + 1] };

            bool should_have_color = false;

            static constexpr auto value_true { "true"sv };
            static constexpr auto value_false { "false"sv };

            if (value == value_true)
                should_have_color = true;
            else if (value == value_false)
                should_have_color = false;
            else
                throw BadArgument { std::format(R"({:s}: Unknown value `{:s}{:s}{:s}`. Valid values are "{:s}" and "{:s}".)", option_color.name, logging::code(logging::Color::Blue), value, logging::code(logging::Style::Reset), value_true, value_false) };

            logging::color_support::set(should_have_color, should_have_color);

            ++i;
        }
        else if (argument == end_of_options_token)
        {
            // We won't find any arguments after the delimiter.
            for (std::size_t j { i + 1 }; j < argv.size(); ++j)
                arguments.emplace_back(argv[j]);

            break;
        }
        else
            arguments.emplace_back(argument);
    }

    const std::span arguments_span { arguments };

    if (!arguments_span.empty())
    {
        for (const auto& command : commands)
            if (command.operation != nullptr && arguments_span.front() == command.option)
                // The command's options will be handled by itself.
                return command.operation(arguments_span);

        // If we have reached this point, we have found an argument that does not match
        // our commands or our global arguments.
        throw BadArgument { std::format("Unknown command or option `{:s}{:s}{:s}`.", logging::code(logging::Color::Blue), arguments_span.front(), logging::code(logging::Style::Reset)) };
    }

    // If we have reached this point, we have found no commands to execute.
    return print_help();
}
