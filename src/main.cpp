#include <cstdlib>   // EXIT_FAILURE
#include <exception> // std::exception
#include <iostream>  // std::cerr
#include <print>     // std::println
#include <span>      // std::span

#include <arguments.hpp>         // BadArgument, parse_arguments
#include <build/config.hpp>      // KataJudge::config::executable_name
#include <katajudge/logging.hpp> // logging::color_support::check, logging::code, logging::Color, logging::OutputType, logging::Style

int main(int argc, const char** argv)
{
    try
    {
        logging::color_support::check();

        return parse_arguments(std::span { argv, argv + argc });
    }
    catch (const BadArgument& e)
    {
        std::println(std::cerr, "{}{}Error{}: {:s}", logging::code<logging::OutputType::StandardError>(logging::Style::Bold), logging::code<logging::OutputType::StandardError>(logging::Color::Red), logging::code<logging::OutputType::StandardError>(logging::Style::Reset), e.what());
        std::println(std::cerr, "Run `{:s} --help` for the list of commands.", KataJudge::config::executable_name);

        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::println(std::cerr, "{}{}Error{}: {:s}", logging::code<logging::OutputType::StandardError>(logging::Style::Bold), logging::code<logging::OutputType::StandardError>(logging::Color::Red), logging::code<logging::OutputType::StandardError>(logging::Style::Reset), e.what());

        return EXIT_FAILURE;
    }
}
