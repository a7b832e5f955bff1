#define BOOST_TEST_MODULE test_arguments
#include <boost/test/unit_test.hpp>

#include <array>   // std::array
#include <cstdlib> // EXIT_SUCCESS
#include <span>    // std::span
#include <string>  // std::string

#include <arguments.hpp> // BadArgument, parse_arguments

#include <katajudge/workspace.hpp> // KataJudge::Workspace

BOOST_AUTO_TEST_CASE(test_arguments)
{
    BOOST_CHECK_NO_THROW(parse_arguments({}));
    BOOST_REQUIRE_THROW(parse_arguments(std::array { "test", "unknown_argument" }), BadArgument);
}

BOOST_AUTO_TEST_CASE(help_and_version)
{
    BOOST_CHECK_EQUAL(parse_arguments(std::array { "test" }), EXIT_SUCCESS);
    BOOST_CHECK_EQUAL(parse_arguments(std::array { "test", "--help" }), EXIT_SUCCESS);
    BOOST_CHECK_EQUAL(parse_arguments(std::array { "test", "-v" }), EXIT_SUCCESS);
    BOOST_CHECK_EQUAL(parse_arguments(std::array { "test", "help", "grade" }), EXIT_SUCCESS);
    BOOST_CHECK_EQUAL(parse_arguments(std::array { "test", "run", "--help" }), EXIT_SUCCESS);
    BOOST_CHECK_EQUAL(parse_arguments(std::array { "test", "--color", "false", "check", "-h" }), EXIT_SUCCESS);

    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "help", "unknown" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "help", "run", "grade" }), BadArgument);
}

BOOST_AUTO_TEST_CASE(color_values)
{
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "--color" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "--color", "sometimes" }), BadArgument);
    BOOST_CHECK_EQUAL(parse_arguments(std::array { "test", "-c", "false" }), EXIT_SUCCESS);
}

BOOST_AUTO_TEST_CASE(malformed_commands)
{
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "grade", "py", "kata", "extra" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "--unknown", "py", "kata" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "check", "py" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "deps", "extra" }), BadArgument);
}

BOOST_AUTO_TEST_CASE(invalid_values)
{
    const KataJudge::Workspace kata { "katajudge-arguments-test" };
    const auto kata_path = kata.path().string();

    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "rb", kata_path.c_str() }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", kata_path.c_str(), "--timeout" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", kata_path.c_str(), "--timeout", "soon" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", kata_path.c_str(), "--timeout", "0" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", kata_path.c_str(), "-t", "99999999999999999999999" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", kata_path.c_str(), "-t", "9223372036854775808" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", kata_path.c_str(), "-t", "18446744073709551615" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", kata_path.c_str(), "-t", "-5" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "grade", "py", kata_path.c_str(), "--hidden-weight", "-0.5" }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "grade", "py", kata_path.c_str(), "--threshold", "high" }), BadArgument);
}

BOOST_AUTO_TEST_CASE(missing_kata_directory)
{
    std::string missing;

    {
        const KataJudge::Workspace scratch { "katajudge-arguments-test" };
        missing = scratch.path().string();
    }

    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "run", "py", missing.c_str() }), BadArgument);
    BOOST_CHECK_THROW(parse_arguments(std::array { "test", "grade", "cpp", missing.c_str() }), BadArgument);
}
