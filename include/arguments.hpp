#ifndef ARGUMENTS_HPP
#define ARGUMENTS_HPP

#include <span>      // std::span
#include <stdexcept> // std::runtime_error

/**
 * @file
 * @brief Argument handling.
 */

/** Thrown when an unrecognized or malformed argument is detected. */
class BadArgument : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * Parses the arguments given through `argv` and runs the selected command.
 *
 * @returns The exit code of the program.
 */
int parse_arguments(std::span<const char* const> argv);

#endif
