#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <chrono>          // std::chrono::floor, std::chrono::milliseconds, std::chrono::system_clock
#include <concepts>        // std::same_as
#include <cstdint>         // std::uint8_t
#include <cstdio>          // stdout, stderr
#include <cstdlib>         // std::getenv
#include <filesystem>      // std::filesystem::path
#include <format>          // std::format, std::format_string
#include <memory>          // std::addressof
#include <ostream>         // std::print (std::ostream overload)
#include <print>           // std::print
#include <source_location> // std::source_location, std::source_location::current
#include <string>          // std::string
#include <string_view>     // std::string_view
#include <type_traits>     // std::is_same_v, std::remove_cvref_t
#include <utility>         // std::forward, std::to_underlying

#if defined(__unix__) || defined(__APPLE__)
#    include <unistd.h> // isatty, fileno
#endif

/** Debug-only logging, compiled out when `NDEBUG` is defined. */
#ifndef NDEBUG
#    define logd(format, ...) logging::log(format, ##__VA_ARGS__)
#else
#    define logd(...) static_cast<void>(0)
#endif

/**
 * @file
 * @brief Terminal colours and diagnostic logging.
 */
namespace logging
{

/**
 * Returns the path as UTF-8. No copy is made when the native representation
 * already is a narrow string.
 */
inline decltype(auto) path_to_utf8(const std::filesystem::path& path)
{
    if constexpr (std::is_same_v<std::filesystem::path::string_type, std::string>)
        return path.native();
    else
    {
        const auto str { path.u8string() };

        return std::string(reinterpret_cast<const char*>(str.data()), str.size());
    }
}

/** Which standard stream a piece of text is meant for. */
enum class OutputType : bool
{
    StandardOutput,
    StandardError
};

/** Colour support of the two standard streams. */
class color_support
{
    static inline bool have_color_stdout = false,
                       have_color_stderr = false;

public:
    color_support() = delete;

    /**
     * Enables colours on the streams that are attached to a terminal, unless
     * `NO_COLOR` is set to a non-empty value.
     */
    static void check() noexcept
    {
        if (const auto* no_color = std::getenv("NO_COLOR"); no_color != nullptr && *no_color != '\0')
            return;

#if defined(__unix__) || defined(__APPLE__)
        have_color_stdout = isatty(fileno(stdout)) != 0;
        have_color_stderr = isatty(fileno(stderr)) != 0;
#endif
    }

    /** Overrides the detected support, used by `--color`. */
    static void set(bool color_stdout, bool color_stderr) noexcept
    {
        have_color_stdout = color_stdout;
        have_color_stderr = color_stderr;
    }

    template<OutputType output_type = OutputType::StandardOutput>
    [[nodiscard]] static bool get() noexcept
    {
        if constexpr (output_type == OutputType::StandardOutput)
            return have_color_stdout;
        else
            return have_color_stderr;
    }
};

enum class Color : std::uint8_t
{
    Default = 39,
    Red = 31,
    Green = 32,
    Yellow = 33,
    Blue = 34,
    Magenta = 35,
    Cyan = 36,
    BrightBlack = 90
};

enum class Style : std::uint8_t
{
    Reset = 0,
    Bold = 1,
    Underline = 4
};

/**
 * Returns the ANSI escape sequence for a colour or a style, or an empty string
 * when the target stream has no colour support.
 */
template<OutputType output_type = OutputType::StandardOutput>
std::string code(auto&& value)
    requires(std::same_as<std::remove_cvref_t<decltype(value)>, Color> || std::same_as<std::remove_cvref_t<decltype(value)>, Style>)
{
    if (!color_support::get<output_type>())
        return {};

    return std::format("\u001b[{:d}m", std::to_underlying(value));
}

/**
 * Debug log line on `stderr` with the time of day, the source file name and
 * the line. Use through `logd`.
 */
template<typename... Args>
struct log
{
    log(std::format_string<Args...> fmt, Args&&... args, const std::source_location& loc = std::source_location::current())
    {
        const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
        const auto file = std::filesystem::path { loc.file_name() }.filename();

        std::print(stderr, "[{}{:%T}{}] [{}{}DEBUG{}] {}:{}: {}\n", code<OutputType::StandardError>(Style::Bold), now, code<OutputType::StandardError>(Style::Reset), code<OutputType::StandardError>(Color::Magenta), code<OutputType::StandardError>(Style::Bold), code<OutputType::StandardError>(Style::Reset), path_to_utf8(file), loc.line(), std::format(fmt, std::forward<Args>(args)...));
    }
};

template<typename... Args>
log(std::format_string<Args...> fmt, Args&&... args) -> log<Args...>;

/** Warning line on `stderr`. Emitted in every build type. */
template<typename... Args>
struct warn
{
    warn(std::format_string<Args...> fmt, Args&&... args)
    {
        std::print(stderr, "{}{}Warning{}: {}\n", code<OutputType::StandardError>(Style::Bold), code<OutputType::StandardError>(Color::Yellow), code<OutputType::StandardError>(Style::Reset), std::format(fmt, std::forward<Args>(args)...));
    }
};

template<typename... Args>
warn(std::format_string<Args...> fmt, Args&&... args) -> warn<Args...>;

/**
 * An optional reference to a `std::ostream`. Printing through an empty
 * output does nothing, so callers can silence progress reports.
 */
class output
{
public:
    using T = std::ostream;

    constexpr explicit output(T& ostream) noexcept :
        m_ostream { std::addressof(ostream) } { }

    constexpr output() noexcept :
        m_ostream(nullptr) { }

    template<typename... Args>
    void print(std::format_string<Args...> fmt, Args&&... args)
    {
        if (m_ostream != nullptr)
            std::print(*m_ostream, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void println(std::format_string<Args...> fmt, Args&&... args)
    {
        if (m_ostream != nullptr)
            std::println(*m_ostream, fmt, std::forward<Args>(args)...);
    }

    [[nodiscard]] constexpr bool has_value() const noexcept { return m_ostream != nullptr; }

    [[nodiscard]] constexpr explicit operator bool() const noexcept { return has_value(); }

private:
    T* m_ostream;
};

} // namespace logging

#endif
