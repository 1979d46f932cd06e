#include "cli.h"
#include <unistd.h>
#include <iterator>

namespace cli
{
std::string format_code(format fmt)
{
    switch (fmt)
    {
    case format::RED:
        return "\033[0;31m";
    case format::RESET:
        return "\033[0m";
    default:
        return "\033[0m";
    }
}

std::string set_format(const std::string& text, format fmt)
{
    return format_code(fmt) + text + format_code(format::RESET);
}

std::string tag_string(const std::string& name, format fmt, bool colorize)
{
    return "[" + (colorize ? set_format(name, fmt) : name) + "] ";
}

bool stdin_is_terminal() { return isatty(STDIN_FILENO) != 0; }

bool stderr_is_terminal() { return isatty(STDERR_FILENO) != 0; }

std::string read_stream(std::istream& stream)
{
    return std::string((std::istreambuf_iterator<char>(stream)),
                       std::istreambuf_iterator<char>());
}
} // namespace cli
