#ifndef LQY_APP_H
#define LQY_APP_H

#include <iosfwd>
#include <string>
#include "net.h"
#include "options.h"

namespace lqy
{
// One question, one answer. Every failure maps to EXIT_FAILURE.
class app
{
public:
    app(const options& o, bool stdin_piped);
    app(const options& o, bool stdin_piped, net::sender send);

    // Colorize the stderr tags.
    bool colorize = false;

    int run(std::istream& in, std::ostream& out, std::ostream& err);

private:
    options     opts_;
    bool        stdin_piped_;
    net::sender send_;

    std::string error_tag_string(const std::string& name) const;
    std::string read_prompt(std::istream& in) const;
};
} // namespace lqy

#endif
