#ifndef LQY_OPTIONS_H
#define LQY_OPTIONS_H

#include <string>
#include <vector>
#include "cli.h"
#include "prompt.h"

namespace lqy
{
namespace defaults
{
const std::string VERSION     = "0.3";
const std::string NAME        = "lqy";
const std::string DESCRIPTION = "Ask a large language model from the shell";
} // namespace defaults

class options
{
public:
    options()
        : config_file(), json_output(false), yaml_output(false),
          max_input_tokens(defaults::MAX_INPUT_TOKENS), show_version(false),
          words{}
    {
    }

    // Empty means the file under the home directory.
    std::string              config_file;
    bool                     json_output;
    bool                     yaml_output;
    int                      max_input_tokens;
    bool                     show_version;
    std::vector<std::string> words;

    output_format format() const
    {
        return resolve_output_format(json_output, yaml_output);
    }

    static options parse(int argc, char** argv);

    static std::string get_shell_doc() { return "[QUESTION...]"; }
    static std::string get_shell_title();
    static std::string usage_text();

    static std::vector<argp_option> get_shell_options();
    static int from_shell_arg(int key, char* arg, struct argp_state* state,
                              options& opts);
};
} // namespace lqy

#endif
