#include "options.h"
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace
{
enum option_key
{
    KEY_OJSON      = -1,
    KEY_OYAML      = -2,
    KEY_MAX_TOKENS = -3,
};
} // namespace

lqy::options lqy::options::parse(int argc, char** argv)
{
    cli::shell_args<options> parsed_args(argc, argv, get_shell_options(),
                                         from_shell_arg, get_shell_doc(),
                                         get_shell_title(),
                                         ARGP_LONG_ONLY | ARGP_IN_ORDER);
    return parsed_args.get_arguments();
}

std::string lqy::options::get_shell_title()
{
    return defaults::NAME + " -- " + defaults::DESCRIPTION +
           "\vStandard input, when piped, is sent as context for the "
           "question.\n\n"
           "Examples:\n"
           "  lqy how do I list listening ports\n"
           "  dmesg | lqy -ojson summarize the errors";
}

std::string lqy::options::usage_text()
{
    return "Usage: " + defaults::NAME +
           " [--config <filepath>] [-ojson|-oyaml] [--max-tokens <number>] "
           "<input>\n"
           "   or: <command> | " +
           defaults::NAME +
           " [-ojson|-oyaml] [--max-tokens <number>] <question>\n";
}

std::vector<argp_option> lqy::options::get_shell_options()
{
    return {
        {"config", 'c', "FILE", 0,
         "Path to config file (default ~/.lqyconfig.yaml)", 0},
        {"output", 'o', "FORMAT", 0,
         "Ask for the whole response as FORMAT, 'json' or 'yaml'", 0},
        {"ojson", KEY_OJSON, 0, 0, "Request JSON-structured output", 0},
        {"oyaml", KEY_OYAML, 0, 0, "Request YAML-structured output", 0},
        {"max-tokens", KEY_MAX_TOKENS, "INTEGER", 0,
         "Approximate token budget for the input (default 8000)", 0},
        {"version", 'v', 0, 0, "Show version", 0}};
}

int lqy::options::from_shell_arg(int key, char* arg, struct argp_state* state,
                                 options& opts)
{
    switch (key)
    {
    case 'c':
        opts.config_file = arg;
        break;
    case 'o':
    {
        std::string fmt = arg ? arg : "";
        if (fmt == "json")
            opts.json_output = true;
        else if (fmt == "yaml")
            opts.yaml_output = true;
        else
            argp_error(state, "unknown output format '%s'", fmt.c_str());
    }
    break;
    case KEY_OJSON:
        opts.json_output = true;
        break;
    case KEY_OYAML:
        opts.yaml_output = true;
        break;
    case KEY_MAX_TOKENS:
    {
        char* end = nullptr;
        errno     = 0;
        long n    = std::strtol(arg, &end, 10);
        if (end == arg || *end != '\0' || errno == ERANGE || n <= 0 ||
            n > INT_MAX / 4)
            argp_error(state, "--max-tokens must be a positive integer");
        opts.max_input_tokens = static_cast<int>(n);
    }
    break;
    case 'v':
        opts.show_version = true;
        break;
    case ARGP_KEY_ARG:
        // Options end at the first word; "grep -v" belongs to the question.
        opts.words.push_back(arg);
        for (int i = state->next; i < state->argc; i++)
            opts.words.push_back(state->argv[i]);
        state->next = state->argc;
        break;
    case ARGP_KEY_END:
        break;
    default:
        return ARGP_ERR_UNKNOWN;
    }
    return 0;
}
