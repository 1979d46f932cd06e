#include "app.h"
#include "cli.h"
#include "completion.h"
#include "config.h"
#include "errors.h"
#include "prompt.h"
#include <cstdlib>
#include <iostream>
#include <utility>

lqy::app::app(const options& o, bool stdin_piped)
    : app(o, stdin_piped, [](const net::request& req) { return req.send(); })
{
}

lqy::app::app(const options& o, bool stdin_piped, net::sender send)
    : opts_(o), stdin_piped_(stdin_piped), send_(std::move(send))
{
}

std::string lqy::app::error_tag_string(const std::string& name) const
{
    return cli::tag_string(name, cli::format::RED, colorize);
}

std::string lqy::app::read_prompt(std::istream& in) const
{
    input_source input;
    if (stdin_piped_)
        input.stdin_text = cli::read_stream(in);
    input.arg_text = join_words(opts_.words);
    return assemble_prompt(input);
}

int lqy::app::run(std::istream& in, std::ostream& out, std::ostream& err)
{
    if (opts_.show_version)
    {
        out << defaults::NAME << " v" << defaults::VERSION << std::endl;
        return EXIT_SUCCESS;
    }

    output_format format = output_format::NONE;
    try
    {
        format = opts_.format();
    }
    catch (const usage_error& e)
    {
        err << error_tag_string("Usage Error") << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    config cfg;
    try
    {
        cfg = config::load(opts_.config_file.empty() ? config::default_path()
                                                     : opts_.config_file);
    }
    catch (const config_error& e)
    {
        err << error_tag_string("Config Error") << "Error loading config: "
            << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::string prompt;
    try
    {
        prompt = read_prompt(in);
    }
    catch (const usage_error&)
    {
        out << options::usage_text();
        out.flush();
        return EXIT_FAILURE;
    }

    // The hint goes in first, so a long prompt can lose it to truncation.
    prompt = truncate_prompt(append_hint(prompt, format), opts_.max_input_tokens);

    try
    {
        completion_client client(cfg, send_);
        out << client.complete(prompt);
        out.flush();
    }
    catch (const network_error& e)
    {
        err << error_tag_string("Network Error") << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const api_error& e)
    {
        err << error_tag_string("API Error") << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const parse_error& e)
    {
        err << error_tag_string("Parse Error") << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const no_choices_error& e)
    {
        err << error_tag_string("Response Error") << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
