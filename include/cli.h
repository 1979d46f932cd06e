#ifndef LQY_CLI_H
#define LQY_CLI_H

#include <argp.h>
#include <cstdlib>
#include <vector>
#include <string>
#include <functional>
#include <istream>

namespace cli
{
enum class format
{
	RED,
	RESET,
};

std::string format_code(format fmt);
std::string set_format(const std::string& text, format fmt);
std::string tag_string(const std::string& name, format fmt, bool colorize);

bool		stdin_is_terminal();
bool		stderr_is_terminal();
std::string read_stream(std::istream& stream);

template <typename T> class shell_args
{
public:
	using parse_function =
		std::function<error_t(int, char*, struct argp_state*, T&)>;

	shell_args(int argc, char** argv, const std::vector<argp_option>& options,
			   parse_function	  parse_func,
			   const std::string& args_doc = get_default_args_doc(),
			   const std::string& doc	   = get_default_doc(),
			   unsigned			  flags	   = 0)
		: arguments_(), parse_func_(parse_func)
	{
		std::vector<argp_option> options_copy = options;
		options_copy.push_back({});

		argp argp = {options_copy.data(),
					 &shell_args::parse_opt_wrapper,
					 args_doc.c_str(),
					 doc.c_str(),
					 nullptr,
					 nullptr,
					 nullptr};

		argp_err_exit_status = EXIT_FAILURE;
		argp_parse(&argp, argc, argv, flags, nullptr, this);
	}

	T get_arguments() const { return arguments_; }

private:
	T			   arguments_;
	parse_function parse_func_;

	static error_t parse_opt_wrapper(int key, char* arg,
									 struct argp_state* state)
	{
		shell_args* self = (shell_args*)(state->input);
		return self->parse_func_(key, arg, state, self->arguments_);
	}

	static std::string get_default_args_doc() { return "ARG"; }
	static std::string get_default_doc() { return "A program with options"; }
};

} // namespace cli

#endif
