#ifndef LQY_PROMPT_H
#define LQY_PROMPT_H

#include <cstddef>
#include <string>
#include <vector>

namespace lqy
{
namespace defaults
{
constexpr int     MAX_INPUT_TOKENS = 8000;
constexpr int     CHARS_PER_TOKEN  = 4;
const std::string TRUNCATION_MARKER = "\n...(input truncated due to length)";
} // namespace defaults

enum class output_format
{
    NONE,
    JSON,
    YAML,
};

// Text gathered for one invocation. An empty string means the source had
// nothing to offer.
struct input_source
{
    std::string stdin_text;
    std::string arg_text;
};

std::string join_words(const std::vector<std::string>& words);

// Throws usage_error when neither source has text.
std::string assemble_prompt(const input_source& input);

// Throws usage_error when both formats were requested.
output_format resolve_output_format(bool json_output, bool yaml_output);

std::string hint_text(output_format format);
std::string append_hint(const std::string& prompt, output_format format);

size_t count_code_points(const std::string& text);

// Approximates max_tokens as max_tokens * CHARS_PER_TOKEN code points and cuts
// there, always on a code point boundary.
std::string truncate_prompt(const std::string& prompt, int max_tokens);
} // namespace lqy

#endif
