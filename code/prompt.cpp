#include "prompt.h"
#include "errors.h"

namespace
{
bool in_range(const std::string& text, size_t pos, unsigned char lo,
              unsigned char hi)
{
    if (pos >= text.size())
        return false;
    unsigned char c = static_cast<unsigned char>(text[pos]);
    return c >= lo && c <= hi;
}

// Bytes taken by the character starting at pos. A byte that does not begin a
// well-formed UTF-8 sequence counts as a character of its own.
size_t sequence_length(const std::string& text, size_t pos)
{
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80)
        return 1;

    size_t        length = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
        length = 2;
    else if (lead >= 0xE0 && lead <= 0xEF)
    {
        length = 3;
        if (lead == 0xE0)
            lo = 0xA0;
        else if (lead == 0xED)
            hi = 0x9F;
    }
    else if (lead >= 0xF0 && lead <= 0xF4)
    {
        length = 4;
        if (lead == 0xF0)
            lo = 0x90;
        else if (lead == 0xF4)
            hi = 0x8F;
    }
    else
        return 1;

    if (!in_range(text, pos + 1, lo, hi))
        return 1;
    for (size_t i = 2; i < length; i++)
    {
        if (!in_range(text, pos + i, 0x80, 0xBF))
            return 1;
    }
    return length;
}
} // namespace

std::string lqy::join_words(const std::vector<std::string>& words)
{
    std::string joined;
    for (size_t i = 0; i < words.size(); i++)
    {
        if (i > 0)
            joined += ' ';
        joined += words[i];
    }
    return joined;
}

std::string lqy::assemble_prompt(const input_source& input)
{
    if (!input.stdin_text.empty() && !input.arg_text.empty())
        return "Question: " + input.arg_text + "\n\nContext:\n" +
               input.stdin_text;
    if (!input.stdin_text.empty())
        return input.stdin_text;
    if (!input.arg_text.empty())
        return input.arg_text;

    throw usage_error("No input given");
}

lqy::output_format lqy::resolve_output_format(bool json_output,
                                              bool yaml_output)
{
    if (json_output && yaml_output)
        throw usage_error("You can only specify json or yaml output");
    if (json_output)
        return output_format::JSON;
    if (yaml_output)
        return output_format::YAML;
    return output_format::NONE;
}

std::string lqy::hint_text(output_format format)
{
    switch (format)
    {
    case output_format::JSON:
        return "\n\nPlease structure your entire response as a JSON object. "
               "If the user query doesn't specify a particular structure, "
               "create an appropriate JSON structure for the response "
               "content.";
    case output_format::YAML:
        return "\n\nPlease structure your entire response as a YAML manifest. "
               "If the user query doesn't specify a particular structure, "
               "create an appropriate YAML structure for the response "
               "content.";
    default:
        return "";
    }
}

std::string lqy::append_hint(const std::string& prompt, output_format format)
{
    return prompt + hint_text(format);
}

size_t lqy::count_code_points(const std::string& text)
{
    size_t count = 0;
    for (size_t pos = 0; pos < text.size(); pos += sequence_length(text, pos))
        count++;
    return count;
}

std::string lqy::truncate_prompt(const std::string& prompt, int max_tokens)
{
    const size_t max_chars =
        max_tokens > 0
            ? static_cast<size_t>(max_tokens) * defaults::CHARS_PER_TOKEN
            : 0;

    size_t cut   = 0;
    size_t count = 0;
    while (cut < prompt.size() && count < max_chars)
    {
        cut += sequence_length(prompt, cut);
        count++;
    }

    if (cut == prompt.size())
        return prompt;

    return prompt.substr(0, cut) + defaults::TRUNCATION_MARKER;
}
