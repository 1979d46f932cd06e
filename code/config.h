#ifndef LQY_CONFIG_H
#define LQY_CONFIG_H

#include <string>
#include "net.h"

namespace lqy
{
namespace defaults
{
const std::string CONFIG_FILE_NAME     = ".lqyconfig.yaml";
const std::string BASE_URL             = "https://api.openai.com";
const std::string COMPLETIONS_ENDPOINT = "/v1/chat/completions";
constexpr int     MAX_TOKENS           = 0;
} // namespace defaults

// Contents of the user's configuration file. Loaded once per invocation.
class config
{
public:
    config() : base_url(defaults::BASE_URL), max_tokens(defaults::MAX_TOKENS) {}

    std::string api_key;
    std::string model;
    net::url    base_url;
    // Cap on response tokens requested from the API; 0 leaves it unset.
    int max_tokens;

    net::url completions_url() const;

    // Throws config_error if the file can't be read or isn't a valid config.
    static config load(const std::string& file_name);
    static config parse(const std::string& text,
                        const std::string& source_name = "<config>");
    static std::string default_path();
};
} // namespace lqy

#endif
