#ifndef LQY_COMPLETION_H
#define LQY_COMPLETION_H

#include <string>
#include <nlohmann/json.hpp>
#include "config.h"
#include "net.h"

namespace lqy
{
// Request body for a single user message.
nlohmann::json create_request(const config& cfg, const std::string& prompt);

// Returns choices[0].message.content or throws network_error, api_error,
// parse_error or no_choices_error.
std::string extract_content(const net::response& response);

class completion_client
{
public:
    explicit completion_client(const config& c);
    completion_client(const config& c, net::sender send);

    net::request build_request(const std::string& prompt) const;
    std::string  complete(const std::string& prompt) const;

private:
    config      cfg_;
    net::sender send_;
};
} // namespace lqy

#endif
