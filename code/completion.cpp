#include "completion.h"
#include "errors.h"
#include <utility>

using namespace nlohmann;

json lqy::create_request(const config& cfg, const std::string& prompt)
{
    json request_object     = json::object();
    request_object["model"] = cfg.model;

    request_object["messages"] = json::array();
    request_object["messages"].push_back(
        {{"role", "user"}, {"content", prompt}});

    if (cfg.max_tokens != defaults::MAX_TOKENS)
        request_object["max_tokens"] = cfg.max_tokens;

    return request_object;
}

std::string lqy::extract_content(const net::response& response)
{
    if (response.curl_code != CURLE_OK)
        throw network_error(curl_easy_strerror(response.curl_code));

    if (response.response_code != 200)
        throw api_error(response.response_code, response.to_string());

    json response_json;
    try
    {
        response_json = json::parse(response.to_string());
    }
    catch (const json::parse_error& e)
    {
        throw parse_error("Couldn't parse response body: " +
                          std::string(e.what()));
    }

    if (!response_json.is_object())
        throw parse_error("Response body is not a JSON object");

    auto choices = response_json.find("choices");
    if (choices == response_json.end() || choices->is_null())
        throw no_choices_error();
    if (!choices->is_array())
        throw parse_error("'choices' is not an array");
    if (choices->empty())
        throw no_choices_error();

    const json& first = (*choices)[0];
    if (!first.is_object() || !first.contains("message") ||
        first["message"].is_null())
        return "";
    if (!first["message"].is_object())
        throw parse_error("'message' is not an object");

    const json& message = first["message"];
    if (!message.contains("content") || message["content"].is_null())
        return "";
    if (!message["content"].is_string())
        throw parse_error("'content' is not a string");

    return message["content"].get<std::string>();
}

lqy::completion_client::completion_client(const config& c)
    : completion_client(c, [](const net::request& req) { return req.send(); })
{
}

lqy::completion_client::completion_client(const config& c, net::sender send)
    : cfg_(c), send_(std::move(send))
{
}

net::request lqy::completion_client::build_request(
    const std::string& prompt) const
{
    return {cfg_.completions_url(),
            net::http_method::POST,
            {{"Authorization", "Bearer " + cfg_.api_key}},
            create_request(cfg_, prompt)};
}

std::string lqy::completion_client::complete(const std::string& prompt) const
{
    net::request  req      = build_request(prompt);
    net::response response = send_(req);
    return extract_content(response);
}
