#ifndef LQY_NET_H
#define LQY_NET_H

#include <cstdint>
#include <vector>
#include <string>
#include <memory>
#include <functional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

namespace net
{
std::string trim_whitespace(const std::string& str);

class url
{
public:
    url() = default;
    explicit url(const std::string& url_string);

    std::string protocol, domain, port, path;
    std::string to_string() const;
    bool        empty() const { return domain.empty(); }

private:
    void parse(const std::string& url_string);
    void set_default_port();
};

enum class http_method
{
    HTTP_METHOD_NULL = 0,
    POST,
};

struct response
{
    int                  response_code = 0;
    std::vector<uint8_t> body;
    std::string          to_string() const
    {
        return std::string(body.begin(), body.end());
    }
    CURLcode curl_code = CURLE_OK;
};

struct request
{
    request() = default;
    request(const url& req_url, http_method method);
    request(const url& req_url, http_method method,
            const std::unordered_map<std::string, std::string>& headers,
            const nlohmann::json&                               json_data);

    url         req_url;
    http_method method = http_method::HTTP_METHOD_NULL;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t>                         data;
    void     set_json(const nlohmann::json& json_data);
    response send() const;
};

// Performs one request and returns once the whole body has arrived.
using sender = std::function<response(const request&)>;

class client
{
public:
    client();
    ~client();
    client(const client&)            = delete;
    client& operator=(const client&) = delete;

    response           send(const request& request);
    static std::string http_method_to_string(http_method method);

private:
    static void curl_deleter(CURL* curl) { curl_easy_cleanup(curl); }
    std::unique_ptr<CURL, decltype(&curl_deleter)> curl_{nullptr,
                                                         &curl_deleter};
    static void                                    ensure_curl_initialized();
    static size_t write_data_callback(void* contents, size_t size, size_t nmemb,
                                      void* userp);
    struct curl_slist* header_list_ = nullptr;
};

} // namespace net
#endif
