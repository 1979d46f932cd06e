#include "net.h"
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

// net::client
void net::client::ensure_curl_initialized()
{
    static bool initialized = false;
    if (!initialized)
    {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
            throw std::runtime_error("CURL global initialization failed");
        atexit(curl_global_cleanup);
        initialized = true;
    }
}

net::client::client() : header_list_(nullptr)
{
    ensure_curl_initialized();
    curl_.reset(curl_easy_init());
    if (!curl_)
    {
        throw std::runtime_error("CURL initialization failed");
    }
}

net::client::~client()
{
    if (header_list_ != nullptr)
    {
        curl_slist_free_all(header_list_);
    }
}

static void
set_default_content_type(std::unordered_map<std::string, std::string>& headers,
                         const std::string& default_type)
{
    if (headers.find("Content-Type") == headers.end())
        headers["Content-Type"] = default_type;
}

std::string net::client::http_method_to_string(const net::http_method method)
{
    return method == net::http_method::POST ? "POST" : "";
}

std::string net::trim_whitespace(const std::string& str)
{
    auto start =
        std::find_if_not(str.begin(), str.end(),
                         [](unsigned char ch) { return std::isspace(ch); });
    auto end =
        std::find_if_not(str.rbegin(), str.rend(),
                         [](unsigned char ch) { return std::isspace(ch); })
            .base();
    return (start < end) ? std::string(start, end) : std::string();
}

size_t net::client::write_data_callback(void* contents, size_t size,
                                        size_t nmemb, void* userp)
{
    net::response* response = static_cast<net::response*>(userp);
    response->body.insert(response->body.end(),
                          static_cast<uint8_t*>(contents),
                          static_cast<uint8_t*>(contents) + (size * nmemb));
    return size * nmemb;
}

net::response net::client::send(const net::request& request)
{
    net::response response;

    if (request.req_url.empty())
        throw std::invalid_argument("Request has no destination URL");

    const std::string url_string = request.req_url.to_string();
    curl_easy_setopt(curl_.get(), CURLOPT_URL, url_string.c_str());

    if (!request.data.empty())
    {
        curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDS, request.data.data());
        curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.data.size()));
    }

    const std::string method = http_method_to_string(request.method);
    if (request.method != net::http_method::HTTP_METHOD_NULL)
        curl_easy_setopt(curl_.get(), CURLOPT_CUSTOMREQUEST, method.c_str());

    if (header_list_ != nullptr)
    {
        curl_slist_free_all(header_list_);
        header_list_ = nullptr;
    }

    for (const auto& header : request.headers)
    {
        std::string header_string = header.first + ": " + header.second;
        header_list_ = curl_slist_append(header_list_, header_string.c_str());
    }
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPHEADER, header_list_);

    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, write_data_callback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &response);

    response.curl_code = curl_easy_perform(curl_.get());
    if (response.curl_code == CURLE_OK)
    {
        long http_code = 0;
        curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &http_code);
        response.response_code = static_cast<int>(http_code);
    }

    return response;
}

// net::url
net::url::url(const std::string& url_string) { parse(url_string); }

void net::url::parse(const std::string& url_string)
{
    const std::string trimmed = trim_whitespace(url_string);
    size_t            pos     = trimmed.find("://");
    size_t            rest    = 0;
    if (pos != std::string::npos)
    {
        protocol = trimmed.substr(0, pos);
        std::transform(protocol.begin(), protocol.end(), protocol.begin(),
                       [](unsigned char ch) { return std::tolower(ch); });
        rest = pos + 3;
    }
    else
    {
        protocol = "https";
    }

    size_t      authority_end = trimmed.find('/', rest);
    std::string authority     = trimmed.substr(rest, authority_end - rest);
    size_t      colon         = authority.rfind(':');
    if (colon != std::string::npos)
    {
        domain = authority.substr(0, colon);
        port   = authority.substr(colon + 1);
        if (port.empty() ||
            !std::all_of(port.begin(), port.end(),
                         [](unsigned char ch) { return std::isdigit(ch); }))
            throw std::invalid_argument("URL has an invalid port '" + port +
                                        "'");
    }
    else
    {
        domain = authority;
        set_default_port();
    }

    if (domain.empty())
    {
        throw std::invalid_argument("URL is missing a domain");
    }

    path = authority_end == std::string::npos ? ""
                                               : trimmed.substr(authority_end);
}

void net::url::set_default_port()
{
    if (protocol == "http")
        port = "80";
    else if (protocol == "https")
        port = "443";
    else
        port.erase();
}

std::string net::url::to_string() const
{
    std::ostringstream oss;
    oss << protocol << "://" << domain;
    if (!port.empty() && !((protocol == "http" && port == "80") ||
                           (protocol == "https" && port == "443")))
        oss << ":" << port;

    if (path.empty())
        oss << '/';
    else if (path[0] != '/')
        oss << '/' << path;
    else
        oss << path;

    return oss.str();
}

// net::request
net::request::request(const net::url& r, net::http_method m)
    : req_url(r), method(m), headers{}
{
}

net::request::request(const net::url& r, net::http_method m,
                      const std::unordered_map<std::string, std::string>& h,
                      const nlohmann::json& json_data)
    : req_url(r), method(m), headers(h)
{
    set_json(json_data);
}

void net::request::set_json(const nlohmann::json& json_data)
{
    std::string json_str =
        json_data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    data.assign(json_str.begin(), json_str.end());
    set_default_content_type(headers, "application/json");
}

net::response net::request::send() const
{
    net::client client;
    return client.send(*this);
}
