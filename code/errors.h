#ifndef LQY_ERRORS_H
#define LQY_ERRORS_H

#include <stdexcept>
#include <string>

namespace lqy
{
class error : public std::runtime_error
{
public:
    explicit error(const std::string& what) : std::runtime_error(what) {}
};

// Configuration file missing, unreadable or malformed.
class config_error : public error
{
public:
    explicit config_error(const std::string& what) : error(what) {}
};

// No input, conflicting output formats or an invalid flag value.
class usage_error : public error
{
public:
    explicit usage_error(const std::string& what) : error(what) {}
};

// The request never produced an HTTP status (DNS, TLS, connection...).
class network_error : public error
{
public:
    explicit network_error(const std::string& what) : error(what) {}
};

class api_error : public error
{
public:
    api_error(int status_code, const std::string& body)
        : error("API request failed with status code " +
                std::to_string(status_code) + ": " + body),
          status_code(status_code), body(body)
    {
    }

    int         status_code;
    std::string body;
};

class parse_error : public error
{
public:
    explicit parse_error(const std::string& what) : error(what) {}
};

class no_choices_error : public error
{
public:
    no_choices_error() : error("no response choices returned") {}
};
} // namespace lqy

#endif
