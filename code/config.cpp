#include "config.h"
#include "errors.h"
#include <ryml.hpp>
#include <ryml_std.hpp>
#include <fstream>
#include <iterator>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <climits>
#include <pwd.h>
#include <unistd.h>

namespace
{
// ryml aborts on errors unless a callback is installed.
struct yaml_error_handler
{
    void on_error(const char* msg, size_t len, ryml::Location loc)
    {
        throw std::runtime_error("line " + std::to_string(loc.line) +
                                 " column " + std::to_string(loc.col) + ": " +
                                 std::string(msg, len));
    }

    static void s_error(const char* msg, size_t len, ryml::Location loc,
                        void* this_)
    {
        return ((yaml_error_handler*)this_)->on_error(msg, len, loc);
    }

    ryml::Callbacks callbacks()
    {
        return ryml::Callbacks(this, nullptr, nullptr,
                               yaml_error_handler::s_error);
    }
};

void ensure_yaml_callbacks_installed()
{
    static yaml_error_handler handler;
    static bool               installed = false;
    if (!installed)
    {
        ryml::set_callbacks(handler.callbacks());
        installed = true;
    }
}

std::string to_std_string(ryml::csubstr s) { return std::string(s.begin(), s.end()); }

bool read_scalar(ryml::ConstNodeRef root, ryml::csubstr key, std::string& out)
{
    if (!root.has_child(key))
        return false;

    ryml::ConstNodeRef node = root[key];
    if (!node.is_keyval())
        throw lqy::config_error("'" + to_std_string(key) +
                                "' must be a scalar value");
    if (node.val_is_null())
        return false;

    out = to_std_string(node.val());
    return true;
}

int parse_integer(const std::string& key, const std::string& text)
{
    const std::string trimmed = net::trim_whitespace(text);
    char*             end     = nullptr;
    errno                     = 0;
    long value                = std::strtol(trimmed.c_str(), &end, 10);
    if (trimmed.empty() || *end != '\0' || errno == ERANGE || value < 0 ||
        value > INT_MAX)
        throw lqy::config_error("'" + key +
                                "' must be a non-negative integer, got '" +
                                text + "'");
    return static_cast<int>(value);
}
} // namespace

lqy::config lqy::config::load(const std::string& file_name)
{
    std::ifstream fs(file_name);
    if (!fs.is_open())
        throw config_error("Failed to open '" + file_name +
                           "': " + std::strerror(errno));

    std::string text((std::istreambuf_iterator<char>(fs)),
                     std::istreambuf_iterator<char>());
    if (fs.bad())
        throw config_error("Failed to read '" + file_name + "'");

    return parse(text, file_name);
}

lqy::config lqy::config::parse(const std::string& text,
                               const std::string& source_name)
{
    ensure_yaml_callbacks_installed();

    ryml::Tree tree;
    try
    {
        tree = ryml::parse_in_arena(ryml::to_csubstr(source_name),
                                    ryml::csubstr(text.data(), text.size()));
    }
    catch (const std::exception& e)
    {
        throw config_error("Couldn't parse '" + source_name + "', " +
                           e.what());
    }

    config             cfg;
    ryml::ConstNodeRef root = tree.crootref();
    if (root.is_stream() && root.has_children())
        root = root.first_child();

    if (root.is_map())
    {
        std::string value;
        if (read_scalar(root, "api_key", value))
            cfg.api_key = net::trim_whitespace(value);
        if (read_scalar(root, "model", value))
            cfg.model = value;
        if (read_scalar(root, "max_tokens", value))
            cfg.max_tokens = parse_integer("max_tokens", value);
        if (read_scalar(root, "base_url", value))
        {
            try
            {
                cfg.base_url = net::url(value);
            }
            catch (const std::invalid_argument& e)
            {
                throw config_error("'base_url' is invalid: " +
                                   std::string(e.what()));
            }
        }
    }
    else if (root.has_val() || root.is_seq())
    {
        throw config_error("'" + source_name +
                           "' must contain a mapping of settings");
    }

    if (cfg.api_key.empty())
        throw config_error("'" + source_name + "' does not set 'api_key'");

    return cfg;
}

std::string lqy::config::default_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0')
    {
        struct passwd* pw = getpwuid(getuid());
        if (pw == nullptr || pw->pw_dir == nullptr)
            throw config_error("Unable to determine the home directory");
        home = pw->pw_dir;
    }

    std::string path = home;
    if (path.back() != '/')
        path += '/';
    return path + defaults::CONFIG_FILE_NAME;
}

net::url lqy::config::completions_url() const
{
    net::url endpoint(base_url);
    if (endpoint.path.empty() || endpoint.path == "/")
        endpoint.path = defaults::COMPLETIONS_ENDPOINT;
    return endpoint;
}
