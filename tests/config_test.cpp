#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <string>
#include "config.h"
#include "errors.h"

namespace
{
std::string write_temp_file(const std::string& name, const std::string& text)
{
    std::string   path = ::testing::TempDir() + name;
    std::ofstream fs(path, std::ios::binary | std::ios::trunc);
    fs << text;
    return path;
}
} // namespace

TEST(Config, ParsesAllKeys)
{
    lqy::config cfg = lqy::config::parse("api_key: sk-test\n"
                                         "model: gpt-4o-mini\n"
                                         "max_tokens: 512\n");
    EXPECT_EQ(cfg.api_key, "sk-test");
    EXPECT_EQ(cfg.model, "gpt-4o-mini");
    EXPECT_EQ(cfg.max_tokens, 512);
    EXPECT_EQ(cfg.completions_url().to_string(),
              "https://api.openai.com/v1/chat/completions");
}

TEST(Config, QuotedValuesAndUnknownKeys)
{
    lqy::config cfg = lqy::config::parse("# personal settings\n"
                                         "api_key: \"sk-quoted\"\n"
                                         "model: 'gpt-4.1'\n"
                                         "temperature: 0.2\n");
    EXPECT_EQ(cfg.api_key, "sk-quoted");
    EXPECT_EQ(cfg.model, "gpt-4.1");
    EXPECT_EQ(cfg.max_tokens, 0);
}

TEST(Config, BaseUrlOverride)
{
    lqy::config cfg = lqy::config::parse("api_key: k\n"
                                         "base_url: http://localhost:8080\n");
    EXPECT_EQ(cfg.completions_url().to_string(),
              "http://localhost:8080/v1/chat/completions");

    cfg = lqy::config::parse("api_key: k\n"
                             "base_url: https://proxy.example.com/openai/chat\n");
    EXPECT_EQ(cfg.completions_url().to_string(),
              "https://proxy.example.com/openai/chat");
}

TEST(Config, MissingApiKeyIsAnError)
{
    EXPECT_THROW(lqy::config::parse("model: gpt-4o\n"), lqy::config_error);
    EXPECT_THROW(lqy::config::parse("api_key:\nmodel: gpt-4o\n"),
                 lqy::config_error);
    EXPECT_THROW(lqy::config::parse(""), lqy::config_error);
}

TEST(Config, NonIntegerMaxTokensIsAnError)
{
    EXPECT_THROW(lqy::config::parse("api_key: k\nmax_tokens: lots\n"),
                 lqy::config_error);
    EXPECT_THROW(lqy::config::parse("api_key: k\nmax_tokens: 12.5\n"),
                 lqy::config_error);
    EXPECT_THROW(lqy::config::parse("api_key: k\nmax_tokens: -1\n"),
                 lqy::config_error);
}

TEST(Config, NonMappingDocumentIsAnError)
{
    EXPECT_THROW(lqy::config::parse("just a string\n"), lqy::config_error);
    EXPECT_THROW(lqy::config::parse("- api_key\n- model\n"), lqy::config_error);
    EXPECT_THROW(lqy::config::parse("api_key:\n  nested: value\n"),
                 lqy::config_error);
}

TEST(Config, MalformedYamlIsAnError)
{
    EXPECT_THROW(lqy::config::parse("api_key: [unterminated\n"),
                 lqy::config_error);
}

TEST(Config, LoadReadsFile)
{
    std::string path = write_temp_file("lqy_config_load.yaml",
                                       "api_key: sk-file\nmodel: gpt-4o\n");
    lqy::config cfg = lqy::config::load(path);
    EXPECT_EQ(cfg.api_key, "sk-file");
    EXPECT_EQ(cfg.model, "gpt-4o");
}

TEST(Config, LoadMissingFileIsAnError)
{
    try
    {
        lqy::config::load(::testing::TempDir() + "lqy_no_such_config.yaml");
        FAIL() << "expected config_error";
    }
    catch (const lqy::config_error& e)
    {
        EXPECT_NE(std::string(e.what()).find("lqy_no_such_config.yaml"),
                  std::string::npos);
    }
}

TEST(Config, DefaultPathUsesHome)
{
    const char* old_home = std::getenv("HOME");
    std::string saved    = old_home ? old_home : "";

    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(lqy::config::default_path(), "/home/tester/.lqyconfig.yaml");
    setenv("HOME", "/home/tester/", 1);
    EXPECT_EQ(lqy::config::default_path(), "/home/tester/.lqyconfig.yaml");

    if (old_home)
        setenv("HOME", saved.c_str(), 1);
    else
        unsetenv("HOME");
}
