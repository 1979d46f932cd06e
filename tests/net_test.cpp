#include <gtest/gtest.h>
#include <stdexcept>
#include "net.h"

TEST(Url, ParsesSchemeHostAndPath)
{
    net::url u("https://api.openai.com/v1/chat/completions");
    EXPECT_EQ(u.protocol, "https");
    EXPECT_EQ(u.domain, "api.openai.com");
    EXPECT_EQ(u.port, "443");
    EXPECT_EQ(u.path, "/v1/chat/completions");
    EXPECT_EQ(u.to_string(), "https://api.openai.com/v1/chat/completions");
}

TEST(Url, KeepsExplicitPort)
{
    net::url u("http://127.0.0.1:8080");
    EXPECT_EQ(u.domain, "127.0.0.1");
    EXPECT_EQ(u.port, "8080");
    EXPECT_EQ(u.path, "");
    EXPECT_EQ(u.to_string(), "http://127.0.0.1:8080/");
}

TEST(Url, DefaultsToHttps)
{
    net::url u("example.com/api");
    EXPECT_EQ(u.to_string(), "https://example.com/api");
}

TEST(Url, RejectsMissingHostOrBadPort)
{
    EXPECT_THROW(net::url("https:///v1"), std::invalid_argument);
    EXPECT_THROW(net::url("http://host:abc/"), std::invalid_argument);
    EXPECT_TRUE(net::url().empty());
}

TEST(Request, SetJsonSerializesBodyAndContentType)
{
    net::request req(net::url("https://example.com/post"),
                     net::http_method::POST, {{"Authorization", "Bearer k"}},
                     {{"model", "m"}});
    EXPECT_EQ(std::string(req.data.begin(), req.data.end()), R"({"model":"m"})");
    EXPECT_EQ(req.headers.at("Content-Type"), "application/json");
    EXPECT_EQ(req.headers.at("Authorization"), "Bearer k");
}

TEST(Request, SetJsonKeepsExplicitContentType)
{
    net::request req(net::url("https://example.com/"), net::http_method::POST);
    req.headers["Content-Type"] = "application/json; charset=utf-8";
    req.set_json({{"a", 1}});
    EXPECT_EQ(req.headers.at("Content-Type"), "application/json; charset=utf-8");
}

TEST(Request, InvalidUtf8IsReplacedNotThrown)
{
    net::request req(net::url("https://example.com/"), net::http_method::POST);
    EXPECT_NO_THROW(req.set_json({{"content", std::string("bad \xFF byte")}}));
    EXPECT_FALSE(req.data.empty());
}

TEST(Client, MethodNames)
{
    EXPECT_EQ(net::client::http_method_to_string(net::http_method::POST), "POST");
    EXPECT_EQ(net::client::http_method_to_string(
                  net::http_method::HTTP_METHOD_NULL),
              "");
}

TEST(TrimWhitespace, StripsBothEnds)
{
    EXPECT_EQ(net::trim_whitespace("  sk-123 \n"), "sk-123");
    EXPECT_EQ(net::trim_whitespace(" \t "), "");
}
