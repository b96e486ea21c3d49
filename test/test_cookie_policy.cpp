#include "proxy/cookie_policy.hpp"

#include <gtest/gtest.h>

TEST(CookiePolicy, DomainMatches)
{
    EXPECT_TRUE(domain_matches("example.com", "example.com"));
    EXPECT_TRUE(domain_matches("www.example.com", "example.com"));
    EXPECT_TRUE(domain_matches("www.example.com", ".example.com"));
    EXPECT_TRUE(domain_matches("WWW.Example.com", "example.COM"));
    EXPECT_FALSE(domain_matches("badexample.com", "example.com"));
    EXPECT_FALSE(domain_matches("example.com", "www.example.com"));
    EXPECT_FALSE(domain_matches("example.com", ""));
    EXPECT_FALSE(domain_matches("example.com", "."));
}

TEST(CookiePolicy, StripsUpstreamDomain)
{
    CookieRewriteOptions options;
    EXPECT_EQ(rewrite_set_cookie("session=abc; Domain=example.com", "example.com", options),
              "session@.example.com=abc; Path=/");
    EXPECT_EQ(rewrite_set_cookie("session=abc; domain=.example.com; HttpOnly", "www.example.com", options),
              "session@.example.com=abc; HttpOnly; Path=/");
}

TEST(CookiePolicy, ForeignDomainKept)
{
    CookieRewriteOptions options;
    EXPECT_EQ(rewrite_set_cookie("id=1; Domain=tracker.test", "example.com", options),
              "id@example.com=1; Domain=tracker.test; Path=/");
}

TEST(CookiePolicy, ConfiguredCookieDomain)
{
    CookieRewriteOptions options;
    options.cookie_domain = "proxy.local";
    EXPECT_EQ(rewrite_set_cookie("session=abc; Domain=example.com", "example.com", options),
              "session@.example.com=abc; Domain=proxy.local; Path=/");
}

TEST(CookiePolicy, PathRewritten)
{
    CookieRewriteOptions options;
    EXPECT_EQ(rewrite_set_cookie("a=b; Path=/account; Max-Age=60", "example.com", options),
              "a@example.com=b; Path=/; Max-Age=60");
}

TEST(CookiePolicy, SecureDependsOnClient)
{
    CookieRewriteOptions plain;
    EXPECT_EQ(rewrite_set_cookie("a=b; Secure; SameSite=None", "example.com", plain), "a@example.com=b; Path=/");
    EXPECT_EQ(rewrite_set_cookie("a=b; Secure; SameSite=Lax", "example.com", plain),
              "a@example.com=b; SameSite=Lax; Path=/");

    CookieRewriteOptions tls;
    tls.secure_client = true;
    EXPECT_EQ(rewrite_set_cookie("a=b; Secure; SameSite=None", "example.com", tls),
              "a@example.com=b; Secure; SameSite=None; Path=/");
}

TEST(CookiePolicy, ValueNamedLikeAttributeUntouched)
{
    CookieRewriteOptions options;
    EXPECT_EQ(rewrite_set_cookie("samesite=none", "example.com", options), "samesite@example.com=none; Path=/");
}

TEST(CookiePolicy, HostNameLowercasedInScope)
{
    CookieRewriteOptions options;
    EXPECT_EQ(rewrite_set_cookie("id=7", "WWW.Example.com", options), "id@www.example.com=7; Path=/");
}

TEST(CookiePolicy, CollectRequestCookies)
{
    HeaderList headers = {
        {"cookie", "a@example.com=1"},
        {"accept", "*/*"},
        {"Cookie", " b@example.com=2; c@.example.com=3 "},
        {"cookie", ""},
    };
    EXPECT_EQ(collect_request_cookies(headers, "example.com"), "a=1; b=2; c=3");
    EXPECT_EQ(collect_request_cookies({}, "example.com"), "");
}

TEST(CookiePolicy, CookiesStayWithTheirSite)
{
    CookieRewriteOptions options;
    auto stored = rewrite_set_cookie("bank_session=SECRET; Path=/", "bank.example", options);
    auto pair = stored.substr(0, stored.find(';'));

    HeaderList headers = {{"Cookie", pair + "; theme=dark"}};
    EXPECT_EQ(collect_request_cookies(headers, "tracker.example"), "");
    EXPECT_EQ(collect_request_cookies(headers, "bank.example"), "bank_session=SECRET");
    EXPECT_EQ(collect_request_cookies(headers, "www.bank.example"), "");
}

TEST(CookiePolicy, DomainCookieReachesSubdomains)
{
    HeaderList headers = {{"Cookie", "sid@.example.com=1; host@www.example.com=2; other@.example.org=3"}};
    EXPECT_EQ(collect_request_cookies(headers, "api.example.com"), "sid=1");
    EXPECT_EQ(collect_request_cookies(headers, "www.example.com"), "sid=1; host=2");
    EXPECT_EQ(collect_request_cookies(headers, "badexample.com"), "");
}
