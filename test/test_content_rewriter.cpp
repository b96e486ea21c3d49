#include "proxy/content_rewriter.hpp"
#include "proxy/errors.hpp"

#include <gtest/gtest.h>

namespace {

RewriteContext make_context(const char* base = "https://example.com/a/b.html")
{
    RewriteContext ctx;
    ctx.base = resolve_target(base);
    return ctx;
}

std::string proxied(const std::string& absolute)
{
    return "/proxy?url=" + percent_encode(absolute);
}

} // namespace

TEST(ClassifyContentType, Kinds)
{
    EXPECT_EQ(classify_content_type("text/html; charset=utf-8"), ContentKind::Html);
    EXPECT_EQ(classify_content_type("application/xhtml+xml"), ContentKind::Html);
    EXPECT_EQ(classify_content_type("TEXT/CSS"), ContentKind::Css);
    EXPECT_EQ(classify_content_type("application/javascript"), ContentKind::JavaScript);
    EXPECT_EQ(classify_content_type("text/javascript;charset=UTF-8"), ContentKind::JavaScript);
    EXPECT_EQ(classify_content_type("application/x-javascript"), ContentKind::JavaScript);
    EXPECT_EQ(classify_content_type("image/png"), ContentKind::Passthrough);
    EXPECT_EQ(classify_content_type("application/json"), ContentKind::Passthrough);
    EXPECT_EQ(classify_content_type(""), ContentKind::Passthrough);
    EXPECT_EQ(classify_content_type("text/html; charset=UTF-16LE"), ContentKind::Passthrough);
}

TEST(RewriteUrlToken, Absolute)
{
    auto ctx = make_context();
    const std::string url = "https://other.example.org/x?y=1&z=2";
    EXPECT_EQ(rewrite_url_token(url, ctx), proxied(url));
    EXPECT_EQ(rewrite_url_token(url, ctx),
              "/proxy?url=https%3A%2F%2Fother.example.org%2Fx%3Fy%3D1%26z%3D2");
}

TEST(RewriteUrlToken, Relative)
{
    auto ctx = make_context();
    EXPECT_EQ(rewrite_url_token("c.css", ctx), proxied("https://example.com/a/c.css"));
    EXPECT_EQ(rewrite_url_token("/d.css", ctx), proxied("https://example.com/d.css"));
    EXPECT_EQ(rewrite_url_token("//cdn.example.com/e.js", ctx), proxied("https://cdn.example.com/e.js"));
    EXPECT_EQ(rewrite_url_token("  c.css  ", ctx), proxied("https://example.com/a/c.css"));
}

TEST(RewriteUrlToken, Idempotent)
{
    auto ctx = make_context();
    for (const char* raw : {"c.css", "/d.css", "//cdn.example.com/e.js", "http://x.test/?q=1#f"}) {
        auto once = rewrite_url_token(raw, ctx);
        EXPECT_EQ(rewrite_url_token(once, ctx), once) << raw;
    }
    EXPECT_EQ(rewrite_url_token("/proxy/https://example.com/", ctx), "/proxy/https://example.com/");
}

TEST(RewriteUrlToken, Unchanged)
{
    auto ctx = make_context();
    for (const char* raw : {"", "   ", "#section", "data:image/png;base64,AAAA", "mailto:a@example.com",
                            "javascript:void(0)", "tel:+123", "about:blank", "blob:https://example.com/x"}) {
        EXPECT_EQ(rewrite_url_token(raw, ctx), raw) << raw;
    }
}

TEST(RewriteUrlToken, FragmentAppendedRaw)
{
    auto ctx = make_context();
    EXPECT_EQ(rewrite_url_token("/page#part", ctx), proxied("https://example.com/page") + "#part");
}

TEST(RewriteUrlToken, CustomBasePath)
{
    auto ctx = make_context();
    ctx.proxy_base_path = "/relay";
    EXPECT_EQ(rewrite_url_token("/x", ctx), "/relay?url=" + percent_encode("https://example.com/x"));
}

TEST(RewriteHtml, Attributes)
{
    auto ctx = make_context();
    const std::string input =
        "<html><head><link rel=\"stylesheet\" href=\"c.css\">"
        "<script src='/app.js'></script></head>"
        "<body><a href=https://other.test/>x</a><img src=\"img.png\" alt=\"caf\xc3\xa9\">"
        "<form method=\"post\" action=\"/submit\"></form></body></html>";
    const std::string expected =
        "<html><head><link rel=\"stylesheet\" href=\"" + proxied("https://example.com/a/c.css") + "\">"
        "<script src='" + proxied("https://example.com/app.js") + "'></script></head>"
        "<body><a href=" + proxied("https://other.test/") + ">x</a><img src=\"" +
        proxied("https://example.com/a/img.png") + "\" alt=\"caf\xc3\xa9\">"
        "<form method=\"post\" action=\"" + proxied("https://example.com/submit") + "\"></form></body></html>";
    EXPECT_EQ(rewrite_html(input, ctx), expected);
}

TEST(RewriteHtml, NothingToRewriteIsVerbatim)
{
    auto ctx = make_context();
    const std::string input = "<!DOCTYPE html>\n<p class=x>Gr\xc3\xbc\xc3\x9f" "e &amp; <b>bold</b></p>\n";
    EXPECT_EQ(rewrite_html(input, ctx), input);
}

TEST(RewriteHtml, FragmentAndDataUntouched)
{
    auto ctx = make_context();
    const std::string input = "<a href=\"#top\">t</a><img src=\"data:image/gif;base64,R0lG\">";
    EXPECT_EQ(rewrite_html(input, ctx), input);
}

TEST(RewriteHtml, EntitiesDecodedBeforeResolution)
{
    auto ctx = make_context();
    const std::string input = "<a href=\"/s?a=1&amp;b=2\">s</a>";
    EXPECT_EQ(rewrite_html(input, ctx),
              "<a href=\"" + proxied("https://example.com/s?a=1&b=2") + "\">s</a>");
}

TEST(RewriteHtml, Srcset)
{
    auto ctx = make_context();
    const std::string input = "<img srcset=\"small.jpg 1x, /big.jpg 2x\">";
    EXPECT_EQ(rewrite_html(input, ctx),
              "<img srcset=\"" + proxied("https://example.com/a/small.jpg") + " 1x, " +
              proxied("https://example.com/big.jpg") + " 2x\">");
}

TEST(RewriteHtml, StyleAttributeAndBlock)
{
    auto ctx = make_context();
    const std::string input =
        "<div style=\"background: url('bg.png')\"></div>"
        "<style>body { background: url(/body.png); }</style>";
    EXPECT_EQ(rewrite_html(input, ctx),
              "<div style=\"background: url(&#39;" + proxied("https://example.com/a/bg.png") + "&#39;)\"></div>"
              "<style>body { background: url(" + proxied("https://example.com/body.png") + "); }</style>");
}

TEST(RewriteHtml, MetaRefresh)
{
    auto ctx = make_context();
    const std::string input = "<meta http-equiv=\"refresh\" content=\"5; url=/next\">";
    EXPECT_EQ(rewrite_html(input, ctx),
              "<meta http-equiv=\"refresh\" content=\"5; url=" + proxied("https://example.com/next") + "\">");
}

TEST(RewriteHtml, BaseHref)
{
    auto ctx = make_context();
    const std::string input = "<base href=\"https://cdn.test/assets/\"><img src=\"logo.png\">";
    EXPECT_EQ(rewrite_html(input, ctx),
              "<base href=\"" + proxied("https://cdn.test/assets/") + "\"><img src=\"" +
              proxied("https://cdn.test/assets/logo.png") + "\">");
}

TEST(RewriteHtml, GetFormCarriesTarget)
{
    auto ctx = make_context();
    const std::string input = "<form action=\"/search\"><input name=q></form>";
    EXPECT_EQ(rewrite_html(input, ctx),
              "<form action=\"" + proxied("https://example.com/search") + "\">"
              "<input type=\"hidden\" name=\"url\" value=\"https://example.com/search\">"
              "<input name=q></form>");
}

TEST(RewriteHtml, RewrittenFormKeepsSingleTarget)
{
    auto ctx = make_context();
    const std::string input = "<form action=\"/search\"><input name=q></form>";
    auto once = rewrite_html(input, ctx);
    EXPECT_EQ(rewrite_html(once, ctx), once);

    // action already on the path form of the entry point
    const std::string path_form = "<form action=\"/proxy/https://example.com/search\"></form>";
    EXPECT_EQ(rewrite_html(path_form, ctx), path_form);
}

TEST(RewriteHtml, InlineScript)
{
    auto ctx = make_context();
    const std::string input = "<script>fetch(\"/api/items\");</script>"
                              "<script type=\"application/json\">{\"u\": \"/api\"}</script>";
    EXPECT_EQ(rewrite_html(input, ctx),
              "<script>fetch(\"" + proxied("https://example.com/api/items") + "\");</script>"
              "<script type=\"application/json\">{\"u\": \"/api\"}</script>");
}

TEST(RewriteHtml, CommentsAndTextareaSkipped)
{
    auto ctx = make_context();
    const std::string input = "<!-- <a href=\"/x\"> --><textarea><a href=\"/y\"></textarea>";
    EXPECT_EQ(rewrite_html(input, ctx), input);
}

TEST(RewriteHtml, Banner)
{
    auto ctx = make_context();
    ctx.notice_banner = "<div id=notice>Notice</div>";
    EXPECT_EQ(rewrite_html("<html><body class=\"main\"><p>x</p></body></html>", ctx),
              "<html><body class=\"main\"><div id=notice>Notice</div><p>x</p></body></html>");
}

TEST(RewriteHtml, UnterminatedAttribute)
{
    auto ctx = make_context();
    EXPECT_THROW(rewrite_html("<a href=\"/never-closed>text", ctx), RewriteError);
}

TEST(RewriteCss, UrlsAndImports)
{
    auto ctx = make_context("https://example.com/css/site.css");
    const std::string input =
        "@import \"reset.css\";\n"
        "@import url('print.css') print;\n"
        "/* url(commented.png) */\n"
        ".a { background: url(\"../img/a.png\") }\n"
        ".b { background: url( /b.png ) }\n"
        ".c { background: url(data:image/png;base64,AAA) }\n";
    const std::string expected =
        "@import \"" + proxied("https://example.com/css/reset.css") + "\";\n"
        "@import url('" + proxied("https://example.com/css/print.css") + "') print;\n"
        "/* url(commented.png) */\n"
        ".a { background: url(\"" + proxied("https://example.com/img/a.png") + "\") }\n"
        ".b { background: url( " + proxied("https://example.com/b.png") + " ) }\n"
        ".c { background: url(data:image/png;base64,AAA) }\n";
    EXPECT_EQ(rewrite_css(input, ctx), expected);
}

TEST(RewriteCss, EscapedQuotesInStrings)
{
    auto ctx = make_context();
    EXPECT_EQ(rewrite_css("a{background:url(\"x\\\".png\")}", ctx),
              "a{background:url(\"" + proxied("https://example.com/a/x\".png") + "\")}");
    EXPECT_EQ(rewrite_css("@import 'it\\'s.css';", ctx),
              "@import '" + proxied("https://example.com/a/it's.css") + "';");
    EXPECT_EQ(rewrite_css("b{background:url(\"\\2f img.png\")}", ctx),
              "b{background:url(\"" + proxied("https://example.com/img.png") + "\")}");
}

TEST(RewriteJavaScript, NavigationPositions)
{
    auto ctx = make_context();
    const std::string input =
        "fetch('/api/a');\n"
        "window.location.href = \"https://other.test/\";\n"
        "xhr.open(\"GET\", \"/api/b\");\n"
        "img.src = '//cdn.test/p.png';\n"
        "var label = \"/not/a/navigation\";\n"
        "if (x == \"/compare\") {}\n";
    const std::string expected =
        "fetch('" + proxied("https://example.com/api/a") + "');\n"
        "window.location.href = \"" + proxied("https://other.test/") + "\";\n"
        "xhr.open(\"GET\", \"" + proxied("https://example.com/api/b") + "\");\n"
        "img.src = '" + proxied("https://cdn.test/p.png") + "';\n"
        "var label = \"/not/a/navigation\";\n"
        "if (x == \"/compare\") {}\n";
    EXPECT_EQ(rewrite_javascript(input, ctx), expected);
}

TEST(RewriteJavaScript, TemplatesWithInterpolationUntouched)
{
    auto ctx = make_context();
    const std::string input = "fetch(`/api/${id}`); // fetch('/x')\n";
    EXPECT_EQ(rewrite_javascript(input, ctx), input);
}

TEST(RewriteContent, PassthroughUnmodified)
{
    auto ctx = make_context();
    const std::string png("\x89PNG\r\n\x1a\n\0\0\0\rIHDR url(/x)", 24);
    EXPECT_EQ(rewrite_content(png, "image/png", ctx), png);
}

TEST(RewriteContent, DispatchesOnType)
{
    auto ctx = make_context();
    EXPECT_EQ(rewrite_content("a{background:url(/x.png)}", "text/css", ctx),
              "a{background:url(" + proxied("https://example.com/x.png") + ")}");
    EXPECT_EQ(rewrite_content("<a href=\"/x\">", ContentKind::Html, ctx),
              "<a href=\"" + proxied("https://example.com/x") + "\">");
}
