#include "test_base.hpp"
#include "core/content_fetcher.hpp"
#include <atomic>

class ContentFetcherTest : public TestBase
{
protected:
    FetchOptions quickOptions(int max_redirects = 5)
    {
        FetchOptions options;
        options.headers = ContentFetcher::buildBrowserHeaders();
        options.timeout = std::chrono::milliseconds(2000);
        options.max_redirects = max_redirects;
        return options;
    }
};

TEST_F(ContentFetcherTest, NormalizeUrlAddsHttpsScheme)
{
    EXPECT_EQ(ContentFetcher::normalizeUrl("example.com/a.png"), "https://example.com/a.png");
    EXPECT_EQ(ContentFetcher::normalizeUrl("//cdn.example.com/a.png"), "https://cdn.example.com/a.png");
    EXPECT_EQ(ContentFetcher::normalizeUrl("  http://example.com/x  "), "http://example.com/x");
    EXPECT_EQ(ContentFetcher::normalizeUrl("https://example.com"), "https://example.com");
}

TEST_F(ContentFetcherTest, SplitUrl)
{
    auto parts = ContentFetcher::splitUrl("http://127.0.0.1:8080/api/random?type=json#frag");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->scheme, "http");
    EXPECT_EQ(parts->host, "127.0.0.1");
    EXPECT_EQ(parts->port, 8080);
    EXPECT_EQ(parts->path, "/api/random?type=json");
    EXPECT_EQ(parts->origin(), "http://127.0.0.1:8080");

    auto secure = ContentFetcher::splitUrl("HTTPS://example.com");
    ASSERT_TRUE(secure.has_value());
    EXPECT_EQ(secure->scheme, "https");
    EXPECT_EQ(secure->port, 443);
    EXPECT_EQ(secure->path, "/");
    EXPECT_EQ(secure->origin(), "https://example.com");

    EXPECT_FALSE(ContentFetcher::splitUrl("ftp://example.com/file").has_value());
    EXPECT_FALSE(ContentFetcher::splitUrl("http://example.com:notaport/").has_value());
    EXPECT_FALSE(ContentFetcher::splitUrl("http:///path").has_value());
}

TEST_F(ContentFetcherTest, SplitUrlWithIpv6Host)
{
    auto parts = ContentFetcher::splitUrl("http://[::1]:8080/img.png");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->host, "[::1]");
    EXPECT_EQ(parts->port, 8080);
    EXPECT_EQ(parts->path, "/img.png");
    EXPECT_EQ(parts->origin(), "http://[::1]:8080");

    auto default_port = ContentFetcher::splitUrl("https://[2001:db8::7]/");
    ASSERT_TRUE(default_port.has_value());
    EXPECT_EQ(default_port->host, "[2001:db8::7]");
    EXPECT_EQ(default_port->port, 443);

    EXPECT_FALSE(ContentFetcher::splitUrl("http://[::1:8080/").has_value());
    EXPECT_FALSE(ContentFetcher::splitUrl("http://[::1]:port/").has_value());
}

TEST_F(ContentFetcherTest, ResolveLocationForms)
{
    const std::string current = "http://api.example.com:8080/v1/random";
    EXPECT_EQ(ContentFetcher::resolveLocation(current, "https://img.example.com/a.jpg"), "https://img.example.com/a.jpg");
    EXPECT_EQ(ContentFetcher::resolveLocation(current, "//img.example.com/a.jpg"), "http://img.example.com/a.jpg");
    EXPECT_EQ(ContentFetcher::resolveLocation(current, "/images/a.jpg"), "http://api.example.com:8080/images/a.jpg");
    EXPECT_EQ(ContentFetcher::resolveLocation(current, "img.example.com/a.jpg"), "https://img.example.com/a.jpg");
}

TEST_F(ContentFetcherTest, BrowserHeadersCarryConfiguredUserAgent)
{
    PocoConfigManager::getInstance().update({{"download", {{"user_agent", "TestAgent/1.0"}}}});
    auto headers = ContentFetcher::buildBrowserHeaders();
    auto it = headers.find("User-Agent");
    ASSERT_NE(it, headers.end());
    EXPECT_EQ(it->second, "TestAgent/1.0");
    EXPECT_NE(headers.find("Accept"), headers.end());
}

TEST_F(ContentFetcherTest, FetchesPlainResponse)
{
    TestHttpServer http;
    std::atomic<bool> saw_agent{false};
    http.server().Get("/hello", [&](const httplib::Request &req, httplib::Response &res)
                      {
                          saw_agent = req.get_header_value("User-Agent").find("Mozilla") != std::string::npos;
                          res.set_content("hello", "text/plain"); });
    http.start();

    FetchResult result = ContentFetcher::fetchFinalContent(http.url("/hello"), quickOptions());
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body, "hello");
    EXPECT_EQ(result.final_url, http.url("/hello"));
    EXPECT_EQ(result.redirects_followed, 0);
    EXPECT_TRUE(saw_agent.load());
}

TEST_F(ContentFetcherTest, FollowsRelativeAndSchemeRelativeRedirects)
{
    TestHttpServer http;
    std::string authority = "127.0.0.1:" + std::to_string(http.port());
    http.server().Get("/start", [](const httplib::Request &, httplib::Response &res)
                      {
                          res.status = 302;
                          res.set_header("Location", "/middle"); });
    http.server().Get("/middle", [authority](const httplib::Request &, httplib::Response &res)
                      {
                          res.status = 301;
                          res.set_header("Location", "//" + authority + "/end"); });
    http.server().Get("/end", [](const httplib::Request &, httplib::Response &res)
                      { res.set_content("final", "text/plain"); });
    http.start();

    FetchResult result = ContentFetcher::fetchFinalContent(http.url("/start"), quickOptions());
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.body, "final");
    EXPECT_EQ(result.redirects_followed, 2);
    EXPECT_EQ(result.final_url, http.url("/end"));
}

TEST_F(ContentFetcherTest, LocationOnSuccessStatusIsStillARedirect)
{
    TestHttpServer http;
    http.server().Get("/sneaky", [](const httplib::Request &, httplib::Response &res)
                      {
                          res.status = 200;
                          res.set_header("Location", "/real");
                          res.set_content("decoy", "text/plain"); });
    http.serveText("/real", "real", "text/plain");
    http.start();

    FetchResult result = ContentFetcher::fetchFinalContent(http.url("/sneaky"), quickOptions());
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.body, "real");
    EXPECT_EQ(result.redirects_followed, 1);
}

TEST_F(ContentFetcherTest, RedirectLoopStopsAfterBudget)
{
    TestHttpServer http;
    std::atomic<int> requests{0};
    http.server().Get("/loop", [&](const httplib::Request &, httplib::Response &res)
                      {
                          requests++;
                          res.status = 302;
                          res.set_header("Location", "/loop"); });
    http.start();

    FetchResult result = ContentFetcher::fetchFinalContent(http.url("/loop"), quickOptions(3));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(requests.load(), 4);
    EXPECT_EQ(result.redirects_followed, 3);
    EXPECT_NE(result.error_message.find("redirect"), std::string::npos);
}

TEST_F(ContentFetcherTest, ZeroRedirectBudgetRejectsFirstRedirect)
{
    TestHttpServer http;
    http.server().Get("/moved", [](const httplib::Request &, httplib::Response &res)
                      {
                          res.status = 301;
                          res.set_header("Location", "/elsewhere"); });
    http.serveText("/elsewhere", "x", "text/plain");
    http.start();

    FetchResult result = ContentFetcher::fetchFinalContent(http.url("/moved"), quickOptions(0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, 301);
}

TEST_F(ContentFetcherTest, NonOkStatusFails)
{
    TestHttpServer http;
    http.serveText("/missing", "not here", "text/plain", 404);
    http.start();

    FetchResult result = ContentFetcher::fetchFinalContent(http.url("/missing"), quickOptions());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.status, 404);
    EXPECT_TRUE(result.body.empty());
}

TEST_F(ContentFetcherTest, SlowServerTimesOut)
{
    TestHttpServer http;
    http.server().Get("/slow", [](const httplib::Request &, httplib::Response &res)
                      {
                          std::this_thread::sleep_for(std::chrono::milliseconds(1500));
                          res.set_content("late", "text/plain"); });
    http.start();

    FetchOptions options = quickOptions();
    options.timeout = std::chrono::milliseconds(300);
    auto started = std::chrono::steady_clock::now();
    FetchResult result = ContentFetcher::fetchFinalContent(http.url("/slow"), options);
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_LT(elapsed, std::chrono::milliseconds(1400));
}

TEST_F(ContentFetcherTest, UnsupportedSchemeFailsWithoutRequest)
{
    FetchResult result = ContentFetcher::fetchFinalContent("ftp://example.com/file.png", quickOptions());
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("Unsupported URL"), std::string::npos);
}
