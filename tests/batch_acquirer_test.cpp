#include "test_base.hpp"
#include "core/batch_acquirer.hpp"
#include <stdexcept>

class BatchAcquirerTest : public TestBase
{
protected:
    BatchAcquirer makeAcquirer(std::chrono::milliseconds source_timeout = std::chrono::milliseconds(2000))
    {
        FetchOptions source_options;
        source_options.headers = ContentFetcher::buildBrowserHeaders();
        source_options.timeout = source_timeout;
        source_options.max_redirects = 5;

        FetchOptions download_options = source_options;
        download_options.timeout = std::chrono::milliseconds(2000);
        return BatchAcquirer(source_options, ImageDownloader(download_options));
    }
};

TEST_F(BatchAcquirerTest, DefaultParserKeyOrder)
{
    EXPECT_EQ(BatchAcquirer::defaultReferenceParser({{"url", "a"}, {"img", "b"}}).value_or(""), "a");
    EXPECT_EQ(BatchAcquirer::defaultReferenceParser({{"img", "b"}, {"text", "c"}}).value_or(""), "b");
    EXPECT_EQ(BatchAcquirer::defaultReferenceParser({{"text", "c"}}).value_or(""), "c");
    EXPECT_EQ(BatchAcquirer::defaultReferenceParser({{"url", 42}}).value_or(""), "42");

    auto nested = nlohmann::json::parse(R"({"data":[{"url":"https://x/1.jpg"}]})");
    EXPECT_EQ(BatchAcquirer::defaultReferenceParser(nested).value_or(""), "https://x/1.jpg");

    auto original = nlohmann::json::parse(R"({"data":[{"urls":{"original":"https://x/2.png","small":"s"}}]})");
    EXPECT_EQ(BatchAcquirer::defaultReferenceParser(original).value_or(""), "https://x/2.png");

    EXPECT_FALSE(BatchAcquirer::defaultReferenceParser(nlohmann::json::parse(R"({"error":"quota"})")).has_value());
    EXPECT_FALSE(BatchAcquirer::defaultReferenceParser(nlohmann::json::parse(R"({"data":[]})")).has_value());
    EXPECT_FALSE(BatchAcquirer::defaultReferenceParser(nlohmann::json::parse("[1,2,3]")).has_value());
    EXPECT_FALSE(BatchAcquirer::defaultReferenceParser(nlohmann::json::parse(R"({"url":""})")).has_value());
}

TEST_F(BatchAcquirerTest, CleanSourcesTrimsAndDeduplicates)
{
    auto cleaned = BatchAcquirer::cleanSources({"  http://a/x ", "http://b/y", "", "   ", "http://a/x", "http://b/y\n"});
    ASSERT_EQ(cleaned.size(), 2u);
    EXPECT_EQ(cleaned[0], "http://a/x");
    EXPECT_EQ(cleaned[1], "http://b/y");
}

TEST_F(BatchAcquirerTest, RelativeReferencesTakeSourceScheme)
{
    EXPECT_EQ(BatchAcquirer::absolutizeReference("https://api.test/r", "//cdn.test/a.jpg"), "https://cdn.test/a.jpg");
    EXPECT_EQ(BatchAcquirer::absolutizeReference("http://api.test/r", "cdn.test/a.jpg"), "http://cdn.test/a.jpg");
    EXPECT_EQ(BatchAcquirer::absolutizeReference("http://api.test/r", "https://cdn.test/a.jpg"), "https://cdn.test/a.jpg");
}

TEST_F(BatchAcquirerTest, EmptySourceListDoesNothing)
{
    BatchSummary summary = makeAcquirer().acquireFromSources({" ", ""}, testDir(), 3);
    EXPECT_EQ(summary.success_count, 0);
    EXPECT_EQ(summary.failure_count, 0);
    EXPECT_TRUE(summary.details.empty());
}

TEST_F(BatchAcquirerTest, JsonSourceDownloadsReferencedImage)
{
    TestHttpServer http;
    http.serveBytes("/img.png", makePng(24, 12), "image/png");
    http.serveText("/api", R"({"code":200,"url":")" + http.url("/img.png") + R"("})", "application/json");
    http.start();

    BatchSummary summary = makeAcquirer().acquireFromSources({http.url("/api")}, testDir(), 2);
    EXPECT_EQ(summary.success_count, 2);
    EXPECT_EQ(summary.failure_count, 0);
    ASSERT_EQ(summary.details.size(), 2u);
    for (const auto &detail : summary.details)
    {
        EXPECT_EQ(detail.kind, AcquisitionKind::JSON);
        EXPECT_EQ(detail.reference, http.url("/img.png"));
        EXPECT_TRUE(std::filesystem::exists(detail.file_path));
    }
    EXPECT_EQ(summary.details[0].round, 1);
    EXPECT_EQ(summary.details[1].round, 2);
    // Same image twice is stored once
    EXPECT_EQ(countFiles(testDir()), 1u);
}

TEST_F(BatchAcquirerTest, DirectImageSourceIsSavedAsIs)
{
    auto jpeg = makeJpeg(20, 20);
    TestHttpServer http;
    http.serveBytes("/random", jpeg, "image/jpeg");
    http.start();

    BatchSummary summary = makeAcquirer().acquireFromSources({http.url("/random")}, testDir(), 1);
    ASSERT_EQ(summary.details.size(), 1u);
    const auto &detail = summary.details.front();
    EXPECT_EQ(detail.kind, AcquisitionKind::DIRECT);
    EXPECT_EQ(detail.reference, http.url("/random"));
    EXPECT_EQ(std::filesystem::path(detail.file_path).extension().string(), ".jpg");
    EXPECT_EQ(summary.success_count, 1);
}

TEST_F(BatchAcquirerTest, UndecodableDirectImageIsRemoved)
{
    std::vector<uint8_t> fake = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 'g', 'a', 'r', 'b', 'a', 'g', 'e'};
    TestHttpServer http;
    http.serveBytes("/fake", fake, "image/png");
    http.start();

    BatchSummary summary = makeAcquirer().acquireFromSources({http.url("/fake")}, testDir(), 1);
    EXPECT_EQ(summary.failure_count, 1);
    ASSERT_EQ(summary.details.size(), 1u);
    EXPECT_EQ(summary.details.front().kind, AcquisitionKind::FAILED);
    EXPECT_EQ(countFiles(testDir()), 0u);
}

TEST_F(BatchAcquirerTest, JsonWithoutReferenceCarriesSnippet)
{
    std::string body = R"({"error":"rate limited","detail":")" + std::string(300, 'x') + R"("})";
    TestHttpServer http;
    http.serveText("/api", body, "application/json");
    http.start();

    BatchSummary summary = makeAcquirer().acquireFromSources({http.url("/api")}, testDir(), 1);
    ASSERT_EQ(summary.details.size(), 1u);
    const auto &error = summary.details.front().error;
    EXPECT_NE(error.find("rate limited"), std::string::npos);
    EXPECT_NE(error.find(body.substr(0, 200)), std::string::npos);
    EXPECT_EQ(error.find(body.substr(0, 201)), std::string::npos);
}

TEST_F(BatchAcquirerTest, CustomParserIsUsed)
{
    TestHttpServer http;
    http.serveBytes("/deep.png", makePng(10, 10, 4), "image/png");
    http.serveText("/api", R"({"result":{"picture":"/deep.png"}})", "application/json");
    http.start();

    std::string base = http.url("");
    BatchAcquirer::ReferenceParser parser = [base](const nlohmann::json &doc) -> std::optional<std::string>
    {
        return base + doc.at("result").at("picture").get<std::string>();
    };
    BatchSummary summary = makeAcquirer().acquireFromSources({http.url("/api")}, testDir(), 1, parser);
    EXPECT_EQ(summary.success_count, 1) << (summary.details.empty() ? "" : summary.details.front().error);
}

TEST_F(BatchAcquirerTest, MixedSourcesNeverAbortTheBatch)
{
    TestHttpServer http;
    http.server().Get("/slow", [](const httplib::Request &, httplib::Response &res)
                      {
                          std::this_thread::sleep_for(std::chrono::milliseconds(1200));
                          res.set_content("{}", "application/json"); });
    http.serveText("/html", "<!DOCTYPE html><html><body>502 Bad Gateway error</body></html>", "text/html");
    http.serveBytes("/img.png", makePng(12, 30, 5), "image/png");
    http.serveText("/api", R"({"url":")" + http.url("/img.png") + R"("})", "application/json");
    http.start();

    std::vector<std::string> sources = {http.url("/slow"), http.url("/html"), http.url("/api")};
    BatchSummary summary = makeAcquirer(std::chrono::milliseconds(300)).acquireFromSources(sources, testDir(), 2);

    EXPECT_EQ(summary.success_count, 2);
    EXPECT_EQ(summary.failure_count, 4);
    ASSERT_EQ(summary.details.size(), 6u);

    for (size_t i = 0; i < summary.details.size(); ++i)
    {
        const auto &detail = summary.details[i];
        EXPECT_EQ(detail.round, static_cast<int>(i / 3) + 1);
        EXPECT_EQ(detail.source, sources[i % 3]);
    }
    EXPECT_EQ(summary.details[0].kind, AcquisitionKind::FAILED);
    EXPECT_EQ(summary.details[1].kind, AcquisitionKind::FAILED);
    EXPECT_NE(summary.details[1].error.find("502 Bad Gateway"), std::string::npos);
    EXPECT_EQ(summary.details[2].kind, AcquisitionKind::JSON);
    EXPECT_EQ(summary.details[5].kind, AcquisitionKind::JSON);
}

TEST_F(BatchAcquirerTest, ThrowingParserFailsOnlyThatAttempt)
{
    TestHttpServer http;
    http.serveBytes("/img.png", makePng(10, 10, 6), "image/png");
    http.serveText("/bad", R"({"result":{}})", "application/json");
    http.serveText("/good", R"({"url":")" + http.url("/img.png") + R"("})", "application/json");
    http.start();

    BatchAcquirer::ReferenceParser parser = [](const nlohmann::json &doc) -> std::optional<std::string>
    {
        if (!doc.contains("url"))
            throw std::runtime_error("layout changed");
        return doc.at("url").get<std::string>();
    };

    std::vector<std::string> sources = {http.url("/bad"), http.url("/good")};
    BatchSummary summary = makeAcquirer().acquireFromSources(sources, testDir(), 1, parser);
    ASSERT_EQ(summary.details.size(), 2u);
    EXPECT_EQ(summary.failure_count, 1);
    EXPECT_EQ(summary.success_count, 1);
    EXPECT_EQ(summary.details[0].kind, AcquisitionKind::FAILED);
    EXPECT_NE(summary.details[0].error.find("layout changed"), std::string::npos);
    EXPECT_EQ(summary.details[1].kind, AcquisitionKind::JSON);
}

TEST_F(BatchAcquirerTest, RoundsDefaultToConfiguration)
{
    PocoConfigManager::getInstance().update({{"batch", {{"rounds_per_source", 2}}}});

    TestHttpServer http;
    http.serveBytes("/random", makeJpeg(16, 16, 3), "image/jpeg");
    http.start();

    BatchAcquirer acquirer = makeAcquirer();
    EXPECT_EQ(acquirer.roundsPerSource(), 2);
    BatchSummary summary = acquirer.acquireFromSources({http.url("/random")}, testDir());
    ASSERT_EQ(summary.details.size(), 2u);
    EXPECT_EQ(summary.details[1].round, 2);
    EXPECT_EQ(summary.success_count, 2);

    acquirer.setRoundsPerSource(0);
    EXPECT_TRUE(acquirer.acquireFromSources({http.url("/random")}, testDir()).details.empty());
}

TEST_F(BatchAcquirerTest, SignaturelessImageIsDecodedAsLastResort)
{
    // Binary PPM: no magic-number entry, but OpenCV decodes it
    std::string ppm = "P6\n4 2\n255\n";
    for (int i = 0; i < 4 * 2 * 3; ++i)
        ppm.push_back(static_cast<char>(i * 10));

    TestHttpServer http;
    http.serveText("/ppm", ppm, "image/x-portable-pixmap");
    http.serveText("/noise", "plain words that are no image", "text/plain");
    http.start();

    BatchSummary summary = makeAcquirer().acquireFromSources({http.url("/ppm"), http.url("/noise")}, testDir(), 1);
    ASSERT_EQ(summary.details.size(), 2u);
    EXPECT_EQ(summary.details[0].kind, AcquisitionKind::DIRECT) << summary.details[0].error;
    EXPECT_EQ(std::filesystem::path(summary.details[0].file_path).extension().string(), ".pnm");
    EXPECT_EQ(summary.details[1].kind, AcquisitionKind::FAILED);
    EXPECT_NE(summary.details[1].error.find("Unrecognized response"), std::string::npos);
    EXPECT_EQ(countFiles(testDir()), 1u);
}
