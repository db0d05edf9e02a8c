#include <gtest/gtest.h>

#include <atomic>
#include <mutex>

#include "models/model_downloader.h"
#include "test_support.h"

using namespace airdl;
using airdl::test::LocalServer;
using airdl::test::TempDir;
using airdl::test::read_file;
namespace fs = std::filesystem;

namespace {

RegistryInfo registryFor(const LocalServer& server) {
    RegistryInfo info;
    info.domain = "127.0.0.1";
    info.base_url = server.baseUrl();
    return info;
}

ModelDownloader makeDownloader(const LocalServer& server,
                               std::optional<std::string> token = std::nullopt,
                               size_t chunk_size = kDefaultChunkSize,
                               int max_redirects = kDefaultMaxRedirects) {
    return ModelDownloader(registryFor(server), std::move(token), std::chrono::milliseconds(5000), chunk_size,
                           max_redirects);
}

}  // namespace

TEST(ModelDownloaderHttpTest, HtmlResponseFailsWithoutTouchingDisk) {
    LocalServer srv;
    srv.server.Get("/api/download/models/1", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("<html><body>Please log in</body></html>", "text/html; charset=utf-8");
    });
    srv.start();

    TempDir temp;
    const auto dest = temp.path / "models";
    auto downloader = makeDownloader(srv, std::string("tok"));
    auto outcome = downloader.transfer({srv.baseUrl() + "/api/download/models/1", true}, dest);

    EXPECT_EQ(outcome.code, DownloadErrorCode::kUnexpectedContentType);
    EXPECT_FALSE(outcome.data.has_value());
    EXPECT_FALSE(fs::exists(dest));
}

TEST(ModelDownloaderHttpTest, DeclaredLengthIsReachedAndReportedAsComplete) {
    LocalServer srv;
    const std::string body(1024, 'w');
    srv.server.Get("/api/download/models/7", [&](const httplib::Request&, httplib::Response& res) {
        res.set_header("Content-Disposition", "attachment; filename=\"weights.safetensors\"");
        res.set_content(body, "application/octet-stream");
    });
    srv.start();

    TempDir temp;
    std::vector<std::pair<size_t, size_t>> reports;
    auto downloader = makeDownloader(srv);
    auto outcome = downloader.transfer({srv.baseUrl() + "/api/download/models/7", true}, temp.path,
                                       [&](size_t downloaded, size_t total) {
                                           reports.emplace_back(downloaded, total);
                                       });

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    const auto& result = *outcome.data;
    EXPECT_EQ(result.bytes_written, 1024u);
    EXPECT_EQ(result.declared_length.value_or(0), 1024u);
    EXPECT_EQ(result.filename, "weights.safetensors");
    EXPECT_EQ(result.local_path, temp.path / "weights.safetensors");
    EXPECT_EQ(result.final_url, srv.baseUrl() + "/api/download/models/7");
    EXPECT_TRUE(result.redirects.empty());
    EXPECT_EQ(read_file(result.local_path), body);

    ASSERT_FALSE(reports.empty());
    EXPECT_EQ(reports.back().first, 1024u);
    EXPECT_EQ(reports.back().second, 1024u);
}

TEST(ModelDownloaderHttpTest, MapsFinalStatusToFailureKind) {
    LocalServer srv;
    srv.server.Get(R"(/status/(\d+))", [](const httplib::Request& req, httplib::Response& res) {
        res.status = std::stoi(req.matches[1].str());
        res.set_content("{}", "application/json");
    });
    srv.start();

    const std::pair<int, DownloadErrorCode> cases[] = {
        {400, DownloadErrorCode::kAccessDenied},  {401, DownloadErrorCode::kAccessDenied},
        {403, DownloadErrorCode::kAccessDenied},  {404, DownloadErrorCode::kNotFound},
        {410, DownloadErrorCode::kNotFound},      {500, DownloadErrorCode::kUpstreamError},
        {503, DownloadErrorCode::kUpstreamError}, {429, DownloadErrorCode::kUnexpectedStatus},
    };

    TempDir temp;
    auto downloader = makeDownloader(srv);
    for (const auto& [status, expected] : cases) {
        auto outcome = downloader.transfer({srv.baseUrl() + "/status/" + std::to_string(status), true},
                                           temp.path / "out");
        EXPECT_EQ(outcome.code, expected) << "status " << status;
    }
    EXPECT_FALSE(fs::exists(temp.path / "out"));
}

TEST(ModelDownloaderHttpTest, RecordsRedirectsAndStripsTokenOffOrigin) {
    LocalServer storage;
    std::mutex mu;
    std::string storage_auth = "<unset>";
    storage.server.Get("/blob/abc", [&](const httplib::Request& req, httplib::Response& res) {
        {
            std::lock_guard<std::mutex> lock(mu);
            storage_auth = req.get_header_value("Authorization");
        }
        res.set_header("Content-Disposition", "attachment; filename=lora%20v2.safetensors");
        res.set_content("payload", "application/octet-stream");
    });
    storage.start();

    LocalServer registry;
    std::string registry_auth;
    std::string hop_auth;
    registry.server.Get("/api/download/models/746484", [&](const httplib::Request& req, httplib::Response& res) {
        {
            std::lock_guard<std::mutex> lock(mu);
            registry_auth = req.get_header_value("Authorization");
        }
        res.set_redirect("/signed?id=746484", 302);
    });
    registry.server.Get("/signed", [&](const httplib::Request& req, httplib::Response& res) {
        {
            std::lock_guard<std::mutex> lock(mu);
            hop_auth = req.get_header_value("Authorization");
        }
        res.set_redirect(storage.baseUrl() + "/blob/abc?sig=xyz", 307);
    });
    registry.start();

    TempDir temp;
    auto downloader = makeDownloader(registry, std::string("secret"));
    auto outcome = downloader.transfer({registry.baseUrl() + "/api/download/models/746484", true}, temp.path);

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    const auto& result = *outcome.data;
    ASSERT_EQ(result.redirects.size(), 2u);
    EXPECT_EQ(result.redirects[0].status, 302);
    EXPECT_EQ(result.redirects[0].url, registry.baseUrl() + "/signed?id=746484");
    EXPECT_EQ(result.redirects[1].status, 307);
    EXPECT_EQ(result.redirects[1].url, storage.baseUrl() + "/blob/abc?sig=xyz");
    EXPECT_EQ(result.final_url, storage.baseUrl() + "/blob/abc?sig=xyz");
    EXPECT_EQ(result.filename, "lora v2.safetensors");
    EXPECT_EQ(read_file(result.local_path), "payload");

    std::lock_guard<std::mutex> lock(mu);
    EXPECT_EQ(registry_auth, "Bearer secret");
    EXPECT_EQ(hop_auth, "Bearer secret");
    EXPECT_EQ(storage_auth, "");
}

TEST(ModelDownloaderHttpTest, TooManyRedirectsFails) {
    LocalServer srv;
    srv.server.Get("/loop", [](const httplib::Request&, httplib::Response& res) {
        res.set_redirect("/loop", 302);
    });
    srv.start();

    TempDir temp;
    auto downloader = makeDownloader(srv, std::nullopt, kDefaultChunkSize, /*max_redirects=*/3);
    auto outcome = downloader.transfer({srv.baseUrl() + "/loop", true}, temp.path);
    EXPECT_EQ(outcome.code, DownloadErrorCode::kTooManyRedirects);
}

TEST(ModelDownloaderHttpTest, RedirectWithoutLocationFails) {
    LocalServer srv;
    srv.server.Get("/moved", [](const httplib::Request&, httplib::Response& res) {
        res.status = 302;
    });
    srv.start();

    TempDir temp;
    auto outcome = makeDownloader(srv).transfer({srv.baseUrl() + "/moved", true}, temp.path);
    EXPECT_EQ(outcome.code, DownloadErrorCode::kTooManyRedirects);
}

TEST(ModelDownloaderHttpTest, MissingContentLengthStillSucceeds) {
    LocalServer srv;
    srv.server.Get("/files/streamed.bin", [](const httplib::Request&, httplib::Response& res) {
        res.set_chunked_content_provider("application/octet-stream", [](size_t offset, httplib::DataSink& sink) {
            if (offset < 1500) {
                const std::string part(500, 's');
                sink.write(part.data(), part.size());
            } else {
                sink.done();
            }
            return true;
        });
    });
    srv.start();

    TempDir temp;
    size_t last_total = 999;
    auto outcome = makeDownloader(srv).transfer({srv.baseUrl() + "/files/streamed.bin", true}, temp.path,
                                                [&](size_t, size_t total) { last_total = total; });

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_FALSE(outcome.data->declared_length.has_value());
    EXPECT_EQ(outcome.data->bytes_written, 1500u);
    EXPECT_EQ(outcome.data->filename, "streamed.bin");
    EXPECT_EQ(last_total, 0u);
    EXPECT_EQ(fs::file_size(outcome.data->local_path), 1500u);
}

TEST(ModelDownloaderHttpTest, WritesInChunksWithMonotonicProgress) {
    LocalServer srv;
    const std::string body(10000, 'c');
    srv.server.Get("/chunked.bin", [&](const httplib::Request&, httplib::Response& res) {
        res.set_content(body, "application/octet-stream");
    });
    srv.start();

    TempDir temp;
    std::vector<size_t> seen;
    auto downloader = makeDownloader(srv, std::nullopt, /*chunk_size=*/1000);
    auto outcome = downloader.transfer({srv.baseUrl() + "/chunked.bin", true}, temp.path,
                                       [&](size_t downloaded, size_t) { seen.push_back(downloaded); });

    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.data->bytes_written, 10000u);
    ASSERT_GE(seen.size(), 10u);
    for (size_t i = 1; i < seen.size(); ++i) {
        EXPECT_GE(seen[i], seen[i - 1]);
    }
    EXPECT_EQ(seen.front(), 1000u);
    EXPECT_EQ(seen.back(), 10000u);
}

TEST(ModelDownloaderHttpTest, CancelMidStreamKeepsPartialFile) {
    LocalServer srv;
    const std::string body(512 * 1024, 'p');
    srv.server.Get("/big.bin", [&](const httplib::Request&, httplib::Response& res) {
        res.set_content(body, "application/octet-stream");
    });
    srv.start();

    TempDir temp;
    std::atomic<bool> cancel{false};
    auto downloader = makeDownloader(srv, std::nullopt, /*chunk_size=*/1024);
    auto outcome = downloader.transfer({srv.baseUrl() + "/big.bin", true}, temp.path,
                                       [&](size_t, size_t) { cancel = true; }, &cancel);

    EXPECT_EQ(outcome.code, DownloadErrorCode::kCancelled);
    const auto partial = temp.path / "big.bin";
    ASSERT_TRUE(fs::exists(partial));
    EXPECT_GT(fs::file_size(partial), 0u);
    EXPECT_LT(fs::file_size(partial), body.size());
}

TEST(ModelDownloaderHttpTest, CancelBeforeStartSendsNothing) {
    LocalServer srv;
    std::atomic<int> hits{0};
    srv.server.Get("/x", [&](const httplib::Request&, httplib::Response& res) {
        ++hits;
        res.set_content("x", "application/octet-stream");
    });
    srv.start();

    TempDir temp;
    std::atomic<bool> cancel{true};
    auto outcome = makeDownloader(srv).transfer({srv.baseUrl() + "/x", true}, temp.path, nullptr, &cancel);
    EXPECT_EQ(outcome.code, DownloadErrorCode::kCancelled);
    EXPECT_EQ(hits.load(), 0);
}

TEST(ModelDownloaderHttpTest, PlainTextBodyIsAccepted) {
    LocalServer srv;
    srv.server.Get("/files/model.yaml", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("model:\n  target: ldm\n", "text/plain");
    });
    srv.start();

    TempDir temp;
    auto outcome = makeDownloader(srv).transfer({srv.baseUrl() + "/files/model.yaml", true}, temp.path);
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(read_file(outcome.data->local_path), "model:\n  target: ldm\n");
}

TEST(ModelDownloaderHttpTest, NoTokenWhenTargetDoesNotExpectAuth) {
    LocalServer srv;
    std::atomic<bool> had_auth{true};
    srv.server.Get("/public.bin", [&](const httplib::Request& req, httplib::Response& res) {
        had_auth = req.has_header("Authorization");
        res.set_content("pub", "application/octet-stream");
    });
    srv.start();

    TempDir temp;
    auto outcome =
        makeDownloader(srv, std::string("secret")).transfer({srv.baseUrl() + "/public.bin", false}, temp.path);
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_FALSE(had_auth.load());
}

#ifndef _WIN32
TEST(ModelDownloaderHttpTest, SavedFileIsWorldReadable) {
    LocalServer srv;
    srv.server.Get("/perm.bin", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("perm", "application/octet-stream");
    });
    srv.start();

    TempDir temp;
    auto outcome = makeDownloader(srv).transfer({srv.baseUrl() + "/perm.bin", true}, temp.path);
    ASSERT_TRUE(outcome.ok()) << outcome.message;
    const auto perms = fs::status(outcome.data->local_path).permissions();
    const auto expected = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                          fs::perms::others_read;
    EXPECT_EQ(perms & fs::perms::all, expected);
}
#endif

TEST(ModelDownloaderTest, RejectsHtmlLikeContentTypes) {
    EXPECT_TRUE(isRejectedContentType("text/html"));
    EXPECT_TRUE(isRejectedContentType("TEXT/HTML; charset=UTF-8"));
    EXPECT_TRUE(isRejectedContentType(" application/xhtml+xml "));
    EXPECT_FALSE(isRejectedContentType("text/plain"));
    EXPECT_FALSE(isRejectedContentType("application/octet-stream"));
    EXPECT_FALSE(isRejectedContentType(""));
}

TEST(ModelDownloaderTest, InvalidTargetUrlIsRejected) {
    RegistryInfo registry;
    ModelDownloader downloader(registry, std::nullopt);
    TempDir temp;
    auto outcome = downloader.transfer({"not a url", true}, temp.path);
    EXPECT_EQ(outcome.code, DownloadErrorCode::kInvalidReference);
}

TEST(ModelDownloaderTest, NormalizesChunkSizeAndRedirectLimit) {
    ModelDownloader defaults(RegistryInfo{}, std::nullopt, std::chrono::milliseconds(1000), 0, -4);
    EXPECT_EQ(defaults.getChunkSize(), kDefaultChunkSize);
    EXPECT_EQ(defaults.getMaxRedirects(), 0);

    ModelDownloader custom(RegistryInfo{}, std::nullopt, std::chrono::milliseconds(1000), 4096, 3);
    EXPECT_EQ(custom.getChunkSize(), 4096u);
    EXPECT_EQ(custom.getMaxRedirects(), 3);
}
