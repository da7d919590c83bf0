#include <gtest/gtest.h>
#include "common/ferry_test_helpers.h"
#include <ferry/pipeline/pipeline_coordinator.h>

#include <algorithm>
#include <deque>
#include <functional>
#include <system_error>

using namespace ferry;
using namespace ferry::pipeline;
using namespace std::chrono_literals;
using session::SessionStatus;
namespace fs = std::filesystem;

namespace {

constexpr const char* kUri = "https://youtu.be/abc123";
constexpr const char* kOkBody =
    R"({"status":"ok","data":{"downloadPage":"https://gofile.io/d/AbC","directLink":"https://store1.gofile.io/download/AbC/clip.mp4","id":"f-1"}})";

class FakeExtractor : public downloader::IMediaExtractor {
public:
    Result<media::MediaInfo> probe(const std::string&) override {
        if (probeError) {
            return *probeError;
        }
        media::MediaInfo info;
        info.title = "Sample Clip";
        info.uploader = "Someone";
        for (auto [height, ext] : {std::pair{720, "mp4"}, std::pair{480, "webm"}}) {
            media::RawFormat f;
            f.formatId = std::to_string(height);
            f.ext = ext;
            f.vcodec = "avc1";
            f.acodec = "mp4a";
            f.height = height;
            info.formats.push_back(f);
        }
        return info;
    }

    Result<downloader::FetchResult> fetch(const downloader::FetchRequest& request,
                                          const downloader::ProgressCallback& onProgress) override {
        if (fetchError) {
            return *fetchError;
        }
        onProgress(downloader::FetchProgress{size / 2, size, 1024.0});
        downloader::FetchResult out;
        out.path = request.workDir / (request.sessionId + "." + request.variant.container);
        out.title = "Sample Clip";
        test::write_file(out.path, size);
        return out;
    }

    std::uint64_t size{10 * KiB};
    std::optional<Error> probeError;
    std::optional<Error> fetchError;
};

class FakeTransport : public uploader::IHttpTransport {
public:
    boost::asio::awaitable<Result<long>> probe(std::string, std::chrono::milliseconds) override {
        co_return 200L;
    }

    boost::asio::awaitable<Result<uploader::HttpResponse>>
    postMultipart(uploader::MultipartUpload request, uploader::ChunkCallback onChunk) override {
        ++posts;
        const auto total = fs::file_size(request.file);
        onChunk(total, total);
        if (failures > 0) {
            --failures;
            co_return Error{ErrorCode::NetworkError, "connection reset"};
        }
        co_return uploader::HttpResponse{200, kOkBody};
    }

    int failures{0};
    int posts{0};
};

class FakeDelivery : public IInlineDelivery {
public:
    boost::asio::awaitable<Result<void>> deliver(DeliveryRequest request) override {
        fileExisted = fs::exists(request.path);
        if (onDeliver) {
            onDeliver(request);
        }
        requests.push_back(std::move(request));
        if (error) {
            co_return *error;
        }
        co_return Result<void>();
    }

    std::vector<DeliveryRequest> requests;
    bool fileExisted{false};
    std::optional<Error> error;
    std::function<void(const DeliveryRequest&)> onDeliver;
};

class RecordingAudit : public IAuditLog {
public:
    void record(const AuditRecord& r) override { records.push_back(r); }

    bool has(AuditEvent event) const {
        return std::any_of(records.begin(), records.end(),
                           [event](const AuditRecord& r) { return r.event == event; });
    }

    std::vector<AuditRecord> records;
};

class PipelineCoordinatorTest : public ::testing::Test {
protected:
    PipelineCoordinatorTest() : registry_(session::RegistryOptions{60s, clock_.fn()}) {}

    void SetUp() override {
        dir_ = test::make_temp_dir("ferry-pipeline-");
        extractor_ = std::make_shared<FakeExtractor>();
        downloader::DownloadOptions dl;
        dl.maxConcurrent = 1;
        dl.workDir = dir_ / "work";
        downloader_ = std::make_unique<downloader::DownloadOrchestrator>(extractor_, dl);

        transport_ = std::make_shared<FakeTransport>();
        uploader::UploadOptions up;
        up.endpoints = {"https://upload.example"};
        uploader_ = std::make_unique<uploader::UploadOrchestrator>(transport_, up, delays_.fn());

        options_.routing.inlineThresholdBytes = 20 * KiB;
    }

    void TearDown() override {
        coordinator_.reset();
        uploader_.reset();
        downloader_.reset();
        fs::remove_all(dir_);
    }

    PipelineCoordinator& coordinator() {
        if (!coordinator_) {
            coordinator_ = std::make_unique<PipelineCoordinator>(
                CoordinatorDeps{registry_, *downloader_, *uploader_, sink_, delivery_, audit_},
                options_);
        }
        return *coordinator_;
    }

    Result<ResolvedRequest> submit(const std::string& uri = kUri) {
        return runner_.run(coordinator().submit(uri, "alice", "chat-1"));
    }

    Result<PipelineOutcome> select(const std::string& key) {
        return runner_.run(coordinator().select(key));
    }

    // Messages that end a session, as opposed to progress updates.
    std::vector<std::string> terminalMessages() const {
        std::vector<std::string> out;
        for (const auto& t : sink_.texts()) {
            if (t.rfind("Failed: ", 0) == 0 || t.rfind("Delivered: ", 0) == 0 ||
                t.rfind("Uploaded: ", 0) == 0) {
                out.push_back(t);
            }
        }
        return out;
    }

    bool sinkContains(const std::string& needle) const {
        const auto texts = sink_.texts();
        return std::any_of(texts.begin(), texts.end(), [&](const std::string& t) {
            return t.find(needle) != std::string::npos;
        });
    }

    test::IoRunner runner_;
    fs::path dir_;
    test::ManualClock clock_;
    session::SessionRegistry registry_;
    std::shared_ptr<FakeExtractor> extractor_;
    std::unique_ptr<downloader::DownloadOrchestrator> downloader_;
    std::shared_ptr<FakeTransport> transport_;
    test::RecordedDelays delays_;
    std::unique_ptr<uploader::UploadOrchestrator> uploader_;
    test::RecordingSink sink_;
    FakeDelivery delivery_;
    RecordingAudit audit_;
    CoordinatorOptions options_;
    std::unique_ptr<PipelineCoordinator> coordinator_;
};

} // namespace

TEST(RoutingTest, SizeAboveThresholdIsOffloaded) {
    RoutingPolicy policy{20 * MiB, false};
    EXPECT_EQ(routeFor(50 * MiB, policy), Route::Offload);
    EXPECT_EQ(routeFor(10 * MiB, policy), Route::Inline);
    EXPECT_EQ(routeFor(20 * MiB, policy), Route::Inline);

    policy.forceOffload = true;
    EXPECT_EQ(routeFor(1, policy), Route::Offload);
}

TEST_F(PipelineCoordinatorTest, SubmitResolvesAndAwaitsSelection) {
    auto r = submit();
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().sessionId, "abc123");
    EXPECT_EQ(r.value().title, "Sample Clip");

    auto found = registry_.lookup("abc123");
    ASSERT_EQ(found.status, session::LookupStatus::Found);
    EXPECT_EQ(found.session->status, SessionStatus::AwaitingSelection);
    EXPECT_EQ(found.session->owner, "alice");
    EXPECT_TRUE(audit_.has(AuditEvent::RequestReceived));
}

TEST_F(PipelineCoordinatorTest, MenuListsAudioThenVideo) {
    auto r = submit();
    ASSERT_TRUE(r);
    auto menu = coordinator().menuFor(r.value());
    ASSERT_EQ(menu.size(), 4u);
    EXPECT_EQ(menu[0].label, "Audio MP3");
    EXPECT_EQ(menu[0].selectionKey, "a_mp3_none_abc123");
    EXPECT_EQ(menu[1].label, "Audio WAV");
    EXPECT_EQ(menu[2].label, "480p webm");
    EXPECT_EQ(menu[2].selectionKey, "v_480p_webm_abc123");
    EXPECT_EQ(menu[3].label, "720p mp4");
    EXPECT_EQ(menu[3].selectionKey, "v_720p_mp4_abc123");
}

TEST_F(PipelineCoordinatorTest, InvalidUriRegistersNothing) {
    auto r = submit("https://example.com/video");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_TRUE(sink_.messages().empty());
}

TEST_F(PipelineCoordinatorTest, ResolveFailureFailsAndRemovesSession) {
    extractor_->probeError = Error{ErrorCode::NetworkError, "unreachable"};
    auto r = submit();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ResolutionError);
    EXPECT_EQ(registry_.size(), 0u);

    auto terminal = terminalMessages();
    ASSERT_EQ(terminal.size(), 1u);
    EXPECT_EQ(terminal[0], "Failed: Unknown Title\nNetwork error: unreachable");
    EXPECT_TRUE(audit_.has(AuditEvent::Failed));
}

TEST_F(PipelineCoordinatorTest, SmallArtifactIsDeliveredInlineAndDeleted) {
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    const auto& outcome = r.value();
    EXPECT_EQ(outcome.status, SessionStatus::Complete);
    EXPECT_EQ(outcome.route, Route::Inline);
    EXPECT_EQ(outcome.sizeBytes, 10 * KiB);

    ASSERT_EQ(delivery_.requests.size(), 1u);
    EXPECT_TRUE(delivery_.fileExisted);
    EXPECT_EQ(delivery_.requests[0].variant.quality, "720p");
    EXPECT_FALSE(fs::exists(delivery_.requests[0].path));
    EXPECT_EQ(transport_->posts, 0);

    EXPECT_EQ(terminalMessages(), (std::vector<std::string>{"Delivered: Sample Clip (10.0KB)"}));
    EXPECT_EQ(outcome.summary, "Delivered: Sample Clip (10.0KB)");
    EXPECT_TRUE(audit_.has(AuditEvent::DeliveredInline));
    EXPECT_TRUE(audit_.has(AuditEvent::ArtifactDeleted));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(PipelineCoordinatorTest, LargeArtifactIsOffloaded) {
    extractor_->size = 50 * KiB;
    ASSERT_TRUE(submit());
    auto r = select("v_480p_webm_abc123");
    ASSERT_TRUE(r);
    const auto& outcome = r.value();
    EXPECT_EQ(outcome.status, SessionStatus::Complete);
    EXPECT_EQ(outcome.route, Route::Offload);
    ASSERT_TRUE(outcome.upload.has_value());
    EXPECT_EQ(outcome.upload->downloadPage, "https://gofile.io/d/AbC");
    EXPECT_EQ(outcome.attempts.size(), 1u);
    EXPECT_TRUE(delivery_.requests.empty());

    EXPECT_TRUE(sinkContains("File too large (50.0KB), uploading to the file host..."));
    auto terminal = terminalMessages();
    ASSERT_EQ(terminal.size(), 1u);
    EXPECT_EQ(terminal[0], "Uploaded: Sample Clip (50.0KB)\n"
                           "Download: https://gofile.io/d/AbC\n"
                           "Direct link: https://store1.gofile.io/download/AbC/clip.mp4");
    EXPECT_FALSE(fs::exists(dir_ / "work" / "abc123.webm"));
    EXPECT_TRUE(audit_.has(AuditEvent::Offloaded));
}

TEST_F(PipelineCoordinatorTest, ForcedOffloadSaysSo) {
    options_.routing.forceOffload = true;
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().route, Route::Offload);
    EXPECT_TRUE(sinkContains("Uploading to the file host as configured..."));
}

TEST_F(PipelineCoordinatorTest, ExhaustedUploadFailsAndStillCleansUp) {
    extractor_->size = 50 * KiB;
    transport_->failures = 3;
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    const auto& outcome = r.value();
    EXPECT_EQ(outcome.status, SessionStatus::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::UploadError);
    EXPECT_NE(outcome.error->message.find("Retries exhausted"), std::string::npos);
    EXPECT_EQ(outcome.attempts.size(), 3u);
    EXPECT_EQ(delays_.delays.size(), 2u);

    EXPECT_FALSE(fs::exists(dir_ / "work" / "abc123.mp4"));
    auto terminal = terminalMessages();
    ASSERT_EQ(terminal.size(), 1u);
    EXPECT_EQ(terminal[0].rfind("Failed: Sample Clip\n", 0), 0u);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(PipelineCoordinatorTest, InlineDeliveryFailureStillCleansUp) {
    delivery_.error = Error{ErrorCode::NetworkError, "chat unavailable"};
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().status, SessionStatus::Failed);
    EXPECT_EQ(r.value().error->code, ErrorCode::TransferError);
    EXPECT_FALSE(fs::exists(dir_ / "work" / "abc123.mp4"));
    EXPECT_EQ(terminalMessages().size(), 1u);
}

TEST_F(PipelineCoordinatorTest, ThrowingDeliveryFailsAndStillCleansUp) {
    delivery_.onDeliver = [](const DeliveryRequest& req) {
        throw fs::filesystem_error("outbox unavailable", req.path,
                                   std::make_error_code(std::errc::io_error));
    };
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    const auto& outcome = r.value();
    EXPECT_EQ(outcome.status, SessionStatus::Failed);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::InternalError);
    EXPECT_NE(outcome.error->message.find("outbox unavailable"), std::string::npos);

    EXPECT_FALSE(fs::exists(dir_ / "work" / "abc123.mp4"));
    EXPECT_TRUE(audit_.has(AuditEvent::ArtifactDeleted));
    EXPECT_TRUE(audit_.has(AuditEvent::Failed));
    auto terminal = terminalMessages();
    ASSERT_EQ(terminal.size(), 1u);
    EXPECT_EQ(terminal[0].rfind("Failed: Sample Clip\n", 0), 0u);
    EXPECT_EQ(registry_.size(), 0u);

    // The id is free again.
    EXPECT_TRUE(submit());
}

TEST_F(PipelineCoordinatorTest, NonStandardExceptionFailsSession) {
    delivery_.onDeliver = [](const DeliveryRequest&) { throw 7; };
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().status, SessionStatus::Failed);
    EXPECT_EQ(r.value().error->code, ErrorCode::InternalError);
    EXPECT_NE(r.value().error->message.find("unknown exception"), std::string::npos);
    EXPECT_FALSE(fs::exists(dir_ / "work" / "abc123.mp4"));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(PipelineCoordinatorTest, ThrowingStatusSinkDoesNotStrandSession) {
    sink_.throwOnSend(42, 1000);
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().status, SessionStatus::Complete);
    EXPECT_EQ(r.value().summary, "Delivered: Sample Clip (10.0KB)");
    EXPECT_TRUE(sink_.messages().empty());
    EXPECT_FALSE(fs::exists(dir_ / "work" / "abc123.mp4"));
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_TRUE(submit());
}

TEST_F(PipelineCoordinatorTest, UndeletableArtifactIsACleanupWarning) {
    // Swap the artifact for a non-empty directory so removal fails.
    delivery_.onDeliver = [](const DeliveryRequest& req) {
        fs::remove(req.path);
        fs::create_directories(req.path);
        test::write_file(req.path / "partial", 16);
    };
    ASSERT_TRUE(submit());
    auto r = select("v_720p_mp4_abc123");
    ASSERT_TRUE(r);
    const auto& outcome = r.value();
    EXPECT_EQ(outcome.status, SessionStatus::Complete);
    EXPECT_TRUE(outcome.cleanupWarning);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_TRUE(audit_.has(AuditEvent::CleanupWarning));
    EXPECT_FALSE(audit_.has(AuditEvent::ArtifactDeleted));
    EXPECT_FALSE(audit_.has(AuditEvent::Failed));
    EXPECT_EQ(terminalMessages(), (std::vector<std::string>{"Delivered: Sample Clip (10.0KB)"}));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(PipelineCoordinatorTest, FetchFailureFailsSession) {
    extractor_->fetchError = Error{ErrorCode::ExtractionFailure, "yt-dlp exited with 1"};
    ASSERT_TRUE(submit());
    auto r = select("a_mp3_none_abc123");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().status, SessionStatus::Failed);
    EXPECT_EQ(r.value().error->code, ErrorCode::TransferError);
    EXPECT_FALSE(r.value().route.has_value());
    EXPECT_EQ(terminalMessages().size(), 1u);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(PipelineCoordinatorTest, MalformedKeyLeavesSessionWaiting) {
    ASSERT_TRUE(submit());
    auto r = select("v_720p_abc123");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ValidationError);

    auto found = registry_.lookup("abc123");
    ASSERT_EQ(found.status, session::LookupStatus::Found);
    EXPECT_EQ(found.session->status, SessionStatus::AwaitingSelection);
    EXPECT_TRUE(terminalMessages().empty());
}

TEST_F(PipelineCoordinatorTest, UnknownVariantLeavesSessionWaiting) {
    ASSERT_TRUE(submit());
    auto r = select("v_1080p_mp4_abc123");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SelectionError);
    EXPECT_EQ(registry_.lookup("abc123").session->status, SessionStatus::AwaitingSelection);
}

TEST_F(PipelineCoordinatorTest, LateSelectionIsExpired) {
    ASSERT_TRUE(submit());
    clock_.advance(61s);
    auto r = select("v_720p_mp4_abc123");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SessionExpired);
    EXPECT_TRUE(audit_.has(AuditEvent::Expired));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(PipelineCoordinatorTest, FinishedSessionCannotBeSelectedAgain) {
    ASSERT_TRUE(submit());
    ASSERT_TRUE(select("v_720p_mp4_abc123"));
    auto again = select("v_720p_mp4_abc123");
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::SelectionError);
    EXPECT_EQ(terminalMessages().size(), 1u);
}
