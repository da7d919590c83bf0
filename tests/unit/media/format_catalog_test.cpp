#include <gtest/gtest.h>
#include <ferry/media/format_catalog.h>

using namespace ferry;
using namespace ferry::media;

namespace {

RawFormat raw(const std::string& id, const std::string& ext, int height, double tbr,
              std::uint64_t size, const std::string& vcodec = "avc1",
              const std::string& acodec = "mp4a") {
    RawFormat f;
    f.formatId = id;
    f.ext = ext;
    f.vcodec = vcodec;
    f.acodec = acodec;
    f.height = height;
    f.tbr = tbr;
    f.filesize = size;
    return f;
}

} // namespace

TEST(FormatCatalogTest, RanksByBitrateThenSize) {
    FormatCatalog catalog;
    FormatVariant low{MediaKind::Video, "720p", "mp4"};
    low.bitrateKbps = 1000;
    low.formatId = "low";
    FormatVariant high{MediaKind::Video, "720p", "mp4"};
    high.bitrateKbps = 2500;
    high.formatId = "high";
    FormatVariant highBigger = high;
    highBigger.sizeEstimate = 10 * MiB;
    highBigger.formatId = "high-bigger";

    catalog.add(low);
    catalog.add(high);
    catalog.add(highBigger);

    const auto* ranked = catalog.find({MediaKind::Video, "720p", "mp4"});
    ASSERT_NE(ranked, nullptr);
    ASSERT_EQ(ranked->size(), 3u);
    EXPECT_EQ((*ranked)[0].formatId, "high-bigger");
    EXPECT_EQ((*ranked)[1].formatId, "high");
    EXPECT_EQ((*ranked)[2].formatId, "low");
    EXPECT_EQ(catalog.best({MediaKind::Video, "720p", "mp4"})->formatId, "high-bigger");
    EXPECT_FALSE(catalog.best({MediaKind::Video, "720p", "webm"}).has_value());
}

TEST(FormatCatalogTest, BuildKeepsCombinedSupportedFormats) {
    std::vector<RawFormat> formats = {
        raw("18", "mp4", 360, 500, 5 * MiB),
        raw("22", "mp4", 720, 1500, 20 * MiB),
        raw("43", "webm", 720, 1200, 18 * MiB),
        raw("137", "mp4", 1080, 4000, 80 * MiB, "avc1", "none"), // video only
        raw("140", "m4a", 0, 128, 3 * MiB, "none", "mp4a"),      // audio only
        raw("odd", "mp4", 900, 2000, 30 * MiB),                  // unsupported height
    };

    auto catalog = buildCatalog(formats);
    EXPECT_EQ(catalog.qualities(MediaKind::Video), (std::vector<std::string>{"360p", "720p"}));
    EXPECT_EQ(catalog.containers(MediaKind::Video, "720p"),
              (std::vector<std::string>{"mp4", "webm"}));
    EXPECT_EQ(catalog.qualities(MediaKind::Audio), (std::vector<std::string>{"mp3", "wav"}));

    auto mp3 = catalog.best({MediaKind::Audio, "mp3", "mp3"});
    ASSERT_TRUE(mp3.has_value());
    EXPECT_EQ(mp3->formatId, kBestAudioSelector);
    EXPECT_EQ(catalog.best({MediaKind::Video, "720p", "mp4"})->height(), 720);
}

TEST(FormatCatalogTest, VideoQualitiesSortByHeight) {
    auto catalog = buildCatalog({raw("a", "mp4", 1080, 1, 1), raw("b", "mp4", 144, 1, 1),
                                 raw("c", "mp4", 480, 1, 1)});
    EXPECT_EQ(catalog.qualities(MediaKind::Video),
              (std::vector<std::string>{"144p", "480p", "1080p"}));
}

TEST(FormatCatalogTest, ParsesExtractorMetadata) {
    const char* doc = R"({
        "title": "Sample Clip",
        "uploader": "Someone",
        "duration": 212.5,
        "view_count": 1234,
        "formats": [
            {"format_id": "22", "ext": "mp4", "vcodec": "avc1", "acodec": "mp4a",
             "height": 720, "tbr": 1500.5, "filesize": 1048576},
            {"format_id": "43", "ext": "webm", "vcodec": "vp8", "acodec": "vorbis",
             "height": 360, "filesize_approx": 2048},
            {"ext": "mp4"}
        ]
    })";

    auto info = parseMediaInfo(doc);
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().title, "Sample Clip");
    EXPECT_EQ(info.value().uploader, "Someone");
    ASSERT_TRUE(info.value().durationSeconds.has_value());
    EXPECT_DOUBLE_EQ(*info.value().durationSeconds, 212.5);
    EXPECT_EQ(info.value().viewCount, 1234u);
    ASSERT_EQ(info.value().formats.size(), 2u);
    EXPECT_EQ(info.value().formats[0].filesize, 1048576u);
    EXPECT_EQ(info.value().formats[1].filesize, 2048u);
}

TEST(FormatCatalogTest, MissingTitleAndUploaderUseFallbacks) {
    auto info = parseMediaInfo(R"({"formats": []})");
    ASSERT_TRUE(info);
    EXPECT_EQ(info.value().title, kUnknownTitle);
    EXPECT_EQ(info.value().uploader, "Unknown");
}

TEST(FormatCatalogTest, MalformedMetadataIsInvalidData) {
    auto broken = parseMediaInfo("{not json");
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, ErrorCode::InvalidData);

    auto array = parseMediaInfo("[1, 2]");
    ASSERT_FALSE(array);
    EXPECT_EQ(array.error().code, ErrorCode::InvalidData);
}
