#include "channel_normalizer.h"
#include "xtream_client.h"
#include "test_support.h"
#include <gtest/gtest.h>

using json = nlohmann::json;

TEST(NormalizeFlat, MapsFieldsAndDefaults) {
    json channels = json::parse(R"([
        {"title": "BBC", "logo": "http://x/logo.png", "url": "http://h/a", "group": "UK"},
        {"url": "http://h/b"},
        {"name": "Alt", "stream_icon": "icon.png", "url": "http://h/c", "tvg-id": "alt.id"}
    ])");

    auto out = normalize_flat(channels);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].name, "BBC");
    EXPECT_EQ(out[0].logo, "http://x/logo.png");
    EXPECT_EQ(out[0].group, "UK");
    EXPECT_EQ(out[1].name, "No name");
    EXPECT_EQ(out[1].group, "General");
    EXPECT_EQ(out[2].name, "Alt");
    EXPECT_EQ(out[2].logo, "icon.png");
    EXPECT_EQ(out[2].tvg_id, "alt.id");
}

TEST(NormalizeFlat, SkipsMissingUrlAndNonObjects) {
    json channels = json::parse(R"([
        {"title": "NoUrl"},
        {"title": "EmptyUrl", "url": ""},
        "garbage",
        42,
        {"title": "Good", "url": "http://h/g"}
    ])");
    auto out = normalize_flat(channels);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "Good");
}

TEST(NormalizeFlat, NonArrayYieldsNothing) {
    EXPECT_TRUE(normalize_flat(json::object()).empty());
}

TEST(ParseTextChannel, RewritesPanelUrl) {
    auto ch = parse_text_channel("Sports 1,http://panel.tv:8080/user/pass/1234", StreamFormat::TS);
    ASSERT_TRUE(ch.has_value());
    EXPECT_EQ(ch->name, "Sports 1");
    EXPECT_EQ(ch->url, "http://panel.tv:8080/live/user/pass/1234.ts");
    EXPECT_EQ(ch->group, "General");
}

TEST(ParseTextChannel, HonoursFormatAndStripsExistingSuffix) {
    auto hls = parse_text_channel("A,http://h/u/p/77.ts", StreamFormat::M3U8);
    ASSERT_TRUE(hls.has_value());
    EXPECT_EQ(hls->url, "http://h/live/u/p/77.m3u8");

    auto bare = parse_text_channel("A,http://h/u/p/77.m3u8", StreamFormat::NONE);
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->url, "http://h/live/u/p/77");
}

TEST(ParseTextChannel, SplitsOnFirstCommaOnly) {
    auto ch = parse_text_channel(" Name , http://h/u/p/1", StreamFormat::TS);
    ASSERT_TRUE(ch.has_value());
    EXPECT_EQ(ch->name, "Name");

    EXPECT_FALSE(parse_text_channel("A,B,http://h/u/p/1", StreamFormat::TS).has_value());
}

TEST(ParseTextChannel, RejectsOtherShapes) {
    EXPECT_FALSE(parse_text_channel("", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("no comma here", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("# comment,http://h/u/p/1", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("A,https://h/u/p/1", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("A,http://h/u/p", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("A,http://h/x/u/p/1", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("A,http://h//p/1", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("A,http://h/u/p/.ts", StreamFormat::TS).has_value());
    EXPECT_FALSE(parse_text_channel("A,http://h/u/p/.m3u8", StreamFormat::M3U8).has_value());
}

TEST(NormalizeText, KeepsOrderAndSkipsBadLines) {
    std::vector<std::string> lines = {
        "One,http://h/u/p/1",
        "",
        "broken line",
        "Two,https://h/u/p/2",
        "Three,http://h/u/p/3\r",
    };
    auto out = normalize_text(lines, StreamFormat::TS);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].name, "One");
    EXPECT_EQ(out[1].name, "Three");
    EXPECT_EQ(out[1].url, "http://h/live/u/p/3.ts");
}

class NormalizeXtream : public ::testing::Test {
protected:
    NormalizeXtream()
        : http_(RetryPolicy{}, HttpOptions{}, std::ref(panel_), no_sleep()),
          client_(ServerCredential{"main", "http://panel:8080/", "u", "p"}, http_) {}

    FakePanel panel_;
    HttpClient http_;
    XtreamClient client_;
};

TEST_F(NormalizeXtream, JoinsCategoriesAndBuildsUrls) {
    CategoryMap cats = {{"1", "News"}, {"2", "Sports"}};
    std::vector<json> streams = {
        json::parse(R"({"stream_id": 10, "name": "CNN", "category_id": "1",
                        "epg_channel_id": "cnn.us", "stream_icon": "cnn.png"})"),
        json::parse(R"({"stream_id": "11", "name": "ESPN", "category_id": 2})"),
    };

    auto out = normalize_xtream(streams, cats, client_, StreamFormat::TS);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].name, "CNN");
    EXPECT_EQ(out[0].group, "News");
    EXPECT_EQ(out[0].tvg_id, "cnn.us");
    EXPECT_EQ(out[0].logo, "cnn.png");
    EXPECT_EQ(out[0].url, "http://panel:8080/live/u/p/10.ts");
    EXPECT_EQ(out[1].group, "Sports");
    EXPECT_EQ(out[1].url, "http://panel:8080/live/u/p/11.ts");
}

TEST_F(NormalizeXtream, UnknownCategoryFallsBackToGeneral) {
    std::vector<json> streams = {
        json::parse(R"({"stream_id": 1, "name": "A", "category_id": "999"})"),
        json::parse(R"({"stream_id": 2, "name": "B"})"),
        json::parse(R"({"stream_id": 3, "name": "C", "category_id": null})"),
    };
    auto out = normalize_xtream(streams, CategoryMap{{"1", "News"}}, client_, StreamFormat::TS);
    ASSERT_EQ(out.size(), 3u);
    for (auto& ch : out) EXPECT_EQ(ch.group, "General");
}

TEST_F(NormalizeXtream, SkipsStreamsWithoutId) {
    std::vector<json> streams = {
        json::parse(R"({"name": "NoId"})"),
        json::parse(R"({"stream_id": "", "name": "EmptyId"})"),
        json::parse(R"({"stream_id": 5})"),
    };
    auto out = normalize_xtream(streams, {}, client_, StreamFormat::M3U8);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].name, "No name");
    EXPECT_EQ(out[0].url, "http://panel:8080/live/u/p/5.m3u8");
}
