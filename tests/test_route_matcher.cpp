#include <gtest/gtest.h>
#include "route_matcher.hpp"

using namespace streamguard;

TEST(RouteMatcherTest, SplitTarget) {
    auto [path, query] = split_target("/videos/youtube/abc?quality=720p&mode=direct");
    EXPECT_EQ(path, "/videos/youtube/abc");
    EXPECT_EQ(query, "quality=720p&mode=direct");

    auto [bare, empty] = split_target("/health");
    EXPECT_EQ(bare, "/health");
    EXPECT_TRUE(empty.empty());
}

TEST(RouteMatcherTest, RecognizesResources) {
    EXPECT_EQ(match_route("/").kind, ResourceKind::Root);
    EXPECT_EQ(match_route("/api/v2").kind, ResourceKind::Root);
    EXPECT_EQ(match_route("/health").kind, ResourceKind::Health);
    EXPECT_EQ(match_route("/api/v2/system/health").kind, ResourceKind::Health);
    EXPECT_EQ(match_route("/metrics").kind, ResourceKind::Metrics);
    EXPECT_EQ(match_route("/api/v2/stream/metrics").kind, ResourceKind::Metrics);
    EXPECT_EQ(match_route("/api/v2/unknown").kind, ResourceKind::NotFound);
    EXPECT_EQ(match_route("/videos/youtube").kind, ResourceKind::NotFound);
}

TEST(RouteMatcherTest, VideoAndPlaylistParameters) {
    auto v = match_route("/api/v2/videos/YouTube/dQw4w9WgXcQ");
    EXPECT_EQ(v.kind, ResourceKind::Video);
    EXPECT_EQ(v.platform, "YouTube");
    EXPECT_EQ(v.identifier, "dQw4w9WgXcQ");

    auto p = match_route("/playlists/youtube/PL123");
    EXPECT_EQ(p.kind, ResourceKind::Playlist);
    EXPECT_EQ(p.identifier, "PL123");
}

TEST(RouteMatcherTest, StreamJoinsTrailingSegments) {
    auto s = match_route("/api/v2/stream/twitter/123/extra");
    EXPECT_EQ(s.kind, ResourceKind::Stream);
    EXPECT_EQ(s.identifier, "123/extra");
}

TEST(RouteMatcherTest, SegmentsDecodedWithoutPlus) {
    auto v = match_route("/videos/youtube/a%20b+c");
    EXPECT_EQ(v.identifier, "a b+c");
}

TEST(RouteMatcherTest, ParseQuery) {
    auto q = parse_query("a=1&&b=&flag&c=x=y");
    ASSERT_EQ(q.size(), 4u);
    EXPECT_EQ(q[0], (std::pair<std::string, std::string>{"a", "1"}));
    EXPECT_EQ(q[1], (std::pair<std::string, std::string>{"b", ""}));
    EXPECT_EQ(q[2], (std::pair<std::string, std::string>{"flag", ""}));
    EXPECT_EQ(q[3], (std::pair<std::string, std::string>{"c", "x=y"}));
    EXPECT_TRUE(parse_query("").empty());
}

TEST(RouteMatcherTest, PopulateContextFillsParameters) {
    RequestContext ctx;
    populate_context("/api/v2/stream/youtube/abc?quality=720p&country=cn&mode=&q=hello%20world", ctx);

    EXPECT_EQ(ctx.raw_path, "/api/v2/stream/youtube/abc");
    EXPECT_EQ(ctx.route.kind, ResourceKind::Stream);
    EXPECT_EQ(ctx.params.platform, "youtube");
    EXPECT_EQ(ctx.params.video_id, "abc");
    EXPECT_FALSE(ctx.params.playlist_id.has_value());
    EXPECT_EQ(ctx.params.quality, "720p");
    EXPECT_EQ(ctx.params.country, "cn");
    EXPECT_FALSE(ctx.params.mode.has_value());
    EXPECT_EQ(ctx.query_value("q"), "hello world");
    EXPECT_EQ(ctx.raw_query_pairs.back().second, "hello%20world");
}

TEST(RouteMatcherTest, PopulateContextPlaylist) {
    RequestContext ctx;
    populate_context("/playlists/bilibili/PLx", ctx);
    EXPECT_EQ(ctx.params.playlist_id, "PLx");
    EXPECT_FALSE(ctx.params.video_id.has_value());
}
