/**
 * @file request_test.cpp
 * @brief Request document validation and options parsing
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "fakes.hpp"
#include "reel_cutter/errors.hpp"
#include "reel_cutter/request.hpp"

namespace reel_cutter {
namespace {

using nlohmann::json;

TEST(RequestTest, ParsesManualCut) {
  JobRequest req = parse_request(fakes::manual_cut_request());
  EXPECT_EQ(req.mode, RequestMode::ManualCut);
  EXPECT_EQ(req.source_id, "talk.mp4");
  EXPECT_EQ(req.webhook_url, "https://hooks.example/done");
  EXPECT_TRUE(req.destination_folder.empty());
  ASSERT_EQ(req.ranges.size(), 2u);
  EXPECT_EQ(req.ranges[0].title, std::optional<std::string>("Opening"));
  EXPECT_FALSE(req.ranges[1].title.has_value());
  EXPECT_EQ(std::get<std::string>(req.ranges[0].start), "5:52");
}

TEST(RequestTest, ParsesManualEditWithNumericTimes) {
  JobRequest req = parse_request(fakes::manual_edit_request());
  EXPECT_EQ(req.mode, RequestMode::ManualEdit);
  EXPECT_EQ(req.title, std::optional<std::string>("Best bits"));
  ASSERT_EQ(req.ranges.size(), 3u);
  EXPECT_DOUBLE_EQ(std::get<double>(req.ranges[2].start), 100.0);
}

TEST(RequestTest, ParsesAnalyzeWithOptions) {
  json doc = fakes::analyze_request(3);
  doc["destination_folder"] = "reels";
  doc["options"]["layout"] = "vertical";
  doc["options"]["captions"] = true;
  doc["options"]["caption_style"] = "box";
  doc["options"]["speed"] = 1.1;

  JobRequest req = parse_request(doc);
  EXPECT_EQ(req.mode, RequestMode::Analyze);
  EXPECT_EQ(req.instruction, std::optional<std::string>("funny moments"));
  EXPECT_EQ(req.destination_folder, "reels");
  EXPECT_EQ(req.options.max_clips, 3);
  EXPECT_EQ(req.options.layout, Layout::Vertical);
  EXPECT_TRUE(req.options.captions);
  EXPECT_EQ(req.options.caption_style, CaptionStyle::Box);
  EXPECT_DOUBLE_EQ(req.options.speed, 1.1);
  EXPECT_TRUE(req.ranges.empty());
}

TEST(RequestTest, RejectsBadShapes) {
  EXPECT_THROW(parse_request(json::array()), ValidationError);

  json doc = fakes::manual_cut_request();
  doc["mode"] = "remix";
  EXPECT_THROW(parse_request(doc), ValidationError);

  doc = fakes::manual_cut_request();
  doc["source_id"] = "";
  EXPECT_THROW(parse_request(doc), ValidationError);

  doc = fakes::manual_cut_request();
  doc.erase("webhook_url");
  EXPECT_THROW(parse_request(doc), ValidationError);

  doc = fakes::manual_cut_request();
  doc["webhook_url"] = "ftp://hooks.example";
  EXPECT_THROW(parse_request(doc), ValidationError);

  doc = fakes::manual_cut_request();
  doc["clips"] = json::array();
  EXPECT_THROW(parse_request(doc), ValidationError);

  doc = fakes::manual_cut_request();
  doc["clips"][0]["end"] = "5:00";
  EXPECT_THROW(parse_request(doc), ValidationError);

  doc = fakes::manual_cut_request();
  doc["clips"][0]["start"] = true;
  EXPECT_THROW(parse_request(doc), ValidationError);

  doc = fakes::manual_edit_request();
  doc.erase("segments");
  EXPECT_THROW(parse_request(doc), ValidationError);
}

TEST(RequestTest, RejectsTooManyRanges) {
  json doc = fakes::manual_edit_request();
  doc["segments"] = json::array();
  for (int i = 0; i < 21; ++i)
    doc["segments"].push_back({{"start", i * 10}, {"end", i * 10 + 5}});
  EXPECT_THROW(parse_request(doc), ValidationError);
}

TEST(OptionsTest, DefaultsWhenAbsent) {
  RenderOptions o = parse_options(json());
  EXPECT_EQ(o.layout, Layout::BlurZoom);
  EXPECT_EQ(o.max_clips, 1);
  EXPECT_EQ(o.zoom_level, 1400);
  EXPECT_DOUBLE_EQ(o.fade_duration, 1.0);
  EXPECT_EQ(o.width, 1080);
  EXPECT_EQ(o.height, 1920);
  EXPECT_FALSE(o.captions);
}

TEST(OptionsTest, RejectsWrongTypesAndValues) {
  EXPECT_THROW(parse_options(json::array()), ValidationError);
  EXPECT_THROW(parse_options({{"layout", "diagonal"}}), ValidationError);
  EXPECT_THROW(parse_options({{"caption_style", "comic"}}), ValidationError);
  EXPECT_THROW(parse_options({{"max_clips", "3"}}), ValidationError);
  EXPECT_THROW(parse_options({{"max_clips", 2.5}}), ValidationError);
  EXPECT_THROW(parse_options({{"mirror", 1}}), ValidationError);
  EXPECT_THROW(parse_options({{"speed", 2.0}}), ValidationError);
  EXPECT_THROW(parse_options({{"zoom_level", 100}}), ValidationError);

  /// Values that would wrap to an in-bounds int are rejected
  EXPECT_THROW(parse_options({{"max_clips", 4294967297LL}}), ValidationError);
  EXPECT_THROW(parse_options({{"width", 4294968376LL}}), ValidationError);
  EXPECT_THROW(parse_options({{"height", -4294965376LL}}), ValidationError);
  EXPECT_THROW(parse_options({{"zoom_level", 18446744073709551000ULL}}),
               ValidationError);
}

TEST(RequestTest, HttpUrlCheck) {
  EXPECT_TRUE(is_http_url("https://hooks.example/done"));
  EXPECT_TRUE(is_http_url("http://localhost:8080"));
  EXPECT_FALSE(is_http_url("https://"));
  EXPECT_FALSE(is_http_url("hooks.example/done"));
  EXPECT_FALSE(is_http_url("https://bad host/x"));
}

TEST(RequestTest, StoredFormParsesBackToSameRequest) {
  JobRequest original = parse_request(fakes::manual_cut_request());
  JobRequest again = parse_request(to_json(original));
  EXPECT_EQ(again.mode, original.mode);
  EXPECT_EQ(again.source_id, original.source_id);
  ASSERT_EQ(again.ranges.size(), original.ranges.size());
  EXPECT_EQ(again.ranges[0].title, original.ranges[0].title);
  EXPECT_EQ(std::get<std::string>(again.ranges[1].end), "10:24");
  EXPECT_EQ(to_json(again), to_json(original));
}

} // anonymous namespace
} // namespace reel_cutter
