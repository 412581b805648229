/**
 * @file request.cpp
 * @brief Request parsing and serialization
 */

#include "reel_cutter/request.hpp"

#include <cstdint>
#include <limits>

#include <fmt/core.h>

#include "reel_cutter/errors.hpp"

namespace reel_cutter {

using nlohmann::json;

const char *to_string(RequestMode mode) {
  switch (mode) {
  case RequestMode::Analyze:
    return "analyze";
  case RequestMode::ManualCut:
    return "manual_cut";
  case RequestMode::ManualEdit:
    return "manual_edit";
  }
  return "unknown";
}

namespace {

// **---- Field Readers ----**

const json *field(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return nullptr;
  return &*it;
}

std::string require_string(const json &obj, const char *key) {
  const json *v = field(obj, key);
  if (!v)
    throw ValidationError(fmt::format("'{}' is required", key));
  if (!v->is_string())
    throw ValidationError(fmt::format("'{}' must be a string", key));
  return v->get<std::string>();
}

std::optional<std::string> optional_string(const json &obj, const char *key) {
  const json *v = field(obj, key);
  if (!v)
    return std::nullopt;
  if (!v->is_string())
    throw ValidationError(fmt::format("'{}' must be a string", key));
  return v->get<std::string>();
}

void read_bool(const json &obj, const char *key, bool &out) {
  if (const json *v = field(obj, key)) {
    if (!v->is_boolean())
      throw ValidationError(fmt::format("'{}' must be a boolean", key));
    out = v->get<bool>();
  }
}

void read_int(const json &obj, const char *key, int &out) {
  if (const json *v = field(obj, key)) {
    if (!v->is_number_integer())
      throw ValidationError(fmt::format("'{}' must be an integer", key));
    /// Range-check before narrowing so huge values cannot wrap into bounds
    const bool fits =
        v->is_number_unsigned()
            ? v->get<std::uint64_t>() <=
                  static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : (v->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
               v->get<std::int64_t>() <= std::numeric_limits<int>::max());
    if (!fits)
      throw ValidationError(fmt::format("'{}' is out of range", key));
    out = static_cast<int>(v->get<std::int64_t>());
  }
}

void read_number(const json &obj, const char *key, double &out) {
  if (const json *v = field(obj, key)) {
    if (!v->is_number())
      throw ValidationError(fmt::format("'{}' must be a number", key));
    out = v->get<double>();
  }
}

TimeValue read_time(const json &obj, const char *key) {
  const json *v = field(obj, key);
  if (!v)
    throw ValidationError(fmt::format("'{}' is required", key));
  if (v->is_number())
    return v->get<double>();
  if (v->is_string())
    return v->get<std::string>();
  throw ValidationError(
      fmt::format("'{}' must be seconds or a time string", key));
}

std::vector<TimeRange> read_ranges(const json &doc, const char *key,
                                   bool allow_title) {
  const json *list = field(doc, key);
  if (!list || !list->is_array())
    throw ValidationError(fmt::format("'{}' must be an array", key));
  if (list->empty() ||
      list->size() > static_cast<size_t>(kMaxRangesPerRequest)) {
    throw ValidationError(fmt::format("'{}' must hold 1 to {} entries", key,
                                      kMaxRangesPerRequest));
  }

  std::vector<TimeRange> ranges;
  for (const auto &item : *list) {
    if (!item.is_object())
      throw ValidationError(fmt::format("'{}' entries must be objects", key));
    TimeRange range;
    range.start = read_time(item, "start");
    range.end = read_time(item, "end");
    if (allow_title)
      range.title = optional_string(item, "title");

    /// Source duration is unknown until download; only order is checked here
    resolve_range(range, 0.0);
    ranges.push_back(std::move(range));
  }
  return ranges;
}

json time_json(const TimeValue &value) {
  if (const double *d = std::get_if<double>(&value))
    return *d;
  return std::get<std::string>(value);
}

} // anonymous namespace

// **---- Parsing ----**

bool is_http_url(const std::string &url) {
  std::string rest;
  if (url.rfind("http://", 0) == 0)
    rest = url.substr(7);
  else if (url.rfind("https://", 0) == 0)
    rest = url.substr(8);
  else
    return false;

  size_t host_end = rest.find_first_of("/?#");
  std::string host = rest.substr(0, host_end);
  return !host.empty() && host.find(' ') == std::string::npos;
}

RenderOptions parse_options(const json &doc) {
  RenderOptions options;
  if (doc.is_null())
    return options;
  if (!doc.is_object())
    throw ValidationError("'options' must be an object");

  if (auto name = optional_string(doc, "layout")) {
    auto layout = parse_layout(*name);
    if (!layout)
      throw ValidationError(fmt::format("unknown layout '{}'", *name));
    options.layout = *layout;
  }
  if (auto name = optional_string(doc, "caption_style")) {
    auto style = parse_caption_style(*name);
    if (!style)
      throw ValidationError(fmt::format("unknown caption_style '{}'", *name));
    options.caption_style = *style;
  }

  read_int(doc, "max_clips", options.max_clips);
  read_int(doc, "zoom_level", options.zoom_level);
  read_int(doc, "width", options.width);
  read_int(doc, "height", options.height);
  read_number(doc, "fade_duration", options.fade_duration);
  read_number(doc, "speed", options.speed);
  read_number(doc, "pitch_shift", options.pitch_shift);
  read_number(doc, "background_noise", options.background_noise);
  read_bool(doc, "mirror", options.mirror);
  read_bool(doc, "color_filter", options.color_filter);
  read_bool(doc, "ghost_effect", options.ghost_effect);
  read_bool(doc, "dynamic_zoom", options.dynamic_zoom);
  read_bool(doc, "face_tracking", options.face_tracking);
  read_bool(doc, "captions", options.captions);

  validate_options(options);
  return options;
}

JobRequest parse_request(const json &doc) {
  if (!doc.is_object())
    throw ValidationError("request must be a JSON object");

  JobRequest req;
  const std::string mode = require_string(doc, "mode");
  if (mode == "analyze")
    req.mode = RequestMode::Analyze;
  else if (mode == "manual_cut")
    req.mode = RequestMode::ManualCut;
  else if (mode == "manual_edit")
    req.mode = RequestMode::ManualEdit;
  else
    throw ValidationError(fmt::format("unknown mode '{}'", mode));

  req.source_id = require_string(doc, "source_id");
  if (req.source_id.empty())
    throw ValidationError("'source_id' must not be empty");

  req.webhook_url = require_string(doc, "webhook_url");
  if (!is_http_url(req.webhook_url)) {
    throw ValidationError(
        fmt::format("'webhook_url' is not an http(s) URL: {}", req.webhook_url));
  }

  req.destination_folder = optional_string(doc, "destination_folder").value_or("");

  const json *opts = field(doc, "options");
  req.options = opts ? parse_options(*opts) : RenderOptions{};

  switch (req.mode) {
  case RequestMode::Analyze:
    req.instruction = optional_string(doc, "instruction");
    break;
  case RequestMode::ManualCut:
    req.ranges = read_ranges(doc, "clips", true);
    break;
  case RequestMode::ManualEdit:
    req.title = optional_string(doc, "title");
    req.ranges = read_ranges(doc, "segments", false);
    break;
  }
  return req;
}

// **---- Serialization ----**

json to_json(const RenderOptions &o) {
  return {{"layout", to_string(o.layout)},
          {"max_clips", o.max_clips},
          {"zoom_level", o.zoom_level},
          {"fade_duration", o.fade_duration},
          {"width", o.width},
          {"height", o.height},
          {"mirror", o.mirror},
          {"speed", o.speed},
          {"pitch_shift", o.pitch_shift},
          {"background_noise", o.background_noise},
          {"color_filter", o.color_filter},
          {"ghost_effect", o.ghost_effect},
          {"dynamic_zoom", o.dynamic_zoom},
          {"face_tracking", o.face_tracking},
          {"captions", o.captions},
          {"caption_style", to_string(o.caption_style)}};
}

json to_json(const JobRequest &req) {
  json doc = {{"mode", to_string(req.mode)},
              {"source_id", req.source_id},
              {"webhook_url", req.webhook_url},
              {"options", to_json(req.options)}};
  if (!req.destination_folder.empty())
    doc["destination_folder"] = req.destination_folder;
  if (req.instruction)
    doc["instruction"] = *req.instruction;
  if (req.title)
    doc["title"] = *req.title;

  if (!req.ranges.empty()) {
    json list = json::array();
    for (const auto &r : req.ranges) {
      json item = {{"start", time_json(r.start)}, {"end", time_json(r.end)}};
      if (r.title)
        item["title"] = *r.title;
      list.push_back(std::move(item));
    }
    doc[req.mode == RequestMode::ManualCut ? "clips" : "segments"] =
        std::move(list);
  }
  return doc;
}

} // namespace reel_cutter
