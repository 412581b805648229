/**
 * @file request.hpp
 * @brief Job request model and JSON parsing
 *
 * @details Three request modes:
 *
 *          - analyze: AI discovery with an optional instruction
 *
 *          - manual_cut: independent clips, one output each
 *
 *          - manual_edit: segments combined into one output
 *
 *          Shape and value errors are ValidationErrors raised here, before a
 *          job record exists.
 */

#ifndef REEL_CUTTER_REQUEST_HPP
#define REEL_CUTTER_REQUEST_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "render_plan.hpp"
#include "types.hpp"

namespace reel_cutter {

enum class RequestMode { Analyze, ManualCut, ManualEdit };

const char *to_string(RequestMode mode);

/**
 * @struct JobRequest
 * @brief A validated request, immutable once the job is created.
 */
struct JobRequest {
  RequestMode mode = RequestMode::Analyze;
  std::string source_id;
  std::string webhook_url;
  std::string destination_folder;          //< Empty = provider default
  std::optional<std::string> instruction;  //< analyze only
  std::optional<std::string> title;        //< manual_edit only
  std::vector<TimeRange> ranges;           //< clips or segments
  RenderOptions options;
};

/**
 * @brief Parse and validate a request document.
 * @throws ValidationError
 */
JobRequest parse_request(const nlohmann::json &doc);

/**
 * @brief Parse the "options" object; absent keys keep their defaults.
 * @throws ValidationError on wrong types, unknown enum names or out-of-range
 *         values
 */
RenderOptions parse_options(const nlohmann::json &doc);

/// True for an absolute http:// or https:// URL with a host
bool is_http_url(const std::string &url);

nlohmann::json to_json(const RenderOptions &options);
nlohmann::json to_json(const JobRequest &request);

} // namespace reel_cutter

#endif // REEL_CUTTER_REQUEST_HPP
