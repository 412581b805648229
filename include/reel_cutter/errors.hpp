/**
 * @file errors.hpp
 * @brief Error taxonomy for the job pipeline
 *
 * @details Every failure the pipeline can report derives from PipelineError
 *          and carries a stable kind() string. The kind is what ends up in the
 *          job record and in the error webhook.
 *
 *          - ValidationError: bad request shape or values
 *
 *          - SourceError: download / upload failure
 *
 *          - AnalysisError: no viable segments or provider failure
 *
 *          - RenderError: media engine failure
 *
 *          - TranscriptionError: non-fatal, captions degrade
 *
 *          - TimeoutError: a stage exceeded its ceiling
 *
 *          - CancelledError: cooperative cancellation, not a failure
 */

#ifndef REEL_CUTTER_ERRORS_HPP
#define REEL_CUTTER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace reel_cutter {

/**
 * @class PipelineError
 * @brief Base class for classified pipeline failures.
 */
class PipelineError : public std::runtime_error {
public:
  PipelineError(const char *kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  /// Stable machine-readable classification
  const char *kind() const noexcept { return kind_; }

private:
  const char *kind_;
};

#define REEL_CUTTER_DEFINE_ERROR(Name, kind_name)                              \
  class Name : public PipelineError {                                          \
  public:                                                                      \
    explicit Name(const std::string &message)                                  \
        : PipelineError(kind_name, message) {}                                 \
  }

REEL_CUTTER_DEFINE_ERROR(ValidationError, "validation");
REEL_CUTTER_DEFINE_ERROR(SourceError, "source");
REEL_CUTTER_DEFINE_ERROR(AnalysisError, "analysis");
REEL_CUTTER_DEFINE_ERROR(RenderError, "render");
REEL_CUTTER_DEFINE_ERROR(TranscriptionError, "transcription");
REEL_CUTTER_DEFINE_ERROR(TimeoutError, "timeout");
REEL_CUTTER_DEFINE_ERROR(CancelledError, "cancelled");
REEL_CUTTER_DEFINE_ERROR(InvalidStateError, "invalid_state");
REEL_CUTTER_DEFINE_ERROR(JobNotFoundError, "not_found");
REEL_CUTTER_DEFINE_ERROR(NotifyError, "notify");

#undef REEL_CUTTER_DEFINE_ERROR

} // namespace reel_cutter

#endif // REEL_CUTTER_ERRORS_HPP
