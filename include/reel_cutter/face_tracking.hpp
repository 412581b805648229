/**
 * @file face_tracking.hpp
 * @brief Face-centre samples to a smoothed horizontal crop trajectory
 *
 * @details Detection is done by a FaceDetector collaborator. This module
 *          decides whether tracking is worth applying, smooths the samples,
 *          reduces them to a few keyframes and emits the ffmpeg crop x
 *          expression. All times are segment-local seconds.
 */

#ifndef REEL_CUTTER_FACE_TRACKING_HPP
#define REEL_CUTTER_FACE_TRACKING_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace reel_cutter {

/**
 * @struct FaceSample
 * @brief Normalised face-centre x (0..1) at source time t, if a face was seen.
 */
struct FaceSample {
  double t = 0.0;
  std::optional<double> x;
};

struct TrackingLimits {
  double smoothing = 0.15;            //< EMA weight of a new sample
  double max_speed = 0.05;            //< Max x change per sample
  double min_detection_ratio = 0.3;
  double min_segment_duration = 3.0;  //< Seconds
  double min_width_ratio = 1.1;       //< Scaled width vs crop width
  double rdp_epsilon = 0.008;         //< On time-normalised points
  double sample_fps = 4.0;

  static TrackingLimits from_config();
};

struct CropKeyframe {
  double t = 0.0; //< Segment-local seconds
  double x = 0.5; //< Normalised face centre
};

/**
 * @struct CropTrajectory
 * @brief Keyframed crop centre for one segment.
 */
struct CropTrajectory {
  std::vector<CropKeyframe> keyframes;
  int crop_width = 0;

  /**
   * @brief Crop x expression, piecewise linear between keyframes, clamped to
   *        [0, iw - crop_width] and rounded down to an even pixel.
   * @note Unescaped; the graph serializer escapes commas.
   */
  std::string x_expression() const;
};

/// Layouts whose crop can follow a face
bool layout_supports_tracking(Layout layout);

/**
 * @brief Width of the frame the layout crops from, after scaling.
 * @return 0 when unknown
 */
int tracking_frame_width(const RenderOptions &options,
                         const SourceMedia &source);

/// Width of the window the crop keeps (output width, or the zoomed foreground)
int tracking_crop_width(const RenderOptions &options);

/**
 * @brief Cheap pre-checks that do not need detection.
 * @return false when the layout cannot track, the frame is too narrow or the
 *         segment is too short
 */
bool tracking_applicable(const RenderOptions &options,
                         const SourceMedia &source, const Segment &segment,
                         const TrackingLimits &limits);

/**
 * @brief Gap fill (forward then backward), EMA smoothing and speed clamp.
 * @return One value per input; all 0.5 when nothing was detected
 */
std::vector<double> smooth_positions(
    const std::vector<std::optional<double>> &positions,
    const TrackingLimits &limits);

/// Ramer-Douglas-Peucker simplification on (t / span, x) points
std::vector<CropKeyframe> simplify_keyframes(
    const std::vector<CropKeyframe> &points, double epsilon);

/**
 * @brief Build the trajectory for one segment.
 * @param samples Detector output on the source timeline
 * @return std::nullopt when faces appear in too few samples
 */
std::optional<CropTrajectory> build_trajectory(
    const std::vector<FaceSample> &samples, const Segment &segment,
    int crop_width, const TrackingLimits &limits);

} // namespace reel_cutter

#endif // REEL_CUTTER_FACE_TRACKING_HPP
