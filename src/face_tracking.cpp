/**
 * @file face_tracking.cpp
 * @brief Crop trajectory smoothing, simplification and expression output
 */

#include "reel_cutter/face_tracking.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "reel_cutter/config.hpp"

namespace reel_cutter {

TrackingLimits TrackingLimits::from_config() {
  TrackingLimits limits;
  limits.smoothing = Config::face_smoothing();
  limits.min_detection_ratio = Config::face_min_detection_ratio();
  limits.sample_fps = Config::face_sample_fps();
  return limits;
}

// **---- Applicability ----**

bool layout_supports_tracking(Layout layout) {
  return layout == Layout::Vertical || layout == Layout::BlurZoom;
}

int tracking_frame_width(const RenderOptions &options,
                         const SourceMedia &source) {
  if (options.layout == Layout::BlurZoom)
    return options.zoom_level;
  if (source.width <= 0 || source.height <= 0)
    return 0;
  /// vertical: scaled to cover the output, height first
  double by_height =
      static_cast<double>(source.width) * options.height / source.height;
  return static_cast<int>(std::max(by_height, double(options.width)));
}

int tracking_crop_width(const RenderOptions &options) {
  if (options.layout == Layout::BlurZoom)
    return std::min(options.width, options.zoom_level);
  return options.width;
}

bool tracking_applicable(const RenderOptions &options,
                         const SourceMedia &source, const Segment &segment,
                         const TrackingLimits &limits) {
  if (!options.face_tracking || !layout_supports_tracking(options.layout))
    return false;
  if (segment.duration() < limits.min_segment_duration)
    return false;
  int frame_w = tracking_frame_width(options, source);
  return frame_w >= limits.min_width_ratio * tracking_crop_width(options);
}

// **---- Smoothing ----**

std::vector<double> smooth_positions(
    const std::vector<std::optional<double>> &positions,
    const TrackingLimits &limits) {
  const size_t n = positions.size();
  std::vector<std::optional<double>> filled(positions);

  std::optional<double> last;
  for (size_t i = 0; i < n; ++i) {
    if (filled[i])
      last = filled[i];
    else if (last)
      filled[i] = last;
  }
  last.reset();
  for (size_t i = n; i-- > 0;) {
    if (filled[i])
      last = filled[i];
    else if (last)
      filled[i] = last;
  }

  if (n == 0 || !filled[0])
    return std::vector<double>(n, 0.5);

  std::vector<double> out;
  out.reserve(n);
  out.push_back(*filled[0]);
  for (size_t i = 1; i < n; ++i) {
    double prev = out.back();
    double next = prev + limits.smoothing * (*filled[i] - prev);
    double delta = next - prev;
    if (std::fabs(delta) > limits.max_speed)
      next = prev + (delta > 0 ? limits.max_speed : -limits.max_speed);
    out.push_back(next);
  }
  return out;
}

// **---- RDP ----**

namespace {

struct Point {
  double t;
  double x;
};

double point_line_distance(const Point &p, const Point &a, const Point &b) {
  double dt = b.t - a.t;
  double dx = b.x - a.x;
  double len_sq = dt * dt + dx * dx;
  if (len_sq < 1e-12)
    return std::hypot(p.t - a.t, p.x - a.x);
  double u = ((p.t - a.t) * dt + (p.x - a.x) * dx) / len_sq;
  u = std::clamp(u, 0.0, 1.0);
  return std::hypot(p.t - (a.t + u * dt), p.x - (a.x + u * dx));
}

void rdp(const std::vector<Point> &pts, size_t first, size_t last,
         double epsilon, std::vector<bool> &keep) {
  if (last <= first + 1)
    return;
  double max_dist = 0.0;
  size_t max_idx = first;
  for (size_t i = first + 1; i < last; ++i) {
    double d = point_line_distance(pts[i], pts[first], pts[last]);
    if (d > max_dist) {
      max_dist = d;
      max_idx = i;
    }
  }
  if (max_dist > epsilon) {
    keep[max_idx] = true;
    rdp(pts, first, max_idx, epsilon, keep);
    rdp(pts, max_idx, last, epsilon, keep);
  }
}

} // anonymous namespace

std::vector<CropKeyframe> simplify_keyframes(
    const std::vector<CropKeyframe> &points, double epsilon) {
  if (points.size() <= 2)
    return points;

  double t0 = points.front().t;
  double span = points.back().t - t0;
  if (span <= 0.0)
    span = 1.0;

  std::vector<Point> pts;
  pts.reserve(points.size());
  for (const auto &k : points)
    pts.push_back({(k.t - t0) / span, k.x});

  std::vector<bool> keep(points.size(), false);
  keep.front() = true;
  keep.back() = true;
  rdp(pts, 0, pts.size() - 1, epsilon, keep);

  std::vector<CropKeyframe> out;
  for (size_t i = 0; i < points.size(); ++i) {
    if (keep[i])
      out.push_back(points[i]);
  }
  return out;
}

// **---- Trajectory ----**

std::optional<CropTrajectory> build_trajectory(
    const std::vector<FaceSample> &samples, const Segment &segment,
    int crop_width, const TrackingLimits &limits) {
  std::vector<FaceSample> inside;
  for (const auto &s : samples) {
    if (s.t >= segment.start && s.t <= segment.end)
      inside.push_back(s);
  }
  if (inside.empty())
    return std::nullopt;
  std::stable_sort(inside.begin(), inside.end(),
                   [](const FaceSample &a, const FaceSample &b) {
                     return a.t < b.t;
                   });

  size_t detected = 0;
  std::vector<std::optional<double>> positions;
  positions.reserve(inside.size());
  for (const auto &s : inside) {
    if (s.x) {
      ++detected;
      positions.push_back(std::clamp(*s.x, 0.0, 1.0));
    } else {
      positions.push_back(std::nullopt);
    }
  }
  double ratio = static_cast<double>(detected) / inside.size();
  if (ratio < limits.min_detection_ratio)
    return std::nullopt;

  std::vector<double> smoothed = smooth_positions(positions, limits);
  std::vector<CropKeyframe> points;
  points.reserve(inside.size());
  for (size_t i = 0; i < inside.size(); ++i)
    points.push_back({inside[i].t - segment.start, smoothed[i]});

  CropTrajectory trajectory;
  trajectory.keyframes = simplify_keyframes(points, limits.rdp_epsilon);
  trajectory.crop_width = crop_width;
  return trajectory;
}

std::string CropTrajectory::x_expression() const {
  const double half = crop_width / 2.0;
  const auto centre = [&](const std::string &x) {
    return fmt::format("({})*iw-{:.0f}", x, half);
  };
  const auto clamp_even = [&](const std::string &expr) {
    return fmt::format("trunc(min(max({},0),iw-{})/2)*2", expr, crop_width);
  };

  if (keyframes.empty())
    return fmt::format("(iw-{})/2", crop_width);

  /// Nested if(): the last keyframe holds until the end
  std::string result = centre(fmt::format("{:.4f}", keyframes.back().x));
  for (size_t i = keyframes.size() - 1; i-- > 0;) {
    const auto &k0 = keyframes[i];
    const auto &k1 = keyframes[i + 1];
    double dt = k1.t - k0.t;
    if (dt < 0.001)
      continue;
    std::string lerp = fmt::format("{:.4f}+{:.6f}*(t-{:.3f})/{:.3f}", k0.x,
                                   k1.x - k0.x, k0.t, dt);
    result = fmt::format("if(lt(t,{:.3f}),{},{})", k1.t, centre(lerp), result);
  }
  return clamp_even(result);
}

} // namespace reel_cutter
