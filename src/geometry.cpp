#include "geometry.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace {

constexpr double kPi = 3.14159265358979323846;

struct Vec2 {
  double x, y;
};

Vec2 from_to(const Landmark& a, const Landmark& b) { return {b.x - a.x, b.y - a.y}; }

// Angle between two image-plane vectors, or nullopt if either has zero length.
std::optional<double> angle_between(Vec2 u, Vec2 v) {
  const double nu = std::hypot(u.x, u.y);
  const double nv = std::hypot(v.x, v.y);
  if (nu == 0.0 || nv == 0.0) return std::nullopt;
  double c = (u.x * v.x + u.y * v.y) / (nu * nv);
  c = std::max(-1.0, std::min(1.0, c));
  return std::acos(c) * 180.0 / kPi;
}

Landmark mid(const KeypointSet& kp, BodyPart left, BodyPart right) {
  return average_point(kp[left], kp[right]);
}

}  // namespace

Landmark average_point(const Landmark& a, const Landmark& b) {
  return Landmark{(a.x + b.x) / 2.0, (a.y + b.y) / 2.0, (a.z + b.z) / 2.0,
                  (a.visibility + b.visibility) / 2.0};
}

double hip_angle(const KeypointSet& kp) {
  const Landmark hip = mid(kp, BodyPart::LeftHip, BodyPart::RightHip);
  const Landmark knee = mid(kp, BodyPart::LeftKnee, BodyPart::RightKnee);
  const Landmark ankle = mid(kp, BodyPart::LeftAnkle, BodyPart::RightAnkle);
  return angle_between(from_to(hip, knee), from_to(knee, ankle)).value_or(180.0);
}

double spine_angle(const KeypointSet& kp) {
  const Landmark shoulder = mid(kp, BodyPart::LeftShoulder, BodyPart::RightShoulder);
  const Landmark hip = mid(kp, BodyPart::LeftHip, BodyPart::RightHip);
  // Image y grows downward, so "up" is -y.
  return angle_between(from_to(hip, shoulder), Vec2{0.0, -1.0}).value_or(0.0);
}

double knee_angle(const KeypointSet& kp) {
  const Landmark hip = mid(kp, BodyPart::LeftHip, BodyPart::RightHip);
  const Landmark knee = mid(kp, BodyPart::LeftKnee, BodyPart::RightKnee);
  const Landmark ankle = mid(kp, BodyPart::LeftAnkle, BodyPart::RightAnkle);
  return angle_between(from_to(knee, hip), from_to(knee, ankle)).value_or(180.0);
}
