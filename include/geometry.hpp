#pragma once
#include "types.hpp"

// Joint angles in degrees from one frame's landmarks. Left and right sides are
// averaged into a single point.
// Degenerate geometry never throws: hip and knee fall back to 180 (extended),
// spine falls back to 0 (vertical).

Landmark average_point(const Landmark& a, const Landmark& b);

double hip_angle(const KeypointSet& kp);
double spine_angle(const KeypointSet& kp);
double knee_angle(const KeypointSet& kp);
