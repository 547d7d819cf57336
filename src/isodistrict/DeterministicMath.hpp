#pragma once

namespace isodistrict {

// Deterministic scalar helpers for scatter placement.
//
// std::sin/cos may differ in the last bits between standard libraries; pedestrian and tree
// scatter feeds pixel positions and frame hashes, so it uses these libm-free approximations:
//   y = Bx + Cx|x|,  y = P*(y|y| - y) + y   for x in [-pi, pi].

inline constexpr float kPiF = 3.14159265358979323846f;
inline constexpr float kTwoPiF = 6.28318530717958647692f;
inline constexpr float kHalfPiF = 1.57079632679489661923f;
inline constexpr float kInvTwoPiF = 0.15915494309189533577f;

inline float AbsF(float x) { return (x < 0.0f) ? -x : x; }

// Floor for finite inputs in a modest range, without std::floor.
inline int FloorToInt(float x)
{
  int i = static_cast<int>(x);
  if (x < 0.0f && static_cast<float>(i) != x) i -= 1;
  return i;
}

// Round half away from zero, without std::round.
inline int RoundToInt(float x)
{
  if (x >= 0.0f) return FloorToInt(x + 0.5f);
  return -FloorToInt((-x) + 0.5f);
}

inline float WrapAnglePi(float rad)
{
  const float turns = rad * kInvTwoPiF;
  const int k = FloorToInt(turns);
  float frac = turns - static_cast<float>(k);
  if (frac < 0.0f) frac += 1.0f;

  float a = frac * kTwoPiF;
  if (a > kPiF) a -= kTwoPiF;
  return a;
}

inline float FastSinWrapped(float x)
{
  constexpr float B = 4.0f / kPiF;
  constexpr float C = -4.0f / (kPiF * kPiF);
  constexpr float P = 0.225f;

  float y = B * x + C * x * AbsF(x);
  y = P * (y * AbsF(y) - y) + y;
  return y;
}

inline float FastSinRad(float rad) { return FastSinWrapped(WrapAnglePi(rad)); }

inline float FastCosRad(float rad)
{
  float x = WrapAnglePi(rad) + kHalfPiF;
  if (x > kPiF) x -= kTwoPiF;
  return FastSinWrapped(x);
}

} // namespace isodistrict
