#pragma once

#include <ImathVec.h>

#include <cmath>

inline bool is_finite(const Imath::V3f& v) {
  return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

/* computes the normalized half vector between the view direction 'i' and
 * the light direction 'l'. returns false if the two directions cancel out
 * and there is no well defined half vector */
inline bool half_vector(
  const Imath::V3f& i
, const Imath::V3f& l
, float epsilon
, Imath::V3f& h)
{
  h = i + l;

  const auto len = h.length();
  if (!(len >= epsilon)) {
    h = Imath::V3f(0.0f);
    return false;
  }

  h /= len;
  return true;
}
