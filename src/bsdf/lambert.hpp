#pragma once

#include <ImathVec.h>

#include <algorithm>

namespace lambert {
  /* cosine falloff of the diffuse term. light arriving from below the
   * surface doesn't contribute */
  inline float f(const Imath::V3f& n, const Imath::V3f& l)
  {
    return std::max(n.dot(l), 0.0f);
  }
}
