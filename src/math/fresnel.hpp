#pragma once

#include <algorithm>
#include <cmath>

namespace fresnel {
  /* reflectance at normal incidence for a boundary between media with
   * indices of refraction 'n1' and 'n2' */
  inline float f0(float n1, float n2) {
    const auto r = (n1 - n2) / (n1 + n2);
    return r * r;
  }

  inline float schlick_weight(float cos_theta) {
    const auto m = std::clamp(1.0f - cos_theta, 0.0f, 1.0f);
    return (m * m) * (m * m) * m;
  }

  /* Schlick's approximation of the dielectric fresnel term */
  inline float schlick(float f0, float cos_theta) {
    return f0 + (1.0f - f0) * schlick_weight(cos_theta);
  }
}
