#pragma once

#include "params.hpp"
#include "math/fresnel.hpp"
#include "math/vector.hpp"

#include <algorithm>
#include <cmath>

namespace microfacet {

  /* Cook-Torrance microfacet model with a gaussian facet distribution,
   * Source: Cook, Torrance - A Reflectance Model for Computer Graphics */
  namespace cook_torrance {

    namespace details {
      /* gaussian microfacet distribution. 'cos_nh' is the cosine between
       * the surface normal and the half vector, and gets clamped to the
       * domain of acos */
      template<typename Params>
      inline float D(const Params& params, float cos_nh) {
        const auto alpha = std::acos(std::clamp(cos_nh, -1.0f, 1.0f));
        return params.gauss_constant * std::exp(-alpha * params.inv_sqrt_roughness);
      }

      /* masking-shadowing term of the v-groove model. callers make sure
       * 'cos_ih' is bounded away from zero */
      inline float G(float cos_nh, float cos_ni, float cos_nl, float cos_ih) {
        const auto g1 = (2.0f * cos_nh * cos_ni) / cos_ih;
        const auto g2 = (2.0f * cos_nh * cos_nl) / cos_ih;
        return std::min(g1, g2);
      }

      template<typename Params>
      inline float F(const Params& params, float cos_ih) {
        return fresnel::schlick(params.f0, cos_ih);
      }
    }

    /* evaluates the specular part of the brdf for the view direction 'i'
     * and the light direction 'l'. all vectors are expected to be
     * normalized and in world space. the result is 0 whenever the
     * configuration is degenerate (grazing angles, light or viewer below
     * the horizon, or 'i' and 'l' cancelling out), and never exceeds
     * 2 * gauss_constant / bsdf::MIN_DENOMINATOR */
    template<typename Params>
    inline float f(
      const Params& params
    , const Imath::V3f& n
    , const Imath::V3f& i
    , const Imath::V3f& l)
    {
      using namespace details;

      const auto cos_ni = n.dot(i);
      const auto cos_nl = n.dot(l);

      if (!(cos_ni > bsdf::EPSILON) || !(cos_nl > bsdf::EPSILON)) {
        return 0.0f;
      }

      Imath::V3f h;
      if (!half_vector(i, l, bsdf::EPSILON, h)) {
        return 0.0f;
      }

      const auto cos_ih = i.dot(h);
      if (!(cos_ih > bsdf::EPSILON)) {
        return 0.0f;
      }

      const auto cos_nh = n.dot(h);

      const auto f = F(params, cos_ih);
      const auto d = D(params, cos_nh);
      const auto g = G(cos_nh, cos_ni, cos_nl, cos_ih);

      const auto c = f * d * g / std::max(cos_ni * cos_nl, bsdf::MIN_DENOMINATOR);

      return std::isfinite(c) ? c : 0.0f;
    }
  }
}
