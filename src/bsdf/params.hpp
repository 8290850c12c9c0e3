#pragma once

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-register"
#include <ImathColor.h>
#pragma clang diagnostic pop

#include "math/fresnel.hpp"

#include <cmath>
#include <string>

namespace bsdf {
  /* cosines and vector lengths below this threshold are treated as
   * grazing, and don't produce a specular response */
  static const float EPSILON = 1e-4f;

  /* lower bound for the cos(n,i) * cos(n,l) denominator of the specular
   * brdf. with G <= 2 and F <= 1 this caps the specular factor at
   * 2 * gauss_constant / MIN_DENOMINATOR close to the horizon */
  static const float MIN_DENOMINATOR = 1e-2f;

  namespace params {
    /* throws if 'v' is not a finite value >= 0 */
    void coefficient(const std::string& name, float v);

    /* throws if 'v' is not a finite value > 0 */
    void positive(const std::string& name, float v);

    /* throws if any channel of 'c' is outside of [0,1] */
    void color(const std::string& name, const Imath::Color3f& c);

    struct lambert_t {
      float ka;               // ambient coefficient
      float kd;               // diffuse coefficient
      Imath::Color3f ambient;
      Imath::Color3f diffuse;

      inline lambert_t()
        : ka(0.0f)
        , kd(0.0f)
        , ambient(1.0f)
        , diffuse(1.0f)
      {}

      void validate() const;

      inline void precompute() {
      }
    };

    struct mirror_t {
      float ksg;              // global specular coefficient
      float ktg;              // global transmissive coefficient
      Imath::Color3f transmission;
      float ior;

      inline mirror_t()
        : ksg(0.0f)
        , ktg(0.0f)
        , transmission(1.0f)
        , ior(1.0f)
      {}

      void validate() const;

      inline void precompute() {
      }
    };

    struct cook_torrance_t {
      float ka;               // ambient coefficient
      float kd;               // diffuse coefficient
      float ks;               // local specular coefficient
      float ksg;              // global specular coefficient (mirror reflection)
      float ktg;              // global transmissive coefficient (refraction)
      Imath::Color3f ambient;
      Imath::Color3f diffuse;
      Imath::Color3f specular;
      Imath::Color3f transmission;
      float roughness;        // spread of the microfacet distribution
      float gauss_constant;   // scale of the microfacet distribution
      float ior;              // index of refraction

      // derived parameters, filled in by precompute()
      float f0;
      float inv_sqrt_roughness;

      inline cook_torrance_t()
        : ka(0.0f)
        , kd(0.0f)
        , ks(0.0f)
        , ksg(0.0f)
        , ktg(0.0f)
        , ambient(1.0f)
        , diffuse(1.0f)
        , specular(1.0f)
        , transmission(1.0f)
        , roughness(0.2f)
        , gauss_constant(1.0f)
        , ior(1.0f)
        , f0(0.0f)
        , inv_sqrt_roughness(0.0f)
      {}

      void validate() const;

      inline void precompute() {
        f0 = fresnel::f0(1.0f, ior);
        inv_sqrt_roughness = 1.0f / std::sqrt(roughness);
      }
    };
  }
}
