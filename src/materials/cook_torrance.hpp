#pragma once

#include "../material.hpp"
#include "../bsdf/params.hpp"

#include <string>
#include <unordered_map>

/* Cook-Torrance microfacet material. Combines a constant ambient term, a
 * lambertian diffuse term and a microfacet specular highlight, plus
 * coefficients that drive mirror reflection and refraction in the
 * integrator */
struct cook_torrance_material_t : public material_t {
  typedef bsdf::params::cook_torrance_t params_t;

  static const std::unordered_map<std::string, float params_t::*> float_parameters;
  static const std::unordered_map<std::string, Imath::Color3f params_t::*> color_parameters;

  /* throws if 'params' is invalid */
  explicit cook_torrance_material_t(const params_t& params);

  Imath::Color3f evaluate(
    const Imath::V3f& n
  , const Imath::V3f& i
  , const Imath::V3f& l) const override;

  bool is_reflective() const override;
  bool is_refractive() const override;

  Imath::Color3f scale_reflection(const Imath::Color3f& c) const override;
  Imath::Color3f scale_transmission(const Imath::Color3f& c) const override;

  Imath::Color3f transmission_tint() const override;

  float ior() const override;

  inline const params_t& parameters() const {
    return params;
  }

private:
  params_t params;
};
