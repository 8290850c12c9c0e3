#include "cook_torrance.hpp"
#include "../bsdf/lambert.hpp"
#include "../bsdf/microfacet.hpp"
#include "../utils/color.hpp"

namespace ct = microfacet::cook_torrance;

const std::unordered_map<std::string, float cook_torrance_material_t::params_t::*>
cook_torrance_material_t::float_parameters = {
  { "ka",             &params_t::ka },
  { "kd",             &params_t::kd },
  { "ks",             &params_t::ks },
  { "ksg",            &params_t::ksg },
  { "ktg",            &params_t::ktg },
  { "roughness",      &params_t::roughness },
  { "gauss_constant", &params_t::gauss_constant },
  { "ior",            &params_t::ior }
};

const std::unordered_map<std::string, Imath::Color3f cook_torrance_material_t::params_t::*>
cook_torrance_material_t::color_parameters = {
  { "ambient",      &params_t::ambient },
  { "diffuse",      &params_t::diffuse },
  { "specular",     &params_t::specular },
  { "transmission", &params_t::transmission }
};

cook_torrance_material_t::cook_torrance_material_t(const params_t& params)
  : params(params)
{
  this->params.validate();
  this->params.precompute();
}

Imath::Color3f cook_torrance_material_t::evaluate(
  const Imath::V3f& n
, const Imath::V3f& i
, const Imath::V3f& l) const
{
  const auto ambient  = params.ambient * params.ka;
  const auto diffuse  = params.diffuse * (params.kd * lambert::f(n, l));
  const auto specular = params.specular * (params.ks * ct::f(params, n, i, l));

  return color::finite_or_black(specular)
    + color::finite_or_black(diffuse)
    + color::finite_or_black(ambient);
}

bool cook_torrance_material_t::is_reflective() const {
  return params.ksg > 0.0f;
}

bool cook_torrance_material_t::is_refractive() const {
  return params.ktg > 0.0f;
}

Imath::Color3f cook_torrance_material_t::scale_reflection(const Imath::Color3f& c) const {
  return c * params.ksg;
}

Imath::Color3f cook_torrance_material_t::scale_transmission(const Imath::Color3f& c) const {
  return c * params.ktg;
}

Imath::Color3f cook_torrance_material_t::transmission_tint() const {
  return params.transmission;
}

float cook_torrance_material_t::ior() const {
  return params.ior;
}
