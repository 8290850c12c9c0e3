#include "lambert.hpp"
#include "../bsdf/lambert.hpp"
#include "../utils/color.hpp"

const std::unordered_map<std::string, float lambert_material_t::params_t::*>
lambert_material_t::float_parameters = {
  { "ka", &params_t::ka },
  { "kd", &params_t::kd }
};

const std::unordered_map<std::string, Imath::Color3f lambert_material_t::params_t::*>
lambert_material_t::color_parameters = {
  { "ambient", &params_t::ambient },
  { "diffuse", &params_t::diffuse }
};

lambert_material_t::lambert_material_t(const params_t& params)
  : params(params)
{
  this->params.validate();
  this->params.precompute();
}

Imath::Color3f lambert_material_t::evaluate(
  const Imath::V3f& n
, const Imath::V3f& i
, const Imath::V3f& l) const
{
  const auto ambient = params.ambient * params.ka;
  const auto diffuse = params.diffuse * (params.kd * lambert::f(n, l));

  return color::finite_or_black(diffuse) + color::finite_or_black(ambient);
}

bool lambert_material_t::is_reflective() const {
  return false;
}

bool lambert_material_t::is_refractive() const {
  return false;
}

Imath::Color3f lambert_material_t::scale_reflection(const Imath::Color3f& c) const {
  return Imath::Color3f(0.0f);
}

Imath::Color3f lambert_material_t::scale_transmission(const Imath::Color3f& c) const {
  return Imath::Color3f(0.0f);
}

Imath::Color3f lambert_material_t::transmission_tint() const {
  return Imath::Color3f(1.0f);
}

float lambert_material_t::ior() const {
  return 1.0f;
}
