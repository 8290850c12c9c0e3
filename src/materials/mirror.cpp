#include "mirror.hpp"

const std::unordered_map<std::string, float mirror_material_t::params_t::*>
mirror_material_t::float_parameters = {
  { "ksg", &params_t::ksg },
  { "ktg", &params_t::ktg },
  { "ior", &params_t::ior }
};

const std::unordered_map<std::string, Imath::Color3f mirror_material_t::params_t::*>
mirror_material_t::color_parameters = {
  { "transmission", &params_t::transmission }
};

mirror_material_t::mirror_material_t(const params_t& params)
  : params(params)
{
  this->params.validate();
  this->params.precompute();
}

Imath::Color3f mirror_material_t::evaluate(
  const Imath::V3f& n
, const Imath::V3f& i
, const Imath::V3f& l) const
{
  return Imath::Color3f(0.0f);
}

bool mirror_material_t::is_reflective() const {
  return params.ksg > 0.0f;
}

bool mirror_material_t::is_refractive() const {
  return params.ktg > 0.0f;
}

Imath::Color3f mirror_material_t::scale_reflection(const Imath::Color3f& c) const {
  return c * params.ksg;
}

Imath::Color3f mirror_material_t::scale_transmission(const Imath::Color3f& c) const {
  return c * params.ktg;
}

Imath::Color3f mirror_material_t::transmission_tint() const {
  return params.transmission;
}

float mirror_material_t::ior() const {
  return params.ior;
}
