#include "material.hpp"
#include "materials/cook_torrance.hpp"
#include "materials/lambert.hpp"
#include "materials/mirror.hpp"

#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace {
  /* generic builder for all material models. every model publishes the
   * names of its parameters, and the members they map to */
  template<typename T>
  struct model_builder_t : public material_t::builder_t {
    typename T::params_t params;
    std::string type;

    model_builder_t(const std::string& type)
      : type(type)
    {}

    void parameter(const std::string& name, float f) override {
      const auto p = T::float_parameters.find(name);
      if (p == T::float_parameters.end()) {
        throw std::runtime_error(
          "Unknown float parameter '" + name + "' for material type: " + type);
      }
      params.*(p->second) = f;
    }

    void parameter(const std::string& name, const Imath::Color3f& c) override {
      const auto p = T::color_parameters.find(name);
      if (p == T::color_parameters.end()) {
        throw std::runtime_error(
          "Unknown color parameter '" + name + "' for material type: " + type);
      }
      params.*(p->second) = c;
    }

    material_t::shared_t build() const override {
      return std::make_shared<const T>(params);
    }
  };

  template<typename T>
  material_t::builder_t::scoped_t make_builder(const std::string& type) {
    return material_t::builder_t::scoped_t(new model_builder_t<T>(type));
  }

  typedef std::function<material_t::builder_t::scoped_t (const std::string&)> factory_t;

  const std::unordered_map<std::string, factory_t> models = {
    { "cook_torrance", make_builder<cook_torrance_material_t> },
    { "lambert",       make_builder<lambert_material_t> },
    { "mirror",        make_builder<mirror_material_t> }
  };
}

material_t::builder_t::scoped_t material_t::builder(const std::string& type) {
  const auto& model = models.find(type);
  if (model == models.end()) {
    throw std::runtime_error("Unknown material type: " + type);
  }
  return model->second(type);
}
