#pragma once

#include "../../material.hpp"

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-register"
#include <ImathColor.h>
#pragma clang diagnostic pop

#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

/**
 * ! YAML importer code for material parameters
 */
namespace YAML {
  /* ! rgb color, written as a sequence of three floats */
  template<>
  struct convert<Imath::Color3f> {
    static Node encode(const Imath::Color3f& rhs) {
      Node rgb;
      rgb.push_back(rhs.x);
      rgb.push_back(rhs.y);
      rgb.push_back(rhs.z);
      return rgb;
    }

    static bool decode(const Node& node, Imath::Color3f& rhs) {
      if (!node.IsSequence() || node.size() != 3) {
        return false;
      }

      rhs.x = node[0].as<float>();
      rhs.y = node[1].as<float>();
      rhs.z = node[2].as<float>();

      return true;
    }
  };

  /* ! material, built from a model type and a map of named parameters */
  template<>
  struct convert<material_t::shared_t> {
    static bool decode(const Node& node, material_t::shared_t& material) {
      if (!node.IsMap()) {
        return false;
      }

      const auto type = node["type"].as<std::string>("cook_torrance");

      material_t::builder_t::scoped_t builder(material_t::builder(type));

      const auto parameters = node["parameters"];
      if (parameters && !parameters.IsMap()) {
        throw std::runtime_error("Material parameters need to be a map");
      }

      for (auto i=parameters.begin(); i!=parameters.end(); ++i) {
        const auto name = i->first.as<std::string>();
        const auto value = i->second;

        if (value.IsScalar()) {
          builder->parameter(name, value.as<float>());
        }
        else if (value.IsSequence()) {
          builder->parameter(name, value.as<Imath::Color3f>());
        }
        else {
          throw std::runtime_error("Unsupported value for parameter: " + name);
        }
      }

      material = builder->build();

      return true;
    }
  };
}
