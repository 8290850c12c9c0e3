#include "materials.hpp"
#include "../library.hpp"
#include "materials/convert.hpp"

#include <yaml-cpp/yaml.h>

#include <iostream>
#include <stdexcept>

namespace codec {
  namespace materials {
    namespace {
      void import_materials(const YAML::Node& config, library_t& library) {
        const auto materials = config["materials"];
        if (!materials || !materials.IsMap()) {
          throw std::runtime_error("Material library needs a 'materials' map");
        }

        for (auto i=materials.begin(); i!=materials.end(); ++i) {
          const auto name = i->first.as<std::string>();
          std::cout << "Material: " << name << " (" << library.num_materials() << ")" << std::endl;

          try {
            library.add(name, i->second.as<material_t::shared_t>());
          }
          catch (const std::runtime_error& e) {
            throw std::runtime_error("Invalid material '" + name + "': " + e.what());
          }
        }
      }
    }

    void import(const std::string& path, library_t& library) {
      std::cout << "Importing materials: " << path << std::endl;
      import_materials(YAML::LoadFile(path), library);
    }

    void parse(const std::string& document, library_t& library) {
      import_materials(YAML::Load(document), library);
    }
  }
}
