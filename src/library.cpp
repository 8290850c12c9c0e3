#include "library.hpp"

#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

struct library_t::details_t {
  std::vector<material_t::shared_t> materials;
  std::vector<std::string>          names;

  std::unordered_map<std::string, uint32_t> materials_by_name;
};

library_t::library_t()
  : details(new details_t()) {
}

library_t::~library_t() {
  delete details;
}

void library_t::reset() {
  details->materials.clear();
  details->names.clear();
  details->materials_by_name.clear();
}

uint32_t library_t::add(const std::string& name, material_t::shared_t material) {
  if (!material) {
    throw std::runtime_error("Can't add empty material: " + name);
  }

  const uint32_t id = details->materials.size();

  if (has(name)) {
    std::cerr << "Overwriting existing material: " << name << std::endl;
  }

  details->materials.push_back(material);
  details->names.push_back(name);
  details->materials_by_name[name] = id;

  return id;
}

uint32_t library_t::num_materials() const {
  return details->materials.size();
}

bool library_t::has(const std::string& name) const {
  return details->materials_by_name.find(name) != details->materials_by_name.end();
}

material_t::shared_t library_t::material(uint32_t index) const {
  if (index >= details->materials.size()) {
    throw std::runtime_error("Material id out of range: " + std::to_string(index));
  }
  return details->materials[index];
}

material_t::shared_t library_t::material(const std::string& name) const {
  const auto guard = details->materials_by_name.find(name);
  if (guard != details->materials_by_name.end()) {
    return details->materials[guard->second];
  }
  throw std::runtime_error("No such material: " + name);
}

const std::string& library_t::name(uint32_t index) const {
  if (index >= details->names.size()) {
    throw std::runtime_error("Material id out of range: " + std::to_string(index));
  }
  return details->names[index];
}
