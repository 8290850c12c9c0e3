#pragma once

#include "material.hpp"

#include <cstdint>
#include <string>

/* Named collection of shared materials. importers register materials here
 * once, and attach them to primitives by id or by pointer */
struct library_t {
  struct details_t;

  details_t* details;

  library_t();
  ~library_t();

  library_t(const library_t&) = delete;
  library_t& operator=(const library_t&) = delete;

  void reset();

  /* adds a material under 'name' and returns its id. ids are handed out
   * consecutively, starting at 0 */
  uint32_t add(const std::string& name, material_t::shared_t material);

  uint32_t num_materials() const;

  bool has(const std::string& name) const;

  /* throws if there is no material with this id */
  material_t::shared_t material(uint32_t index) const;

  /* throws if there is no material with this name */
  material_t::shared_t material(const std::string& name) const;

  /* name the material with id 'index' was added with */
  const std::string& name(uint32_t index) const;
};
