#include "codecs/materials.hpp"
#include "library.hpp"
#include "material.hpp"
#include "options.hpp"
#include "utils/color.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

void usage() {
  std::cerr
    << "usage: glint <options> materials"
    << std::endl
    << "-m <name>    Only evaluate the material with this name" << std::endl
    << "-n <x,y,z>   Surface normal" << std::endl
    << "-i <x,y,z>   Direction towards the viewer" << std::endl
    << "-l <x,y,z>   Direction towards the light" << std::endl
    << "-s <steps>   Sweep view and light from the normal to grazing" << std::endl
    << "-v           Print material properties" << std::endl;
}

void print(
  const std::string& name
, const material_t& material
, const parsed_options_t& options)
{
  std::cout << name << std::endl;

  if (options.verbose) {
    std::cout
      << std::boolalpha
      << "\treflective: " << material.is_reflective() << std::endl
      << "\trefractive: " << material.is_refractive() << std::endl
      << "\tior: " << material.ior() << std::endl
      << "\ttransmission: " << material.transmission_tint() << std::endl
      << "\treflection weight: " << material.scale_reflection(Imath::Color3f(1.0f)) << std::endl
      << "\ttransmission weight: " << material.scale_transmission(Imath::Color3f(1.0f)) << std::endl;
  }

  if (options.sweep_steps == 0) {
    const auto c = material.evaluate(options.n, options.i, options.l);
    std::cout << "\t" << c << " (Y " << color::y(c) << ")" << std::endl;
    return;
  }

  // rotate view and light in opposite directions around an axis
  // perpendicular to the normal
  const auto& n = options.n;
  const auto t = (std::abs(n.x) < 0.9f ? Imath::V3f(1.0f, 0.0f, 0.0f) : Imath::V3f(0.0f, 1.0f, 0.0f)).cross(n).normalized();

  for (uint32_t s=0; s<=options.sweep_steps; ++s) {
    const auto theta = (float) (M_PI_2 * s / options.sweep_steps);

    const auto i = n * std::cos(theta) + t * std::sin(theta);
    const auto l = n * std::cos(theta) - t * std::sin(theta);

    const auto c = material.evaluate(n, i, l);
    std::cout
      << "\t" << theta * (180.0f / M_PI) << " deg: "
      << c << " (Y " << color::y(c) << ")" << std::endl;
  }
}

int main(int argc, char** argv) {
  parsed_options_t options;

  if (!parse_args(argc, argv, options)) {
    usage();
    return -1;
  }

  try {
    library_t library;
    codec::materials::import(options.materials, library);

    std::cout
      << "Shading frame n: " << options.n
      << " i: " << options.i
      << " l: " << options.l
      << std::endl;

    if (!options.material.empty()) {
      print(options.material, *library.material(options.material), options);
    }
    else {
      for (uint32_t i=0; i<library.num_materials(); ++i) {
        print(library.name(i), *library.material(i), options);
      }
    }
  }
  catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return -1;
  }

  std::cout << "Done" << std::endl;

  return 0;
}
