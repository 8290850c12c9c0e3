#include "params.hpp"

#include <sstream>
#include <stdexcept>

namespace bsdf {
  namespace params {
    void coefficient(const std::string& name, float v) {
      if (!std::isfinite(v) || v < 0.0f) {
        std::stringstream ss;
        ss << "Invalid coefficient '" << name << "': " << v << ", expected a value >= 0";
        throw std::runtime_error(ss.str());
      }
    }

    void positive(const std::string& name, float v) {
      if (!std::isfinite(v) || v <= 0.0f) {
        std::stringstream ss;
        ss << "Invalid parameter '" << name << "': " << v << ", expected a value > 0";
        throw std::runtime_error(ss.str());
      }
    }

    void color(const std::string& name, const Imath::Color3f& c) {
      for (auto i=0; i<3; ++i) {
        if (!(c[i] >= 0.0f && c[i] <= 1.0f)) {
          std::stringstream ss;
          ss << "Invalid color '" << name << "': " << c << ", channels need to be in [0,1]";
          throw std::runtime_error(ss.str());
        }
      }
    }

    void lambert_t::validate() const {
      coefficient("ka", ka);
      coefficient("kd", kd);
      color("ambient", ambient);
      color("diffuse", diffuse);
    }

    void mirror_t::validate() const {
      coefficient("ksg", ksg);
      coefficient("ktg", ktg);
      color("transmission", transmission);
      positive("ior", ior);
    }

    void cook_torrance_t::validate() const {
      coefficient("ka", ka);
      coefficient("kd", kd);
      coefficient("ks", ks);
      coefficient("ksg", ksg);
      coefficient("ktg", ktg);
      color("ambient", ambient);
      color("diffuse", diffuse);
      color("specular", specular);
      color("transmission", transmission);
      positive("roughness", roughness);
      positive("gauss_constant", gauss_constant);
      positive("ior", ior);
    }
  }
}
