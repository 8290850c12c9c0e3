#pragma once

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-register"
#include <ImathColor.h>
#include <ImathVec.h>
#pragma clang diagnostic pop

#include <memory>
#include <string>

/* Surface shading model, as seen by the integrator. materials are immutable
 * once built, and are shared between all primitives that reference them,
 * so they can be evaluated from any number of threads concurrently */
struct material_t {
  typedef std::shared_ptr<const material_t> shared_t;

  /* collects resolved parameters from a scene description, and
   * creates a validated material from them */
  struct builder_t {
    typedef std::unique_ptr<builder_t> scoped_t;

    virtual ~builder_t()
    {}

    virtual void parameter(
      const std::string& name
    , float f) = 0;

    virtual void parameter(
      const std::string& name
    , const Imath::Color3f& c) = 0;

    /* throws if the collected parameters don't describe a valid material */
    virtual shared_t build() const = 0;
  };

  virtual ~material_t()
  {}

  /* creates a builder for the material model with the name 'type'.
   * throws for unknown models */
  static builder_t::scoped_t builder(const std::string& type);

  /**
   * Evaluates the direct lighting response for a single light sample.
   * 'n' is the surface normal, 'i' the direction towards the viewer
   * and 'l' the direction towards the light, all normalized. The result
   * is the factor the light color gets scaled with, and is always finite
   */
  virtual Imath::Color3f evaluate(
    const Imath::V3f& n
  , const Imath::V3f& i
  , const Imath::V3f& l) const = 0;

  /* true if the integrator should trace a mirror reflection ray */
  virtual bool is_reflective() const = 0;

  /* true if the integrator should trace a refraction ray */
  virtual bool is_refractive() const = 0;

  /* scales the color returned by a traced reflection ray */
  virtual Imath::Color3f scale_reflection(const Imath::Color3f& c) const = 0;

  /* scales the color returned by a traced refraction ray */
  virtual Imath::Color3f scale_transmission(const Imath::Color3f& c) const = 0;

  virtual Imath::Color3f transmission_tint() const = 0;

  virtual float ior() const = 0;
};
