#pragma once

#include <ImathVec.h>

#include <cstdint>
#include <string>

/* Parsed command line options */
struct parsed_options_t {
  static const uint32_t DEFAULT_SWEEP_STEPS = 0;
  static const long MAX_SWEEP_STEPS = 1000000;

  // material library to load
  std::string materials;
  // only probe this material. probe all materials if empty
  std::string material;

  // shading frame the materials get evaluated in
  Imath::V3f n;
  Imath::V3f i;
  Imath::V3f l;

  // number of steps when sweeping view and light towards grazing angles.
  // if set to 0, only the given directions are evaluated
  uint32_t sweep_steps;
  // print parameters of the probed materials
  bool verbose;

  inline parsed_options_t()
    : n(0.0f, 0.0f, 1.0f)
    , i(0.0f, 0.0f, 1.0f)
    , l(0.0f, 0.0f, 1.0f)
    , sweep_steps(DEFAULT_SWEEP_STEPS)
    , verbose(false)
  {}
};

/* parses 'x,y,z' into a normalized direction. fails for malformed
 * input and for zero or non finite vectors */
bool parse_direction(const char* arg, Imath::V3f& v);

/* parses a sweep step count in [0, MAX_SWEEP_STEPS] */
bool parse_steps(const char* arg, uint32_t& steps);

/* fills 'parsed' from the command line. returns false, after reporting
 * the problem on stderr, if the arguments can't be used */
bool parse_args(int argc, char** argv, parsed_options_t& parsed);
