#include "options.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <getopt.h>

/* available arguments to the probe */
static option options[] = {
  { "material", required_argument, NULL, 'm' },
  { "normal",   required_argument, NULL, 'n' },
  { "view",     required_argument, NULL, 'i' },
  { "light",    required_argument, NULL, 'l' },
  { "sweep",    required_argument, NULL, 's' },
  { "verbose",  no_argument,       NULL, 'v' },
  { NULL,       0,                 NULL, 0 }
};

bool parse_direction(const char* arg, Imath::V3f& v) {
  float x, y, z;
  int consumed = 0;
  if (std::sscanf(arg, "%f,%f,%f%n", &x, &y, &z, &consumed) != 3 || arg[consumed] != '\0') {
    std::cerr << "Expected a direction as x,y,z: " << arg << std::endl;
    return false;
  }

  const Imath::V3f d(x, y, z);

  if (!(d.length() > 0.0f) || !std::isfinite(d.length())) {
    std::cerr << "Direction needs a finite, non zero length: " << arg << std::endl;
    return false;
  }

  v = d.normalized();
  return true;
}

bool parse_steps(const char* arg, uint32_t& steps) {
  char* end = nullptr;
  errno = 0;
  const auto value = std::strtol(arg, &end, 10);

  if (end == arg || *end != '\0' || errno == ERANGE
      || value < 0 || value > parsed_options_t::MAX_SWEEP_STEPS) {
    std::cerr
      << "Expected a number of steps between 0 and "
      << parsed_options_t::MAX_SWEEP_STEPS << ": " << arg << std::endl;
    return false;
  }

  steps = value;
  return true;
}

bool parse_args(int argc, char** argv, parsed_options_t& parsed) {
  int ch;

  // restart the scan, so arguments can be parsed more than once
  optind = 0;

  while ((ch = getopt_long(argc, argv, "m:n:i:l:s:v", options, nullptr)) != -1) {
    switch (ch) {
    case 'm':
      parsed.material = optarg;
      break;
    case 'n':
      if (!parse_direction(optarg, parsed.n)) return false;
      break;
    case 'i':
      if (!parse_direction(optarg, parsed.i)) return false;
      break;
    case 'l':
      if (!parse_direction(optarg, parsed.l)) return false;
      break;
    case 's':
      if (!parse_steps(optarg, parsed.sweep_steps)) return false;
      std::cout << "Sweep steps: " << parsed.sweep_steps << std::endl;
      break;
    case 'v':
      parsed.verbose = true;
      break;
    case '?':
    default:
      return false;
    }
  }

  const auto remaining = argc - optind;

  if (remaining < 1) {
    std::cerr << "Need a material library" << std::endl;
    return false;
  }

  if (remaining != 1) {
    std::cerr << "Unrecognized extra arguments: " << remaining - 1 << std::endl;
    return false;
  }

  // the remaining argument is the material library to probe
  parsed.materials = argv[optind];

  return true;
}
