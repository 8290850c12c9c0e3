#include "codecs/materials.hpp"
#include "library.hpp"
#include "materials/cook_torrance.hpp"
#include "materials/mirror.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <memory>

TEST(codec, parses_material_libraries) {
  library_t library;

  codec::materials::parse(
    "materials:\n"
    "  plastic:\n"
    "    parameters:\n"
    "      ka: 0.1\n"
    "      kd: 0.6\n"
    "      ks: 0.3\n"
    "      diffuse: [1.0, 0.5, 0.25]\n"
    "      roughness: 0.2\n"
    "      ior: 1.5\n"
    "  glass:\n"
    "    type: mirror\n"
    "    parameters:\n"
    "      ksg: 0.1\n"
    "      ktg: 0.9\n"
    "      transmission: [0.9, 1.0, 0.9]\n"
    "      ior: 1.5\n"
  , library);

  ASSERT_EQ(library.num_materials(), 2u);

  const auto plastic = std::dynamic_pointer_cast<const cook_torrance_material_t>(library.material("plastic"));
  ASSERT_TRUE(plastic);
  EXPECT_FLOAT_EQ(plastic->parameters().kd, 0.6f);
  EXPECT_FLOAT_EQ(plastic->parameters().diffuse.y, 0.5f);
  EXPECT_FLOAT_EQ(plastic->ior(), 1.5f);

  const auto glass = std::dynamic_pointer_cast<const mirror_material_t>(library.material("glass"));
  ASSERT_TRUE(glass);
  EXPECT_TRUE(glass->is_refractive());
  EXPECT_FLOAT_EQ(glass->transmission_tint().x, 0.9f);
}

TEST(codec, materials_without_parameters_use_defaults) {
  library_t library;
  codec::materials::parse("materials:\n  default: {}\n", library);

  ASSERT_EQ(library.num_materials(), 1u);
  EXPECT_FALSE(library.material(0)->is_reflective());
}

TEST(codec, rejects_malformed_libraries) {
  library_t library;

  EXPECT_THROW(codec::materials::parse("lights: {}\n", library), std::runtime_error);
  EXPECT_THROW(codec::materials::parse("materials: [1, 2]\n", library), std::runtime_error);
  EXPECT_THROW(codec::materials::parse(
    "materials:\n  a:\n    type: phong\n", library), std::runtime_error);
  EXPECT_THROW(codec::materials::parse(
    "materials:\n  a:\n    parameters:\n      shininess: 10\n", library), std::runtime_error);
  EXPECT_THROW(codec::materials::parse(
    "materials:\n  a:\n    parameters:\n      diffuse: [1.0, 0.5]\n", library), std::runtime_error);
  EXPECT_THROW(codec::materials::parse(
    "materials:\n  a:\n    parameters:\n      kd: high\n", library), std::runtime_error);
  EXPECT_THROW(codec::materials::parse(
    "materials:\n  a:\n    parameters:\n      ior: {value: 1.5}\n", library), std::runtime_error);
  EXPECT_THROW(codec::materials::parse(
    "materials:\n  a:\n    parameters:\n      roughness: 0\n", library), std::runtime_error);

  EXPECT_EQ(library.num_materials(), 0u);
}

TEST(codec, missing_files) {
  library_t library;
  EXPECT_THROW(codec::materials::import("/nonexistent/materials.yaml", library), YAML::BadFile);
}

TEST(codec, reports_progress_per_material) {
  library_t library;

  testing::internal::CaptureStdout();
  codec::materials::parse(
    "materials:\n"
    "  red: {type: lambert}\n"
    "  blue: {type: lambert}\n"
  , library);
  const auto output = testing::internal::GetCapturedStdout();

  EXPECT_NE(output.find("Material: red (0)"), std::string::npos) << output;
  EXPECT_NE(output.find("Material: blue (1)"), std::string::npos) << output;
}
