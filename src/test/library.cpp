#include "library.hpp"

#include <gtest/gtest.h>

namespace {
  material_t::shared_t lambert(float kd) {
    auto builder = material_t::builder("lambert");
    builder->parameter("kd", kd);
    return builder->build();
  }
}

TEST(library, hands_out_consecutive_ids) {
  library_t library;

  EXPECT_EQ(library.add("red", lambert(0.1f)), 0u);
  EXPECT_EQ(library.add("green", lambert(0.2f)), 1u);
  EXPECT_EQ(library.add("blue", lambert(0.3f)), 2u);

  EXPECT_EQ(library.num_materials(), 3u);
  EXPECT_EQ(library.name(1), "green");
  EXPECT_EQ(library.material("green"), library.material(1));
  EXPECT_TRUE(library.has("blue"));
  EXPECT_FALSE(library.has("black"));
}

TEST(library, materials_are_shared) {
  library_t library;
  const auto material = lambert(0.5f);

  library.add("grey", material);

  // one reference held here, one by the library
  EXPECT_EQ(material.use_count(), 2);

  const auto a = library.material("grey");
  const auto b = library.material(0);
  EXPECT_EQ(a.get(), material.get());
  EXPECT_EQ(b.get(), material.get());

  library.reset();
  EXPECT_EQ(library.num_materials(), 0u);
  EXPECT_EQ(material.use_count(), 3);
}

TEST(library, redefinition_replaces_the_name_binding) {
  library_t library;
  const auto first = lambert(0.1f);
  const auto second = lambert(0.2f);

  library.add("grey", first);
  EXPECT_EQ(library.add("grey", second), 1u);

  EXPECT_EQ(library.material("grey"), second);
  EXPECT_EQ(library.material(0), first);
}

TEST(library, missing_materials) {
  library_t library;
  library.add("grey", lambert(0.5f));

  EXPECT_THROW(library.material("black"), std::runtime_error);
  EXPECT_THROW(library.material(1), std::runtime_error);
  EXPECT_THROW(library.name(1), std::runtime_error);
  EXPECT_THROW(library.add("empty", nullptr), std::runtime_error);
}
