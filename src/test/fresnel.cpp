#include "math/fresnel.hpp"
#include "math/vector.hpp"

#include <gtest/gtest.h>

TEST(fresnel, f0_of_common_dielectrics) {
  EXPECT_NEAR(fresnel::f0(1.0f, 1.5f), 0.04f, 1e-6f);
  EXPECT_NEAR(fresnel::f0(1.0f, 1.33f), 0.0200593f, 1e-6f);
  EXPECT_FLOAT_EQ(fresnel::f0(1.0f, 1.0f), 0.0f);
}

TEST(fresnel, schlick_reduces_to_f0_at_normal_incidence) {
  const auto f0 = fresnel::f0(1.0f, 1.5f);
  EXPECT_FLOAT_EQ(fresnel::schlick(f0, 1.0f), f0);
}

TEST(fresnel, schlick_reaches_one_at_grazing) {
  EXPECT_FLOAT_EQ(fresnel::schlick(0.04f, 0.0f), 1.0f);
}

TEST(fresnel, schlick_weight_is_clamped) {
  // cosines slightly above 1 come from rounding errors
  EXPECT_EQ(fresnel::schlick_weight(1.0f + 1e-6f), 0.0f);
  EXPECT_EQ(fresnel::schlick_weight(-0.5f), 1.0f);
  EXPECT_NEAR(fresnel::schlick_weight(0.5f), 0.03125f, 1e-7f);
}

TEST(vector, half_vector_of_opposite_directions) {
  Imath::V3f h(1.0f);
  EXPECT_FALSE(half_vector(Imath::V3f(0.0f, 0.0f, 1.0f), Imath::V3f(0.0f, 0.0f, -1.0f), 1e-4f, h));
  EXPECT_EQ(h, Imath::V3f(0.0f));
}

TEST(vector, half_vector_is_normalized) {
  Imath::V3f h;
  ASSERT_TRUE(half_vector(Imath::V3f(1.0f, 0.0f, 0.0f), Imath::V3f(0.0f, 0.0f, 1.0f), 1e-4f, h));
  EXPECT_NEAR(h.length(), 1.0f, 1e-6f);
  EXPECT_NEAR(h.x, h.z, 1e-6f);
  EXPECT_FLOAT_EQ(h.y, 0.0f);
}
