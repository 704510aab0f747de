#include <gtest/gtest.h>
#include "mc/die.hpp"
#include "mc/errors.hpp"
#include "fakelogger.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace {

std::vector<mc::Face> Letters()
{
   return {"A", "B", "C"};
}

TEST(DieTest, new_die_has_unit_weight_for_every_face)
{
   const std::vector<mc::Face> faces{1, 2, 3, 4, 5, 6};
   mc::Die die(faces);

   const auto snapshot = die.Show();
   ASSERT_EQ(faces.size(), snapshot.size());
   for (size_t i = 0; i < faces.size(); ++i) {
      EXPECT_EQ(faces[i], snapshot[i].face);
      EXPECT_DOUBLE_EQ(1.0, snapshot[i].weight);
   }
   EXPECT_EQ(faces, die.Faces());
   EXPECT_EQ(6U, die.Size());
}

TEST(DieTest, mixed_face_types_are_rejected)
{
   EXPECT_THROW(mc::Die({1, "two", 3}), mc::TypeError);
   EXPECT_THROW(mc::Die({1, 2.5}), mc::TypeError);
}

TEST(DieTest, duplicate_faces_are_rejected)
{
   EXPECT_THROW(mc::Die({"A", "A", "B"}), mc::ValueError);
   EXPECT_THROW(mc::Die({1, 2, 1}), mc::ValueError);
}

TEST(DieTest, nan_faces_are_rejected)
{
   const double nan = std::numeric_limits<double>::quiet_NaN();
   EXPECT_THROW(mc::Die({nan, 1.0}, 1U), mc::ValueError);
   EXPECT_THROW(mc::Die({1.0, 2.0, nan}, 1U), mc::ValueError);

   mc::Die reals({1.0, 2.0}, 1U);
   EXPECT_THROW(reals.Weight(nan), mc::LookupError);
   EXPECT_THROW(reals.SetWeight(nan, 3), mc::LookupError);
   EXPECT_DOUBLE_EQ(1.0, reals.Weight(1.0));
}

TEST(DieTest, errors_derive_from_standard_exceptions)
{
   try {
      mc::Die die({"A", "A"});
      ADD_FAILURE() << "no exception";
   }
   catch (const std::invalid_argument & e) {
      EXPECT_NE(nullptr, std::strstr(e.what(), "distinct"));
   }
}

TEST(DieTest, set_weight_on_absent_face_fails)
{
   mc::Die die(Letters());
   EXPECT_THROW(die.SetWeight("D", 2), mc::LookupError);
   EXPECT_THROW(die.SetWeight(1, 2), mc::LookupError);
   EXPECT_THROW(die.Weight("D"), mc::LookupError);
}

TEST(DieTest, set_weight_with_non_numeric_weight_fails)
{
   mc::Die die(Letters());
   EXPECT_THROW(die.SetWeight("A", "heavy"), mc::TypeError);
   EXPECT_DOUBLE_EQ(1.0, die.Weight("A"));
}

TEST(DieTest, set_weight_changes_only_that_face)
{
   mc::Die die(Letters());
   die.SetWeight("B", 5);
   die.SetWeight("C", 0.25);

   EXPECT_DOUBLE_EQ(1.0, die.Weight("A"));
   EXPECT_DOUBLE_EQ(5.0, die.Weight("B"));
   EXPECT_DOUBLE_EQ(0.25, die.Weight("C"));
}

TEST(DieTest, non_positive_weight_is_accepted_with_a_warning)
{
   FakeLogger logger;
   mc::Die die(Letters());
   EXPECT_NO_THROW(die.SetWeight("A", 0));
   EXPECT_NO_THROW(die.SetWeight("B", -1.5));
   EXPECT_DOUBLE_EQ(-1.5, die.Weight("B"));
   EXPECT_TRUE(logger.Contains(mc::Log::Level::WARNING, "Face A now has non-positive weight 0"));
}

TEST(DieTest, show_returns_a_detached_snapshot)
{
   mc::Die die(Letters());
   auto snapshot = die.Show();
   snapshot[0].weight = 100.0;
   snapshot[1].face = "Z";

   EXPECT_DOUBLE_EQ(1.0, die.Weight("A"));
   EXPECT_EQ(Letters(), die.Faces());
}

TEST(DieTest, roll_returns_requested_number_of_known_faces)
{
   const auto faces = Letters();
   mc::Die die(faces, 42U);
   for (size_t n : {0U, 1U, 10U, 1000U}) {
      const auto result = die.Roll(n);
      ASSERT_EQ(n, result.size());
      for (const auto & face : result)
         EXPECT_NE(faces.cend(), std::find(faces.cbegin(), faces.cend(), face));
   }
   EXPECT_EQ(1U, die.Roll().size());
}

TEST(DieTest, roll_is_reproducible_with_a_seed)
{
   mc::Die first({1, 2, 3, 4, 5, 6}, 7U);
   mc::Die second({1, 2, 3, 4, 5, 6}, 7U);
   EXPECT_EQ(first.Roll(50), second.Roll(50));
}

TEST(DieTest, heavy_face_dominates_the_rolls)
{
   mc::Die die({1, 2, 3, 4, 5, 6}, 2024U);
   die.SetWeight(6, 95);

   const size_t n = 20000;
   const auto result = die.Roll(n);
   const auto sixes = std::count(result.cbegin(), result.cend(), mc::Face(6));
   const double share = static_cast<double>(sixes) / n;
   EXPECT_NEAR(95.0 / 100.0, share, 0.01);
}

TEST(DieTest, weights_are_read_at_roll_time)
{
   mc::Die die({"H", "T"}, 3U);
   die.SetWeight("T", 0);
   for (const auto & face : die.Roll(200))
      EXPECT_EQ(mc::Face("H"), face);

   die.SetWeight("T", 1);
   die.SetWeight("H", 0);
   for (const auto & face : die.Roll(200))
      EXPECT_EQ(mc::Face("T"), face);
}

TEST(DieTest, unusable_weights_make_roll_fail)
{
   mc::Die negative({1, 2}, 1U);
   negative.SetWeight(1, -1);
   EXPECT_THROW(negative.Roll(5), mc::ValueError);

   mc::Die zero({1, 2}, 1U);
   zero.SetWeight(1, 0);
   zero.SetWeight(2, 0);
   EXPECT_THROW(zero.RollOne(), mc::ValueError);

   mc::Die empty(std::vector<mc::Face>{});
   EXPECT_THROW(empty.Roll(), mc::ValueError);
}

TEST(DieTest, faces_of_any_value_type)
{
   mc::Die reals({0.5, 1.5, 2.5}, 11U);
   EXPECT_DOUBLE_EQ(1.0, reals.Weight(1.5));
   EXPECT_THROW(reals.Weight(1), mc::LookupError);

   mc::Die words({std::string("heads"), std::string("tails")}, 11U);
   const auto face = words.RollOne();
   EXPECT_TRUE(face == mc::Face("heads") || face == mc::Face("tails"));
}

} // namespace
