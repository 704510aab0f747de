#ifndef MC_DIE_HPP
#define MC_DIE_HPP

#include "mc/value.hpp"

#include <cstdint>
#include <map>
#include <random>
#include <vector>

namespace mc {

struct FaceWeight
{
   Face face;
   double weight;
};

// Snapshot of a die's weights in face order
using WeightTable = std::vector<FaceWeight>;

/**
 * A die with a fixed set of distinct faces, each carrying a mutable weight (initially 1.0).
 * Rolling draws faces with probability proportional to the weights current at the time of the
 * call. Not thread-safe: concurrent SetWeight() and Roll() on a shared die must be serialized by
 * the caller.
 */
class Die
{
public:
   // Throws TypeError if faces do not all hold the same value type,
   // ValueError if any face occurs more than once.
   explicit Die(std::vector<Face> faces);
   Die(std::vector<Face> faces, uint32_t seed);

   // Zero and negative weights are accepted here. A die that ends up with a negative weight or a
   // non-positive total cannot be rolled.
   void SetWeight(const Face & face, const Value & weight);

   std::vector<Face> Roll(size_t count = 1);
   Face RollOne();

   WeightTable Show() const;

   double Weight(const Face & face) const;
   const std::vector<Face> & Faces() const noexcept { return m_faces; }
   size_t Size() const noexcept { return m_faces.size(); }

private:
   size_t IndexOf(const Face & face) const;
   std::vector<double> CumulativeWeights() const;
   Face Draw(const std::vector<double> & cumulative);

   std::vector<Face> m_faces;
   std::vector<double> m_weights;
   std::map<Face, size_t> m_index;
   std::mt19937 m_generator;
};

} // namespace mc

#endif // MC_DIE_HPP
