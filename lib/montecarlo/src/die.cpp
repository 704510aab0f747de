#include "mc/die.hpp"
#include "mc/errors.hpp"
#include "mc/log.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr auto TAG = "Die";

uint32_t RandomSeed()
{
   std::random_device rd;
   return rd();
}

} // namespace

namespace mc {

Die::Die(std::vector<Face> faces)
   : Die(std::move(faces), RandomSeed())
{}

Die::Die(std::vector<Face> faces, uint32_t seed)
   : m_faces(std::move(faces))
   , m_weights(m_faces.size(), 1.0)
   , m_generator(seed)
{
   const bool homogeneous = std::all_of(m_faces.cbegin(), m_faces.cend(), [&](const Face & f) {
      return f.index() == m_faces.front().index();
   });
   if (!homogeneous)
      throw TypeError("Die(): Faces must all be of the same type");
   if (std::any_of(m_faces.cbegin(), m_faces.cend(), [](const Face & f) { return IsNaN(f); }))
      throw ValueError("Die(): Faces must not be NaN");

   for (size_t i = 0; i < m_faces.size(); ++i) {
      const bool inserted = m_index.emplace(m_faces[i], i).second;
      if (!inserted)
         throw ValueError("Die(): Faces must be distinct, '" + ToString(m_faces[i]) +
                          "' occurs more than once");
   }
}

void Die::SetWeight(const Face & face, const Value & weight)
{
   const size_t i = IndexOf(face);
   if (!IsNumeric(weight))
      throw TypeError("SetWeight(): Weight must be numeric, got '" + ToString(weight) + "'");

   m_weights[i] = ToDouble(weight);
   if (m_weights[i] <= 0.0)
      Log::Warning(TAG, "Face {} now has non-positive weight {}", face, m_weights[i]);
}

std::vector<Face> Die::Roll(size_t count)
{
   const auto cumulative = CumulativeWeights();
   std::vector<Face> result;
   result.reserve(count);
   for (size_t i = 0; i < count; ++i)
      result.push_back(Draw(cumulative));
   return result;
}

Face Die::RollOne()
{
   return Draw(CumulativeWeights());
}

WeightTable Die::Show() const
{
   WeightTable snapshot;
   snapshot.reserve(m_faces.size());
   for (size_t i = 0; i < m_faces.size(); ++i)
      snapshot.push_back(FaceWeight{m_faces[i], m_weights[i]});
   return snapshot;
}

double Die::Weight(const Face & face) const
{
   return m_weights[IndexOf(face)];
}

size_t Die::IndexOf(const Face & face) const
{
   auto it = IsNaN(face) ? m_index.cend() : m_index.find(face);
   if (it == m_index.cend())
      throw LookupError("Die: Face '" + ToString(face) + "' not found");
   return it->second;
}

std::vector<double> Die::CumulativeWeights() const
{
   std::vector<double> cumulative;
   cumulative.reserve(m_weights.size());
   double total = 0.0;
   for (double w : m_weights) {
      if (std::isnan(w) || w < 0.0)
         throw ValueError("Roll(): Weights must be non-negative numbers");
      total += w;
      cumulative.push_back(total);
   }
   if (!(total > 0.0) || !std::isfinite(total))
      throw ValueError("Roll(): Weights must sum to a positive finite value");
   return cumulative;
}

Face Die::Draw(const std::vector<double> & cumulative)
{
   std::uniform_real_distribution<double> dist(0.0, cumulative.back());
   const double x = dist(m_generator);
   auto it = std::upper_bound(cumulative.cbegin(), cumulative.cend(), x);
   if (it == cumulative.cend()) // x rounded up to the total: take the last non-zero face
      it = std::lower_bound(cumulative.cbegin(), cumulative.cend(), cumulative.back());
   return m_faces[static_cast<size_t>(it - cumulative.cbegin())];
}

} // namespace mc
