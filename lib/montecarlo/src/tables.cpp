#include "mc/tables.hpp"

#include <algorithm>
#include <numeric>

namespace mc {

bool WideTable::IsRegular() const noexcept
{
   return std::all_of(rows.cbegin(), rows.cend(), [this](const std::vector<Face> & row) {
      return row.size() == columns.size();
   });
}

size_t FaceCountTable::Count(size_t roll, const Face & face) const
{
   auto it = std::lower_bound(faces.cbegin(), faces.cend(), face);
   if (it == faces.cend() || !(*it == face))
      return 0;
   return counts.at(roll).at(static_cast<size_t>(it - faces.cbegin()));
}

size_t CountTable::Total() const noexcept
{
   return std::accumulate(entries.cbegin(), entries.cend(), size_t{0}, [](size_t sum, const auto & e) {
      return sum + e.count;
   });
}

size_t CountTable::CountOf(const std::vector<Face> & outcome) const noexcept
{
   auto it = std::find_if(entries.cbegin(), entries.cend(), [&](const OutcomeCount & e) {
      return e.outcome == outcome;
   });
   return it == entries.cend() ? 0 : it->count;
}

NarrowTable ToNarrow(const WideTable & wide)
{
   NarrowTable narrow;
   narrow.rows.reserve(wide.RowCount() * wide.ColumnCount());
   for (size_t roll = 0; roll < wide.rows.size(); ++roll) {
      const auto & row = wide.rows[roll];
      const size_t width = std::min(row.size(), wide.columns.size());
      for (size_t die = 0; die < width; ++die)
         narrow.rows.push_back(NarrowRow{roll, wide.columns[die], row[die]});
   }
   return narrow;
}

} // namespace mc
