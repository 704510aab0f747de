#ifndef MC_TABLES_HPP
#define MC_TABLES_HPP

#include "mc/value.hpp"

#include <string>
#include <vector>

namespace mc {

// One row per roll, one column per die. rows[roll][die] is the face drawn.
struct WideTable
{
   std::vector<std::string> columns;
   std::vector<std::vector<Face>> rows;

   size_t RowCount() const noexcept { return rows.size(); }
   size_t ColumnCount() const noexcept { return columns.size(); }
   bool Empty() const noexcept { return rows.empty() || columns.empty(); }
   bool IsRegular() const noexcept;
   const Face & At(size_t roll, size_t die) const { return rows.at(roll).at(die); }
};

struct NarrowRow
{
   size_t roll;
   std::string die;
   Face outcome;
};

// One row per (roll, die) pair, ordered by roll and then by die
struct NarrowTable
{
   std::vector<NarrowRow> rows;

   size_t RowCount() const noexcept { return rows.size(); }
   bool Empty() const noexcept { return rows.empty(); }
};

// counts[roll][i] is how many dice showed faces[i] on that roll
struct FaceCountTable
{
   std::vector<Face> faces;
   std::vector<std::vector<size_t>> counts;

   size_t RowCount() const noexcept { return counts.size(); }
   bool Empty() const noexcept { return counts.empty(); }
   size_t Count(size_t roll, const Face & face) const;
};

struct OutcomeCount
{
   std::vector<Face> outcome;
   size_t count;
};

// Distinct outcomes, most frequent first
struct CountTable
{
   std::vector<OutcomeCount> entries;

   size_t Size() const noexcept { return entries.size(); }
   bool Empty() const noexcept { return entries.empty(); }
   size_t Total() const noexcept;
   size_t CountOf(const std::vector<Face> & outcome) const noexcept;
};

NarrowTable ToNarrow(const WideTable & wide);

} // namespace mc

#endif // MC_TABLES_HPP
