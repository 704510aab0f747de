#include "mc/analyzer.hpp"
#include "mc/errors.hpp"
#include "mc/log.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <set>

namespace {

constexpr auto TAG = "Analyzer";

template <typename Key>
mc::CountTable CountOutcomes(const mc::WideTable & results, Key && makeKey)
{
   mc::CountTable table;
   std::map<std::vector<mc::Face>, size_t> positions;
   for (const auto & row : results.rows) {
      auto key = makeKey(row);
      auto [it, inserted] = positions.emplace(key, table.entries.size());
      if (inserted)
         table.entries.push_back(mc::OutcomeCount{std::move(key), 0});
      ++table.entries[it->second].count;
   }
   std::stable_sort(table.entries.begin(),
                    table.entries.end(),
                    [](const mc::OutcomeCount & lhs, const mc::OutcomeCount & rhs) {
                       return lhs.count > rhs.count;
                    });
   return table;
}

} // namespace

namespace mc {

Analyzer::Analyzer(std::shared_ptr<const Game> game)
   : m_game(std::move(game))
{
   if (!m_game)
      throw ValueError("Analyzer(): A Game instance is required");
}

size_t Analyzer::Jackpot() const
{
   const WideTable * results = TabulatableResults(__func__);
   if (!results)
      return 0;

   return static_cast<size_t>(
      std::count_if(results->rows.cbegin(), results->rows.cend(), [](const std::vector<Face> & row) {
         return std::adjacent_find(row.cbegin(), row.cend(), std::not_equal_to<>{}) == row.cend();
      }));
}

FaceCountTable Analyzer::FaceCountsPerRoll() const
{
   const WideTable * results = TabulatableResults(__func__);
   if (!results)
      return {};

   std::set<Face> distinct;
   for (const auto & row : results->rows)
      distinct.insert(row.cbegin(), row.cend());

   FaceCountTable table;
   table.faces.assign(distinct.cbegin(), distinct.cend());
   table.counts.reserve(results->RowCount());
   for (const auto & row : results->rows) {
      std::vector<size_t> counts(table.faces.size(), 0);
      for (const auto & face : row) {
         auto it = std::lower_bound(table.faces.cbegin(), table.faces.cend(), face);
         ++counts[static_cast<size_t>(it - table.faces.cbegin())];
      }
      table.counts.push_back(std::move(counts));
   }
   return table;
}

CountTable Analyzer::ComboCount() const
{
   const WideTable * results = TabulatableResults(__func__);
   if (!results)
      return {};

   return CountOutcomes(*results, [](std::vector<Face> row) {
      std::sort(row.begin(), row.end());
      return row;
   });
}

CountTable Analyzer::PermutationCount() const
{
   const WideTable * results = TabulatableResults(__func__);
   if (!results)
      return {};

   return CountOutcomes(*results, [](const std::vector<Face> & row) { return row; });
}

const WideTable * Analyzer::TabulatableResults(const char * operation) const
{
   const WideTable & results = m_game->Results();
   if (results.Empty()) {
      Log::Info(TAG, "{}(): Results table is empty", operation);
      return nullptr;
   }
   if (!results.IsRegular()) {
      Log::Warning(TAG, "{}(): Results table is not rectangular", operation);
      return nullptr;
   }
   return &results;
}

} // namespace mc
