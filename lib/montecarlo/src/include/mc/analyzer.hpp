#ifndef MC_ANALYZER_HPP
#define MC_ANALYZER_HPP

#include "mc/game.hpp"
#include "mc/tables.hpp"

#include <memory>

namespace mc {

/**
 * Read-only statistics over a game's results. Every call reads the game's current results, so
 * the figures follow the latest Play().
 *
 * A game that has not been played, or whose results are not rectangular, yields 0 from Jackpot()
 * and empty tables from the other methods. This is checked explicitly before tabulating.
 */
class Analyzer
{
public:
   // Throws ValueError if game is null
   explicit Analyzer(std::shared_ptr<const Game> game);

   // Number of rolls on which all dice show the same face. Faces compare by type and value, so an
   // integer die showing 1 and a real die showing 1.0 do not match.
   size_t Jackpot() const;

   FaceCountTable FaceCountsPerRoll() const;

   // Order-independent: each roll's outcomes are sorted before grouping
   CountTable ComboCount() const;

   // Order-sensitive: outcomes are grouped as observed per die position
   CountTable PermutationCount() const;

private:
   const WideTable * TabulatableResults(const char * operation) const;

   std::shared_ptr<const Game> m_game;
};

} // namespace mc

#endif // MC_ANALYZER_HPP
