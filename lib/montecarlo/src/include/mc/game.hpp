#ifndef MC_GAME_HPP
#define MC_GAME_HPP

#include "mc/die.hpp"
#include "mc/tables.hpp"

#include <memory>
#include <string_view>
#include <variant>
#include <vector>

namespace mc {

enum class Form
{
   WIDE,
   NARROW
};

// Accepts "wide" or "narrow", throws ValueError otherwise
Form ParseForm(std::string_view form);

/**
 * Rolls an ordered collection of dice together. The dice are shared, not owned: the same Die
 * may appear several times or in other games, and weight changes made through any handle are
 * seen by the next Play().
 */
class Game
{
public:
   // Throws ValueError if any die is null
   explicit Game(std::vector<std::shared_ptr<Die>> dice);

   // Rolls every die numRolls times and replaces the previous results. If a roll throws, the
   // previous results are kept.
   void Play(size_t numRolls);

   std::variant<WideTable, NarrowTable> Show(std::string_view form = "wide") const;
   std::variant<WideTable, NarrowTable> Show(Form form) const;
   WideTable ShowWide() const { return m_results; }
   NarrowTable ShowNarrow() const { return ToNarrow(m_results); }

   const WideTable & Results() const noexcept { return m_results; }
   const std::vector<std::shared_ptr<Die>> & Dice() const noexcept { return m_dice; }

private:
   std::vector<std::shared_ptr<Die>> m_dice;
   WideTable m_results;
};

} // namespace mc

#endif // MC_GAME_HPP
