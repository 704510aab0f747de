#include "mc/game.hpp"
#include "mc/errors.hpp"
#include "mc/log.hpp"

#include <algorithm>
#include <string>

namespace {

constexpr auto TAG = "Game";

std::string ColumnName(size_t dieIndex)
{
   return "die_" + std::to_string(dieIndex);
}

} // namespace

namespace mc {

Form ParseForm(std::string_view form)
{
   if (form == "wide")
      return Form::WIDE;
   if (form == "narrow")
      return Form::NARROW;
   throw ValueError("Show(): Form must be 'wide' or 'narrow', got '" + std::string(form) + "'");
}

Game::Game(std::vector<std::shared_ptr<Die>> dice)
   : m_dice(std::move(dice))
{
   if (std::any_of(m_dice.cbegin(), m_dice.cend(), [](const auto & die) { return !die; }))
      throw ValueError("Game(): Dice must not be null");
}

void Game::Play(size_t numRolls)
{
   WideTable results;
   results.columns.reserve(m_dice.size());
   for (size_t i = 0; i < m_dice.size(); ++i)
      results.columns.push_back(ColumnName(i));

   results.rows.assign(numRolls, std::vector<Face>(m_dice.size()));
   for (size_t die = 0; die < m_dice.size(); ++die) {
      for (size_t roll = 0; roll < numRolls; ++roll)
         results.rows[roll][die] = m_dice[die]->RollOne();
   }

   m_results = std::move(results);
   Log::Debug(TAG, "Played {} rolls with {} dice", numRolls, m_dice.size());
}

std::variant<WideTable, NarrowTable> Game::Show(std::string_view form) const
{
   return Show(ParseForm(form));
}

std::variant<WideTable, NarrowTable> Game::Show(Form form) const
{
   switch (form) {
   case Form::WIDE:
      return ShowWide();
   case Form::NARROW:
      return ShowNarrow();
   }
   throw ValueError("Show(): Unknown form");
}

} // namespace mc
