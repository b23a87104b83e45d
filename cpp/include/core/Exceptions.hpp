#pragma once

#include "util/Exception.hpp"

namespace core {

/*
 * Thrown by a game's Rules::apply() when the given move is not in Rules::get_legal_moves() for the
 * given state.
 */
class InvalidMoveError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

}  // namespace core
