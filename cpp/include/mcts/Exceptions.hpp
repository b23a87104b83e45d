#pragma once

#include "util/Exception.hpp"

namespace mcts {

// API misuse, e.g. start() while a search is running.
class InvalidStateError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// best_move() with no statistics to decide from and no single-legal-move shortcut.
class NoIterationsError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// Invalid ManagerParams / SearchParams.
class ConfigurationError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

}  // namespace mcts
