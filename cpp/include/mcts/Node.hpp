#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/Game.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace mcts {

/*
 * A Node represents one game state reached from the search root.
 *
 * Ownership flows strictly from root to leaf via children_. The parent_ back-pointer is
 * non-owning and is only used to walk the path back up to the root during backpropagation.
 *
 * The legal moves of the state are computed once, at construction. The first children_.size() of
 * them have been expanded (children_[i] was reached via legal_moves_[i]); the remainder are the
 * untried moves. Expansion always takes the first untried move.
 *
 * Statistics are kept from the perspective of value_seat(): the seat that made the move leading
 * into this node. Selecting among children thus maximizes the values stored in those children,
 * which is what gives two-player search its minimax behavior.
 */
template <core::concepts::Game Game>
class Node {
 public:
  using State = Game::State;
  using Move = Game::Move;
  using Rules = Game::Rules;
  using MoveList = std::vector<Move>;
  using Node_uptr = std::unique_ptr<Node>;
  using child_vec_t = std::vector<Node_uptr>;

  static constexpr int kNumPlayers = Game::Constants::kNumPlayers;
  using ValueArray = std::array<core::value_t, kNumPlayers>;

  /*
   * Creates a search root. A root has no incoming move, so its statistics are credited to the seat
   * that precedes the player to move in turn order.
   */
  static Node_uptr make_root(const State& state);

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  const State& state() const { return state_; }
  Node* parent() const { return parent_; }
  bool is_root() const { return parent_ == nullptr; }

  // Must not be called on a root.
  const Move& incoming_move() const;

  const child_vec_t& children() const { return children_; }
  const MoveList& legal_moves() const { return legal_moves_; }
  std::span<const Move> untried_moves() const;

  core::seat_index_t active_seat() const { return active_seat_; }
  core::seat_index_t value_seat() const { return value_seat_; }

  int64_t visit_count() const { return visit_count_; }
  double total_value() const { return total_value_; }
  double mean_value() const { return visit_count_ ? total_value_ / visit_count_ : 0; }

  // Number of simulations that started at this node (its own rollouts, or exact terminal hits).
  int64_t leaf_visit_count() const { return leaf_visit_count_; }

  // True if the game is over at this node, or no move is available (stalemate).
  bool is_terminal() const { return terminal_; }
  bool is_fully_expanded() const { return children_.size() == legal_moves_.size(); }

  Node* find_child(const Move& move) const;
  int subtree_size() const;

  /*
   * Materializes the child reached by the first untried move, and returns it. Must only be called
   * when !is_fully_expanded(). May throw core::InvalidMoveError if the game rejects a move it
   * reported as legal.
   */
  Node* expand();

  // Adds one simulation result to this node's statistics.
  void record_visit(const ValueArray& values, bool leaf);

  /*
   * Removes the child reached via move from this node and returns it as a new root. Returns
   * nullptr if that child was never expanded.
   *
   * This node is left inconsistent (its children no longer line up with its legal moves), so the
   * caller must discard it.
   */
  Node_uptr detach_child(const Move& move);

 private:
  Node(const State& state, core::seat_index_t value_seat, Node* parent,
       std::optional<Move> incoming_move);

  const State state_;
  Node* parent_;
  std::optional<Move> incoming_move_;
  child_vec_t children_;
  MoveList legal_moves_;

  // Long time-budgeted searches outgrow int counts and float sums.
  int64_t visit_count_ = 0;
  int64_t leaf_visit_count_ = 0;
  double total_value_ = 0;

  const core::seat_index_t active_seat_;
  const core::seat_index_t value_seat_;
  bool terminal_;
};

}  // namespace mcts

#include "inline/mcts/Node.inl"
