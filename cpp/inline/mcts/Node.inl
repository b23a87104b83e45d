#include "mcts/Node.hpp"

#include "util/Asserts.hpp"

#include <algorithm>

namespace mcts {

template <core::concepts::Game Game>
typename Node<Game>::Node_uptr Node<Game>::make_root(const State& state) {
  core::seat_index_t active_seat = Rules::get_current_player(state);
  core::seat_index_t value_seat = (active_seat + kNumPlayers - 1) % kNumPlayers;
  return Node_uptr(new Node(state, value_seat, nullptr, std::nullopt));
}

template <core::concepts::Game Game>
Node<Game>::Node(const State& state, core::seat_index_t value_seat, Node* parent,
                 std::optional<Move> incoming_move)
    : state_(state),
      parent_(parent),
      incoming_move_(std::move(incoming_move)),
      active_seat_(Rules::get_current_player(state)),
      value_seat_(value_seat) {
  if (!Rules::is_terminal(state_)) {
    legal_moves_ = Rules::get_legal_moves(state_);
  }
  terminal_ = legal_moves_.empty();
  children_.reserve(legal_moves_.size());
}

template <core::concepts::Game Game>
const typename Node<Game>::Move& Node<Game>::incoming_move() const {
  RELEASE_ASSERT(incoming_move_.has_value(), "root node has no incoming move");
  return *incoming_move_;
}

template <core::concepts::Game Game>
std::span<const typename Node<Game>::Move> Node<Game>::untried_moves() const {
  return std::span<const Move>(legal_moves_).subspan(children_.size());
}

template <core::concepts::Game Game>
Node<Game>* Node<Game>::find_child(const Move& move) const {
  for (const Node_uptr& child : children_) {
    if (child->incoming_move() == move) return child.get();
  }
  return nullptr;
}

template <core::concepts::Game Game>
int Node<Game>::subtree_size() const {
  int size = 1;
  for (const Node_uptr& child : children_) {
    size += child->subtree_size();
  }
  return size;
}

template <core::concepts::Game Game>
Node<Game>* Node<Game>::expand() {
  RELEASE_ASSERT(!is_fully_expanded(), "expand() called on a fully expanded node");

  const Move& move = legal_moves_[children_.size()];
  State child_state = Rules::apply(state_, move);
  children_.push_back(Node_uptr(new Node(child_state, active_seat_, this, move)));
  return children_.back().get();
}

template <core::concepts::Game Game>
void Node<Game>::record_visit(const ValueArray& values, bool leaf) {
  visit_count_++;
  total_value_ += values[value_seat_];
  if (leaf) leaf_visit_count_++;
}

template <core::concepts::Game Game>
typename Node<Game>::Node_uptr Node<Game>::detach_child(const Move& move) {
  auto it = std::find_if(children_.begin(), children_.end(),
                         [&](const Node_uptr& child) { return child->incoming_move() == move; });
  if (it == children_.end()) return nullptr;

  Node_uptr child = std::move(*it);
  children_.erase(it);
  child->parent_ = nullptr;
  child->incoming_move_.reset();
  return child;
}

}  // namespace mcts
