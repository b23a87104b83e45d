#include "core/Exceptions.hpp"
#include "games/mnk/Game.hpp"
#include "mcts/ActionSelector.hpp"
#include "mcts/Algorithms.hpp"
#include "mcts/Constants.hpp"
#include "mcts/Exceptions.hpp"
#include "mcts/Manager.hpp"
#include "mcts/ManagerParams.hpp"
#include "mcts/Node.hpp"
#include "mcts/ParallelManager.hpp"
#include "mcts/RolloutPolicy.hpp"
#include "mcts/SearchParams.hpp"
#include "mcts/SearchResults.hpp"
#include "minimax/Solver.hpp"
#include "util/BoostUtil.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using Game = mnk::TicTacToe;
using State = Game::State;
using Move = Game::Move;
using Rules = Game::Rules;
using Manager = mcts::Manager<Game>;
using ParallelManager = mcts::ParallelManager<Game>;
using Node = mcts::Node<Game>;
using Algorithms = mcts::Algorithms<Game>;
using ActionSelector = mcts::ActionSelector<Game>;
using RolloutPolicy = mcts::RolloutPolicy<Game>;
using SearchResults = mcts::SearchResults<Game>;
using Solver = minimax::Solver<Game>;
using MoveList = std::vector<Move>;
using path_map_t = std::map<MoveList, int64_t>;

template <typename... Ts>
State make_state(Ts... moves) {
  State state = Rules::init_state();
  for (int move : {moves...}) {
    state = Rules::apply(state, move);
  }
  return state;
}

mcts::ManagerParams make_params(uint32_t seed) {
  mcts::ManagerParams params;
  params.random_seed = seed;
  return params;
}

mcts::SearchParams iterations(int n) { return mcts::SearchParams::make_iteration_params(n); }

/*
 * Plays out the game with both sides choosing uniformly among minimax-optimal moves, so that every
 * rollout returns the exact value of its starting state.
 */
class PerfectRollout : public RolloutPolicy {
 public:
  PerfectRollout() : solver_(std::make_shared<Solver>()) {}

  Move choose_move(const State& state, const MoveList&, std::mt19937& prng) const override {
    auto moves = solver_->optimal_moves(state);
    return moves[util::Random::uniform_sample(prng, 0, moves.size())];
  }

 private:
  std::shared_ptr<Solver> solver_;
};

// Returns a move that is never legal.
class IllegalRollout : public RolloutPolicy {
 public:
  Move choose_move(const State&, const MoveList&, std::mt19937&) const override { return -1; }
};

// Starts a nested search on the Manager that is calling it.
class ReentrantRollout : public RolloutPolicy {
 public:
  Move choose_move(const State& state, const MoveList& moves, std::mt19937&) const override {
    manager->start(state, iterations(1));
    return moves[0];
  }

  Manager* manager = nullptr;
};

/*
 * Checks, for every node under node:
 *
 * - visit_count == sum of children visit_count + leaf visits
 * - children line up with the first legal moves, the rest are untried
 * - terminal nodes have neither children nor untried moves
 * - unvisited nodes carry no value
 */
void check_tree_invariants(const Node* node) {
  int64_t child_visits = 0;
  for (const auto& child : node->children()) {
    EXPECT_EQ(child->parent(), node);
    child_visits += child->visit_count();
    check_tree_invariants(child.get());
  }
  EXPECT_EQ(node->visit_count(), child_visits + node->leaf_visit_count());

  const auto& legal_moves = node->legal_moves();
  const auto& children = node->children();
  ASSERT_LE(children.size(), legal_moves.size());
  for (size_t i = 0; i < children.size(); ++i) {
    EXPECT_EQ(children[i]->incoming_move(), legal_moves[i]);
  }
  auto untried = node->untried_moves();
  EXPECT_EQ(untried.size() + children.size(), legal_moves.size());
  for (size_t i = 0; i < untried.size(); ++i) {
    EXPECT_EQ(untried[i], legal_moves[children.size() + i]);
  }

  if (!Rules::is_terminal(node->state())) {
    EXPECT_EQ(legal_moves, Rules::get_legal_moves(node->state()));
  }
  if (node->is_terminal()) {
    EXPECT_TRUE(node->children().empty());
    EXPECT_TRUE(node->untried_moves().empty());
  }
  if (node->visit_count() == 0) {
    EXPECT_EQ(node->total_value(), 0);
  }
}

void collect_paths(const Node* node, MoveList& path, path_map_t& out) {
  out[path] = node->visit_count();
  for (const auto& child : node->children()) {
    path.push_back(child->incoming_move());
    collect_paths(child.get(), path, out);
    path.pop_back();
  }
}

path_map_t collect_paths(const Node* root) {
  MoveList path;
  path_map_t out;
  collect_paths(root, path, out);
  return out;
}

std::vector<int64_t> root_child_visits(const Manager& manager) {
  std::vector<int64_t> visits;
  for (const auto& child : manager.root()->children()) {
    visits.push_back(child->visit_count());
  }
  return visits;
}

TEST(Node, make_root) {
  auto root = Node::make_root(make_state(4));
  EXPECT_TRUE(root->is_root());
  EXPECT_EQ(root->active_seat(), mnk::kO);
  EXPECT_EQ(root->value_seat(), mnk::kX);
  EXPECT_EQ(root->legal_moves().size(), 8u);
  EXPECT_EQ(root->untried_moves().size(), 8u);
  EXPECT_FALSE(root->is_terminal());
  EXPECT_THROW(root->incoming_move(), util::ReleaseAssertionError);
}

TEST(Node, expand) {
  auto root = Node::make_root(Rules::init_state());
  Node* child = root->expand();
  EXPECT_EQ(child->incoming_move(), 0);
  EXPECT_EQ(child->parent(), root.get());
  EXPECT_EQ(child->value_seat(), mnk::kX);
  EXPECT_EQ(child->active_seat(), mnk::kO);
  EXPECT_EQ(child->state(), make_state(0));
  EXPECT_EQ(root->untried_moves().size(), 8u);
  EXPECT_EQ(root->find_child(0), child);
  EXPECT_EQ(root->find_child(1), nullptr);
  EXPECT_EQ(root->subtree_size(), 2);
}

TEST(Node, terminal) {
  auto root = Node::make_root(make_state(0, 3, 1, 4, 2));
  EXPECT_TRUE(root->is_terminal());
  EXPECT_TRUE(root->legal_moves().empty());
  EXPECT_TRUE(root->is_fully_expanded());
}

TEST(Node, detach_child) {
  auto root = Node::make_root(Rules::init_state());
  root->expand();
  Node* second = root->expand();

  auto detached = root->detach_child(1);
  ASSERT_EQ(detached.get(), second);
  EXPECT_TRUE(detached->is_root());
  EXPECT_EQ(detached->state(), make_state(1));
  EXPECT_EQ(root->detach_child(5).get(), nullptr);
}

TEST(Node, statistics_past_float_precision) {
  auto root = Node::make_root(Rules::init_state());
  ASSERT_EQ(root->value_seat(), mnk::kO);

  // 2^25 wins for O: a float running sum would stall at 2^24.
  const int64_t n = int64_t(1) << 25;
  Node::ValueArray o_wins = {-1, 1};
  for (int64_t i = 0; i < n; ++i) {
    root->record_visit(o_wins, true);
  }
  EXPECT_EQ(root->visit_count(), n);
  EXPECT_EQ(root->total_value(), double(n));
  EXPECT_EQ(root->mean_value(), 1.0);
}

TEST(Algorithms, backpropagate_credits_the_seat_that_moved) {
  auto root = Node::make_root(Rules::init_state());
  Node* child = Algorithms::expand(root.get());
  Node* grandchild = Algorithms::expand(child);

  // X wins
  Node::ValueArray values = {1, -1};
  Algorithms::backpropagate(grandchild, values);

  EXPECT_EQ(grandchild->total_value(), -1);  // O moved into grandchild
  EXPECT_EQ(child->total_value(), 1);        // X moved into child
  EXPECT_EQ(root->total_value(), -1);        // root is credited to the seat before X
  EXPECT_EQ(grandchild->leaf_visit_count(), 1);
  EXPECT_EQ(child->leaf_visit_count(), 0);
  EXPECT_EQ(root->visit_count(), 1);
  check_tree_invariants(root.get());
}

TEST(Algorithms, simulate_reaches_terminal) {
  std::mt19937 prng(3);
  mcts::UniformRandomRollout<Game> policy;
  for (int i = 0; i < 20; ++i) {
    auto values = Algorithms::simulate(Rules::init_state(), policy, prng);
    EXPECT_EQ(values[0], -values[1]);
    EXPECT_LE(std::abs(values[0]), 1);
  }

  State finished = make_state(0, 3, 1, 4, 2);
  auto values = Algorithms::simulate(finished, policy, prng);
  EXPECT_EQ(values[mnk::kX], 1);
  EXPECT_EQ(values[mnk::kO], -1);
}

TEST(Algorithms, select_leaf) {
  ActionSelector selector(1.4);
  auto root = Node::make_root(make_state(0, 1, 2, 4, 3, 5, 7));  // O to move, 6 and 8 open

  EXPECT_EQ(Algorithms::select_leaf(root.get(), selector), root.get());
  Node* a = Algorithms::expand(root.get());
  Node* b = Algorithms::expand(root.get());
  EXPECT_TRUE(root->is_fully_expanded());

  Node::ValueArray draw = {0, 0};
  Algorithms::backpropagate(a, draw);
  // b has not been visited, so it is selected regardless of a's value
  EXPECT_EQ(Algorithms::select_leaf(root.get(), selector), b);
}

TEST(ActionSelector, uct_score) {
  ActionSelector selector(2.0);
  auto root = Node::make_root(Rules::init_state());
  Node* a = root->expand();
  Node* b = root->expand();

  EXPECT_EQ(selector.score(*root, *a), std::numeric_limits<double>::infinity());

  // a: 3 visits, total 1 (for X). b: 1 visit, total -1.
  Node::ValueArray x_wins = {1, -1};
  Node::ValueArray o_wins = {-1, 1};
  Node::ValueArray draw = {0, 0};
  Algorithms::backpropagate(a, x_wins);
  Algorithms::backpropagate(a, draw);
  Algorithms::backpropagate(a, draw);
  Algorithms::backpropagate(b, o_wins);

  EXPECT_EQ(root->visit_count(), 4);
  float expected_a = 1.0 / 3 + 2.0 * std::sqrt(std::log(4.0) / 3);
  float expected_b = -1.0 + 2.0 * std::sqrt(std::log(4.0) / 1);
  EXPECT_NEAR(selector.score(*root, *a), expected_a, 1e-5);
  EXPECT_NEAR(selector.score(*root, *b), expected_b, 1e-5);
}

TEST(ActionSelector, first_max_wins_ties) {
  ActionSelector selector(0);
  auto root = Node::make_root(make_state(0, 1, 2, 4, 3, 5, 7));
  Node* a = root->expand();
  Node* b = root->expand();
  Node::ValueArray draw = {0, 0};
  Algorithms::backpropagate(a, draw);
  Algorithms::backpropagate(b, draw);
  EXPECT_EQ(selector.select(*root), a);
}

TEST(SearchResults, best_move_tie_breaking) {
  SearchResults results;
  results.legal_moves = {0, 1, 2, 3};
  results.children = {{0, 10, 2}, {1, 10, 5}, {2, 4, 4}, {3, 10, 5}};

  EXPECT_EQ(results.best_move(mcts::kRobustChild), 1);  // most visits, then mean, then order
  EXPECT_EQ(results.best_move(mcts::kMaxChild), 2);     // mean 1.0

  results.children[2].total_value = 2;  // mean 0.5, but fewer visits than moves 1 and 3
  EXPECT_EQ(results.best_move(mcts::kMaxChild), 1);
}

TEST(SearchResults, best_move_without_statistics) {
  SearchResults results;
  EXPECT_THROW(results.best_move(mcts::kRobustChild), mcts::NoIterationsError);

  results.legal_moves = {4, 5};
  EXPECT_THROW(results.best_move(mcts::kRobustChild), mcts::NoIterationsError);

  results.legal_moves = {7};
  EXPECT_EQ(results.best_move(mcts::kRobustChild), 7);
  EXPECT_EQ(results.best_move(mcts::kMaxChild), 7);
}

TEST(SearchResults, merge) {
  SearchResults a;
  a.legal_moves = {0, 1, 2};
  a.children = {{2, 3, 1}, {0, 1, 0}};
  a.num_iterations = 4;
  a.root_visit_count = 4;

  SearchResults b;
  b.legal_moves = {0, 1, 2};
  b.children = {{0, 2, 2}, {1, 5, -1}};
  b.num_iterations = 7;
  b.root_visit_count = 7;

  SearchResults merged;
  merged.merge(a);
  merged.merge(b);

  ASSERT_EQ(merged.children.size(), 3u);
  EXPECT_EQ(merged.children[0].move, 2);
  EXPECT_EQ(merged.children[0].visit_count, 3);
  EXPECT_EQ(merged.children[1].move, 0);
  EXPECT_EQ(merged.children[1].visit_count, 3);
  EXPECT_EQ(merged.children[1].total_value, 2);
  EXPECT_EQ(merged.children[2].move, 1);
  EXPECT_EQ(merged.num_iterations, 11);
  EXPECT_EQ(merged.root_visit_count, 11);
  EXPECT_EQ(merged.total_child_visits(), 11);
  EXPECT_EQ(merged.legal_moves, a.legal_moves);
}

TEST(SearchResults, print) {
  Manager manager(make_params(1));
  manager.start(Rules::init_state(), iterations(50));

  std::ostringstream ss;
  manager.results().print(ss);
  EXPECT_NE(ss.str().find("iterations=50"), std::string::npos);
  EXPECT_NE(ss.str().find("(1,1)"), std::string::npos);
}

TEST(Manager, visit_count_conservation) {
  for (int sims : {1, 3}) {
    mcts::ManagerParams params = make_params(11);
    params.simulations_per_iteration = sims;
    Manager manager(params);
    manager.start(Rules::init_state(), iterations(700));

    EXPECT_EQ(manager.execution_state(), mcts::kDone);
    EXPECT_EQ(manager.num_iterations(), 700);
    EXPECT_GE(manager.root()->visit_count(), 700);
    EXPECT_LE(manager.root()->visit_count(), 700 * sims);
    EXPECT_EQ(manager.root()->leaf_visit_count(), 0);
    check_tree_invariants(manager.root());
  }
}

TEST(Manager, tree_only_grows) {
  path_map_t prev;
  for (int n : {1, 2, 3, 10, 11, 50, 51, 200}) {
    Manager manager(make_params(5));
    manager.start(Rules::init_state(), iterations(n));
    path_map_t cur = collect_paths(manager.root());

    for (const auto& [path, visits] : prev) {
      auto it = cur.find(path);
      ASSERT_NE(it, cur.end());
      EXPECT_GE(it->second, visits);
    }
    EXPECT_GE(cur.size(), prev.size());
    prev = cur;
  }
}

TEST(Manager, determinism) {
  Manager manager1(make_params(42));
  Manager manager2(make_params(42));
  manager1.start(Rules::init_state(), iterations(1000));
  manager2.start(Rules::init_state(), iterations(1000));

  EXPECT_EQ(manager1.best_move(), manager2.best_move());
  EXPECT_EQ(root_child_visits(manager1), root_child_visits(manager2));
  EXPECT_EQ(collect_paths(manager1.root()), collect_paths(manager2.root()));
}

TEST(Manager, seed_from_default_prng) {
  util::Random::set_seed(9);
  Manager manager1(mcts::ManagerParams{});
  util::Random::set_seed(9);
  Manager manager2(mcts::ManagerParams{});

  manager1.start(Rules::init_state(), iterations(300));
  manager2.start(Rules::init_state(), iterations(300));
  EXPECT_EQ(collect_paths(manager1.root()), collect_paths(manager2.root()));
}

TEST(Manager, takes_immediate_win) {
  // X: 0 1, O: 3 4. X to move wins at 2.
  State state = make_state(0, 3, 1, 4);
  Manager manager(make_params(3));
  manager.start(state, iterations(3000));
  EXPECT_EQ(manager.best_move(), 2);
}

TEST(Manager, blocks_forced_loss) {
  // X: 0 8, O: 4 2. O threatens 6; X must block there (which also forks).
  State state = make_state(0, 4, 8, 2);
  Manager manager(make_params(3));
  manager.start(state, iterations(5000));
  EXPECT_EQ(manager.best_move(), 6);

  const Node* root = manager.root();
  const Node* block = root->find_child(6);
  ASSERT_NE(block, nullptr);
  for (const auto& child : root->children()) {
    if (child.get() == block) continue;
    // Any other move lets O win at 6, which must make that move unattractive to X.
    EXPECT_LT(child->mean_value(), block->mean_value());
    EXPECT_LT(child->visit_count(), block->visit_count());

    const Node* o_wins = child->find_child(6);
    if (o_wins && o_wins->visit_count() > 0) {
      EXPECT_TRUE(o_wins->is_terminal());
      EXPECT_EQ(o_wins->value_seat(), mnk::kO);
      EXPECT_EQ(o_wins->mean_value(), 1);
    }
  }
}

TEST(Manager, converges_with_exact_rollouts) {
  std::vector<State> states = {
    Rules::init_state(),
    make_state(0, 1),
    make_state(4, 0, 8),
    make_state(0, 4, 8, 2),
    make_state(4, 1),
    make_state(0, 8, 2),
  };

  Solver solver;
  auto policy = std::make_shared<PerfectRollout>();
  for (const State& state : states) {
    Manager manager(make_params(17), policy);
    manager.start(state, iterations(3000));

    Move move = manager.best_move();
    EXPECT_EQ(solver.move_value(state, move), solver.evaluate(state))
      << Game::IO::compact_state_repr(state) << "picked " << Game::IO::move_to_str(move);
  }
}

TEST(Manager, terminal_root) {
  Manager manager(make_params(1));
  manager.start(make_state(0, 3, 1, 4, 2), iterations(100));

  EXPECT_EQ(manager.execution_state(), mcts::kDone);
  EXPECT_EQ(manager.num_iterations(), 0);
  EXPECT_THROW(manager.best_move(), mcts::NoIterationsError);
}

TEST(Manager, single_legal_move) {
  State state = make_state(0, 1, 2, 4, 3, 5, 7, 6);  // only cell 8 is open
  ASSERT_EQ(Rules::get_legal_moves(state).size(), 1u);

  // Zero iterations, even with time to spare.
  mcts::SearchParams zero_iterations{0, std::chrono::milliseconds(200)};

  Manager manager(make_params(1));
  manager.start(state, zero_iterations);
  EXPECT_EQ(manager.num_iterations(), 0);
  EXPECT_EQ(manager.best_move(), 8);

  manager.start(Rules::init_state(), zero_iterations);
  EXPECT_EQ(manager.num_iterations(), 0);
  EXPECT_THROW(manager.best_move(), mcts::NoIterationsError);

  manager.start(state, mcts::SearchParams::make_timed_params(std::chrono::milliseconds(0)));
  EXPECT_EQ(manager.num_iterations(), 0);
  EXPECT_EQ(manager.best_move(), 8);
}

TEST(Manager, iteration_limit_under_deadline) {
  Manager manager(make_params(1));
  manager.start(Rules::init_state(), mcts::SearchParams{25, std::chrono::milliseconds(60000)});
  EXPECT_EQ(manager.num_iterations(), 25);
  EXPECT_EQ(manager.root()->visit_count(), 25);

  EXPECT_EQ(mcts::SearchParams::make_timed_params(std::chrono::milliseconds(10)).max_iterations,
            mcts::SearchParams::kUnlimitedIterations);
}

TEST(Manager, time_budget) {
  Manager manager(make_params(1));
  manager.start(Rules::init_state(),
                mcts::SearchParams::make_timed_params(std::chrono::milliseconds(30)));

  EXPECT_GT(manager.num_iterations(), 0);
  EXPECT_GE(manager.results().elapsed, std::chrono::milliseconds(30));
  check_tree_invariants(manager.root());
}

TEST(Manager, state_machine) {
  Manager manager(make_params(1));
  EXPECT_EQ(manager.execution_state(), mcts::kIdle);
  EXPECT_EQ(manager.root(), nullptr);
  EXPECT_THROW(manager.best_move(), mcts::NoIterationsError);
  EXPECT_THROW(manager.results(), mcts::NoIterationsError);

  manager.start(Rules::init_state(), iterations(10));
  EXPECT_EQ(manager.execution_state(), mcts::kDone);
  EXPECT_NO_THROW(manager.best_move());

  // A new search may be started straight from kDone.
  manager.start(make_state(4), iterations(10));
  EXPECT_EQ(manager.root()->state(), make_state(4));
  EXPECT_EQ(manager.root()->visit_count(), 10);

  manager.reset();
  EXPECT_EQ(manager.execution_state(), mcts::kIdle);
  EXPECT_EQ(manager.root(), nullptr);
}

TEST(Manager, reentrant_start) {
  auto policy = std::make_shared<ReentrantRollout>();
  Manager manager(make_params(1), policy);
  policy->manager = &manager;

  EXPECT_THROW(manager.start(Rules::init_state(), iterations(10)), mcts::InvalidStateError);
  EXPECT_EQ(manager.execution_state(), mcts::kIdle);
  EXPECT_EQ(manager.root(), nullptr);
}

TEST(Manager, rollout_error_propagates) {
  Manager manager(make_params(1), std::make_shared<IllegalRollout>());
  EXPECT_THROW(manager.start(Rules::init_state(), iterations(10)), core::InvalidMoveError);
  EXPECT_EQ(manager.execution_state(), mcts::kIdle);
  EXPECT_EQ(manager.root(), nullptr);
}

TEST(Manager, configuration_errors) {
  mcts::ManagerParams params;
  params.exploration_constant = -0.5;
  EXPECT_THROW(Manager{params}, mcts::ConfigurationError);

  params = mcts::ManagerParams{};
  params.simulations_per_iteration = 0;
  EXPECT_THROW(Manager{params}, mcts::ConfigurationError);

  Manager manager(make_params(1));
  EXPECT_THROW(manager.start(Rules::init_state(), iterations(0)), mcts::ConfigurationError);
  EXPECT_THROW(manager.start(Rules::init_state(), iterations(-3)), mcts::ConfigurationError);
  EXPECT_THROW(manager.start(Rules::init_state(),
                             mcts::SearchParams{10, std::chrono::milliseconds(-1)}),
               mcts::ConfigurationError);
  EXPECT_EQ(manager.execution_state(), mcts::kIdle);

  // A non-positive iteration count is accepted given a deadline, and runs nothing.
  EXPECT_NO_THROW(manager.start(Rules::init_state(),
                                mcts::SearchParams{-1, std::chrono::milliseconds(5)}));
  EXPECT_EQ(manager.num_iterations(), 0);

  EXPECT_THROW(mcts::parse_final_move_selection("most-visits"), mcts::ConfigurationError);
  EXPECT_EQ(mcts::parse_final_move_selection("max"), mcts::kMaxChild);
}

TEST(Manager, options) {
  mcts::ManagerParams params;
  mcts::SearchParams search_params;

  namespace po2 = boost_util::program_options;
  po2::options_description raw_desc("All");
  auto desc = raw_desc.add(params.make_options_description())
                .add(search_params.make_options_description());

  std::vector<const char*> argv = {"prog",
                                   "-c",
                                   "0.5",
                                   "--mcts-seed",
                                   "12",
                                   "--final-move-selection",
                                   "max",
                                   "--enable-tree-reuse",
                                   "--max-iterations",
                                   "0",
                                   "--max-duration-ms",
                                   "250"};
  po2::parse_args(desc, argv.size(), argv.data());

  EXPECT_FLOAT_EQ(params.exploration_constant, 0.5);
  ASSERT_TRUE(params.random_seed.has_value());
  EXPECT_EQ(*params.random_seed, 12u);
  EXPECT_EQ(params.final_move_selection, mcts::kMaxChild);
  EXPECT_TRUE(params.enable_tree_reuse);
  EXPECT_EQ(search_params.max_iterations, 0);
  ASSERT_TRUE(search_params.max_duration.has_value());
  EXPECT_EQ(search_params.max_duration->count(), 250);
  EXPECT_NO_THROW(search_params.validate());

  Manager manager(params);
  manager.start(Rules::init_state(), search_params);
  EXPECT_EQ(manager.num_iterations(), 0);
}

TEST(Manager, tree_reuse) {
  mcts::ManagerParams params = make_params(23);
  params.enable_tree_reuse = true;
  Manager manager(params);

  State state = Rules::init_state();
  manager.start(state, iterations(500));
  Move move = manager.best_move();
  int64_t kept_visits = manager.root()->find_child(move)->visit_count();

  manager.advance(move);
  state = Rules::apply(state, move);
  EXPECT_EQ(manager.execution_state(), mcts::kIdle);
  ASSERT_NE(manager.root(), nullptr);
  EXPECT_TRUE(manager.root()->is_root());
  EXPECT_EQ(manager.root()->state(), state);
  EXPECT_EQ(manager.root()->visit_count(), kept_visits);
  EXPECT_THROW(manager.best_move(), mcts::NoIterationsError);

  const Node* reply_node = manager.root()->children()[0].get();
  Move reply = reply_node->incoming_move();
  int64_t reply_visits = reply_node->visit_count();
  manager.advance(reply);
  state = Rules::apply(state, reply);
  EXPECT_EQ(manager.root()->visit_count(), reply_visits);

  manager.start(state, iterations(100));
  EXPECT_EQ(manager.root()->visit_count(), reply_visits + 100);
  check_tree_invariants(manager.root());

  // A search from a state that does not match the retained root starts afresh.
  manager.start(make_state(8), iterations(40));
  EXPECT_EQ(manager.root()->visit_count(), 40);
}

TEST(Manager, advance_to_unexpanded_move) {
  mcts::ManagerParams params = make_params(2);
  params.enable_tree_reuse = true;
  Manager manager(params);

  manager.start(Rules::init_state(), iterations(3));  // expands cells 0..2 only
  manager.advance(8);
  EXPECT_EQ(manager.root()->state(), make_state(8));
  EXPECT_EQ(manager.root()->visit_count(), 0);

  EXPECT_THROW(manager.advance(8), core::InvalidMoveError);
}

TEST(Manager, advance_without_reuse) {
  Manager manager(make_params(2));
  manager.start(Rules::init_state(), iterations(20));
  manager.advance(0);
  EXPECT_EQ(manager.execution_state(), mcts::kIdle);
  EXPECT_EQ(manager.root(), nullptr);

  manager.start(make_state(0), iterations(20));
  EXPECT_EQ(manager.root()->visit_count(), 20);
}

TEST(ParallelManager, merges_worker_statistics) {
  ParallelManager::Params params;
  params.num_trees = 3;
  params.manager_params = make_params(7);

  ParallelManager parallel_manager(params);
  parallel_manager.start(Rules::init_state(), iterations(200));
  const SearchResults& merged = parallel_manager.results();

  EXPECT_EQ(merged.num_iterations, 600);
  EXPECT_EQ(merged.root_visit_count, 600);
  EXPECT_EQ(merged.total_child_visits(), 600);

  // Same as running the workers one by one.
  SearchResults expected;
  for (uint32_t seed : {7, 8, 9}) {
    Manager manager(make_params(seed));
    manager.start(Rules::init_state(), iterations(200));
    expected.merge(manager.results());
  }
  ASSERT_EQ(merged.children.size(), expected.children.size());
  for (size_t i = 0; i < merged.children.size(); ++i) {
    EXPECT_EQ(merged.children[i].move, expected.children[i].move);
    EXPECT_EQ(merged.children[i].visit_count, expected.children[i].visit_count);
    EXPECT_FLOAT_EQ(merged.children[i].total_value, expected.children[i].total_value);
  }
  EXPECT_EQ(parallel_manager.best_move(), expected.best_move(mcts::kRobustChild));
}

TEST(ParallelManager, blocks_forced_loss) {
  ParallelManager::Params params;
  params.num_trees = 4;
  params.manager_params = make_params(31);

  ParallelManager parallel_manager(params);
  parallel_manager.start(make_state(0, 4, 8, 2), iterations(2000));
  EXPECT_EQ(parallel_manager.best_move(), 6);
}

TEST(ParallelManager, worker_error_propagates) {
  ParallelManager::Params params;
  params.num_trees = 2;
  params.manager_params = make_params(1);

  ParallelManager parallel_manager(params, std::make_shared<IllegalRollout>());
  EXPECT_THROW(parallel_manager.start(Rules::init_state(), iterations(10)),
               core::InvalidMoveError);
  EXPECT_EQ(parallel_manager.execution_state(), mcts::kIdle);
  EXPECT_THROW(parallel_manager.best_move(), mcts::NoIterationsError);
}

TEST(ParallelManager, join_all_skips_unstarted_threads) {
  std::atomic<int> finished = 0;
  std::vector<std::thread> threads;
  threads.emplace_back([&] { finished++; });
  threads.emplace_back();  // never started
  threads.emplace_back([&] { finished++; });

  mcts::detail::join_all(threads);
  EXPECT_EQ(finished.load(), 2);
  for (const auto& thread : threads) {
    EXPECT_FALSE(thread.joinable());
  }
}

TEST(ParallelManager, configuration_errors) {
  ParallelManager::Params params;
  params.num_trees = 0;
  EXPECT_THROW(ParallelManager{params}, mcts::ConfigurationError);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
