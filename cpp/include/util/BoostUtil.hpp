#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>
#include <fmt/core.h>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace boost_util {

namespace program_options {

/*
 * po::value<float>(...)->default_value(...) prints the default value with undesirable precision.
 * The official solution is to pass a second string argument to default_value(), which is clunky.
 * This provides a cleaner way to specify that string:
 *
 * boost_util::program_options::default_value("{:.3f}", &f)
 */
template <typename T>
auto default_value(fmt::format_string<const T&> fmt, T* dest) {
  const T& t = *dest;
  return boost::program_options::value<T>(dest)->default_value(t, fmt::format(fmt, t));
}

struct Settings {
  static inline bool help_full = false;
};

namespace detail {

// boost keeps raw pointers to added groups, so children are kept alive alongside their parent.
struct OptionsStorage {
  explicit OptionsStorage(const char* name) : full(name), visible(name) {}

  boost::program_options::options_description full;     // includes hidden options
  boost::program_options::options_description visible;  // excludes hidden options
  std::vector<std::shared_ptr<const OptionsStorage>> children;
};

}  // namespace detail

/*
 * A thin wrapper around boost::program_options::options_description that detects option-naming
 * clashes at compile-time, rather than at runtime.
 *
 * Before:
 *
 * namespace po = boost::program_options;
 * po::options_description desc("descr");
 * desc.add_options()
 *     ("foo,f", ...)
 *     ("bar", ...)
 *     ;
 * return desc;
 *
 * After:
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"foo", 'f'>(...)
 *     .add_option<"bar">(...)
 *     ;
 *
 * Every add_*() call returns a new wrapper whose type records the accumulated names. All wrappers
 * produced from one root share the same underlying boost storage.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  explicit options_description(const char* name);

  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  // Like add_option(), but only shown in --help-full output.
  template <util::StringLiteral StrLit, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo options. Only the one that changes *flag is shown in --help
   * output; --help-full shows both.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_hidden_flag(bool* flag, const char* true_help, const char* false_help);

  // Adds all options from desc to this.
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return storage_->full; }

 private:
  using Storage = detail::OptionsStorage;
  using Storage_sptr = std::shared_ptr<Storage>;

  explicit options_description(Storage_sptr storage) : storage_(std::move(storage)) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <util::StringLiteral StrLit, char Char>
  static std::string full_name();

  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag_helper(bool* flag, const char* true_help, const char* false_help, bool hidden);

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  Storage_sptr storage_;
};

/*
 * Parses argc/argv against desc (a {boost, boost_util}::program_options::options_description) and
 * returns the notified variables_map. Parse errors are rethrown as util::CleanException.
 */
template <typename T>
boost::program_options::variables_map parse_args(const T& desc, int argc, const char* const* argv);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
