#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

namespace boost_util {

namespace program_options {

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : storage_(std::make_shared<Storage>(name)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  auto out = augment<StrLit, Char>();
  std::string name = full_name<StrLit, Char>();

  // boost takes ownership of the value_semantic pointer, so the option is registered once and the
  // resulting option_description is shared with the visible set.
  out.storage_->full.add_options()(name.c_str(), std::forward<Ts>(ts)...);
  out.storage_->visible.add(out.storage_->full.options().back());
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_hidden_option(Ts&&... ts) {
  auto out = augment<StrLit>();
  std::string name = full_name<StrLit, ' '>();

  out.storage_->full.add_options()(name.c_str(), std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  return add_flag_helper<TrueStrLit, FalseStrLit>(flag, true_help, false_help, false);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_hidden_flag(bool* flag, const char* true_help,
                                                           const char* false_help) {
  return add_flag_helper<TrueStrLit, FalseStrLit>(flag, true_help, false_help, true);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(
  const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  using StrSeq3 = util::concat_string_literal_sequence_t<StrSeq, StrSeq2>;
  using CharSeq3 = util::concat_int_sequence_t<CharSeq, CharSeq2>;
  using OutT = options_description<StrSeq3, CharSeq3>;

  storage_->full.add(desc.storage_->full);
  storage_->visible.add(desc.storage_->visible);
  storage_->children.push_back(desc.storage_);

  return OutT(storage_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
void options_description<StrSeq, CharSeq>::print(std::ostream& s) const {
  if (Settings::help_full) {
    storage_->full.print(s);
  } else {
    storage_->visible.print(s);
  }
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
auto options_description<StrSeq, CharSeq>::augment() const {
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, StrLit>, "Options name clash!");
  constexpr bool UsingAbbrev = Char != ' ';
  static_assert(!UsingAbbrev || !util::int_sequence_contains_v<CharSeq, int(Char)>,
                "Options abbreviation clash!");

  using StrSeq2 =
    util::concat_string_literal_sequence_t<StrSeq, util::StringLiteralSequence<StrLit>>;
  using CharSeq2 = std::conditional_t<
    UsingAbbrev, util::concat_int_sequence_t<CharSeq, util::int_sequence<int(Char)>>, CharSeq>;
  using OutT = options_description<StrSeq2, CharSeq2>;

  return OutT(storage_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
std::string options_description<StrSeq, CharSeq>::full_name() {
  if constexpr (Char != ' ') {
    return fmt::format("{},{}", StrLit.value, Char);
  } else {
    return std::string(StrLit.value);
  }
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag_helper(bool* flag, const char* true_help,
                                                           const char* false_help, bool hidden) {
  namespace po = boost::program_options;

  auto out = augment<TrueStrLit>().template augment<FalseStrLit>();

  std::string full_true_help = true_help;
  std::string full_false_help = false_help;
  if (*flag) {
    full_true_help += " (no-op)";
  } else {
    full_false_help += " (no-op)";
  }

  const char* true_name = TrueStrLit.value;
  const char* false_name = FalseStrLit.value;

  out.storage_->full.add_options()(true_name, po::value(flag)->implicit_value(true)->zero_tokens(),
                                   full_true_help.c_str())(
    false_name, po::value(flag)->implicit_value(false)->zero_tokens(), full_false_help.c_str());

  if (!hidden) {
    const auto& options = out.storage_->full.options();
    out.storage_->visible.add(options[options.size() - (*flag ? 1 : 2)]);
  }

  return out;
}

namespace detail {

template <typename T>
const T& unwrap(const T& t) {
  return t;
}

template <typename S, util::concepts::IntSequence C>
const auto& unwrap(const options_description<S, C>& t) {
  return t.get();
}

}  // namespace detail

template <typename T>
boost::program_options::variables_map parse_args(const T& desc, int argc,
                                                 const char* const* argv) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(detail::unwrap(desc)).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
