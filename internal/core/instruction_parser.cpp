#include "internal/core/instruction_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <regex>
#include <sstream>
#include <utility>

namespace longform::core {

namespace v1 = longform::editor::v1;

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

// One time expression, captured as a single group.
const std::string kTime =
    R"((\d+:\d{1,2}(?::\d{1,2})?(?:\.\d+)?|\d+(?:\.\d+)?(?:\s*(?:milliseconds?|ms|minutes?|mins?|m|seconds?|secs?|s)\b)?))";

const std::string kRangeSep = R"(\s*(?:to|-|and|until|through|till)\s*)";

const std::string kEditVerbs =
    "cut|remove|delete|drop|trim|move|add|overlay|put|insert|place|show|speed|slow|tighten|skip|strip|chop|get rid";

constexpr double kMinSpeed = 0.25;
constexpr double kMaxSpeed = 4.0;

const std::regex& FillerRule() {
  static const std::regex re(R"(\bfillers?\b)", kFlags);
  return re;
}

const std::regex& SilenceRule() {
  static const std::regex re(R"(\b(?:silences?|silent|pauses?|dead air|gaps?)\b)", kFlags);
  return re;
}

const std::regex& SilenceThreshold() {
  static const std::regex re(R"(\b(?:longer than|more than|over|above|exceeding|at least)\s+)" + kTime, kFlags);
  return re;
}

const std::regex& OverlayRule() {
  static const std::regex re(R"(\b(?:text|title|caption|overlay|lower third|label|subtitle)\b)", kFlags);
  return re;
}

const std::regex& Quoted() {
  static const std::regex re(R"re("([^"]+)")re");
  return re;
}

const std::regex& FromTo() {
  static const std::regex re(R"(\b(?:from|between)\s+)" + kTime + kRangeSep + kTime, kFlags);
  return re;
}

const std::regex& AtTime() {
  static const std::regex re(R"(\bat\s+)" + kTime, kFlags);
  return re;
}

const std::regex& ForDuration() {
  static const std::regex re(R"(\bfor\s+)" + kTime, kFlags);
  return re;
}

const std::regex& TrimVerb() {
  static const std::regex re(R"(\b(?:trim|cut|remove|drop|skip|delete|chop)\b)", kFlags);
  return re;
}

const std::regex& TrimEdge() {
  static const std::regex re(R"(\b(first|opening|last|final|closing)\s+)" + kTime, kFlags);
  return re;
}

const std::regex& TrimFromEdge() {
  static const std::regex re(kTime + R"(\s+(?:from|off)\s+the\s+(start|beginning|end))", kFlags);
  return re;
}

const std::regex& MoveRule() {
  static const std::regex re(
      R"(\bmove\s+(?:the\s+)?(?:segment|section|clip|part|scene)\s+(?:#|number\s+)?(\d+)\s+(?:to\s+)?(?:(?:the\s+)?(start|beginning|front|end|back)|(?:position\s+|segment\s+)?(\d+))\b)",
      kFlags);
  return re;
}

const std::regex& SpeedRule() {
  static const std::regex re(R"(\b(?:speed up|speed it up|faster|slow down|slow it down|slower|speed|playback rate)\b)", kFlags);
  return re;
}

const std::regex& SpeedUp() {
  static const std::regex re(R"(\b(?:speed up|speed it up|faster)\b)", kFlags);
  return re;
}

const std::regex& SlowDown() {
  static const std::regex re(R"(\b(?:slow down|slow it down|slower)\b)", kFlags);
  return re;
}

const std::regex& Percent() {
  static const std::regex re(R"(\bby\s+(\d+(?:\.\d+)?)\s*%)", kFlags);
  return re;
}

const std::regex& Multiplier() {
  static const std::regex re(R"((\d+(?:\.\d+)?)\s*x\b)", kFlags);
  return re;
}

const std::regex& PacingRule() {
  static const std::regex re(R"(\b(?:tighten|tighter|snappier)\b.*\bpac(?:e|ing)\b|\bpac(?:e|ing)\b.*\b(?:tighter|snappier)\b)", kFlags);
  return re;
}

const std::regex& RangeCutRule() {
  static const std::regex re(R"(\b(?:cut|remove|delete|drop|skip|trim|chop)\b.*?)" + kTime + kRangeSep + kTime, kFlags);
  return re;
}

const std::regex& PhraseCutRule() {
  static const std::regex re(R"re(\b(?:cut|remove|delete|drop|skip|strip)\b.*?"([^"]+)")re", kFlags);
  return re;
}

// Digit runs captured by the rules are unbounded; values that do not fit
// come back empty instead of throwing.
std::optional<double> ToNumber(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  errno              = 0;
  char*        end   = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<uint32_t> ToIndex(const std::string& text) {
  uint32_t    value = 0;
  const char* last  = text.data() + text.size();
  auto [ptr, ec]    = std::from_chars(text.data(), last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> Finite(double value) {
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::string NormalizeToken(const std::string& token) {
  std::string out;
  out.reserve(token.size());
  for (unsigned char c : token) {
    if (std::isalnum(c) || c == '\'') {
      out.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return out;
}

std::vector<std::string> Tokenize(const std::string& text) {
  std::istringstream       in(text);
  std::vector<std::string> tokens;
  std::string              token;
  while (in >> token) {
    tokens.push_back(NormalizeToken(token));
  }
  return tokens;
}

std::string TrimSpaces(const std::string& s) {
  auto begin = s.find_first_not_of(" \t\r\n,");
  if (begin == std::string::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t\r\n,");
  return s.substr(begin, end - begin + 1);
}

std::string ReplaceCurlyQuotes(std::string s) {
  for (const char* curly : {"\xE2\x80\x9C", "\xE2\x80\x9D"}) {
    for (auto pos = s.find(curly); pos != std::string::npos; pos = s.find(curly, pos)) {
      s.replace(pos, 3, "\"");
    }
  }
  return s;
}

// Occurrences of phrase as half-open word index ranges.
std::vector<std::pair<uint32_t, uint32_t>> FindSequence(const std::vector<std::string>& tokens, const std::vector<std::string>& phrase) {
  std::vector<std::pair<uint32_t, uint32_t>> out;
  if (phrase.empty() || phrase.size() > tokens.size()) {
    return out;
  }
  for (std::size_t i = 0; i + phrase.size() <= tokens.size();) {
    if (std::equal(phrase.begin(), phrase.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i))) {
      out.emplace_back(static_cast<uint32_t>(i), static_cast<uint32_t>(i + phrase.size()));
      i += phrase.size();
    } else {
      ++i;
    }
  }
  return out;
}

struct Range {
  double start = 0.0;
  double end   = 0.0;
};

// False when the range is empty or starts past the known duration.
bool ResolveRange(Range& range, const ParseContext& context) {
  if (range.end <= range.start || range.start < 0) {
    return false;
  }
  if (context.duration_seconds) {
    if (range.start >= *context.duration_seconds) {
      return false;
    }
    range.end = std::min(range.end, *context.duration_seconds);
  }
  return range.end > range.start;
}

std::optional<Range> MatchFromTo(const std::string& text) {
  std::smatch m;
  if (!std::regex_search(text, m, FromTo())) {
    return std::nullopt;
  }
  auto start = InstructionParser::ParseTime(m[1].str());
  auto end   = InstructionParser::ParseTime(m[2].str());
  if (!start || !end) {
    return std::nullopt;
  }
  return Range{*start, *end};
}

void SetRange(v1::TimeRange* out, const Range& range) {
  out->set_start_seconds(range.start);
  out->set_end_seconds(range.end);
}

enum class RuleOutcome {
  kNoMatch,
  kMatched,
  kUnresolved,
};

} // namespace

InstructionParser::InstructionParser(ParserOptions options) : options_(std::move(options)) {
  if (options_.filler_words.empty()) {
    options_.filler_words = DefaultFillerWords();
  }
  for (const auto& filler : options_.filler_words) {
    auto tokens = Tokenize(filler);
    if (!tokens.empty()) {
      fillers_.push_back(std::move(tokens));
    }
  }
  // longest first so "you know" wins over a single-word entry
  std::stable_sort(fillers_.begin(), fillers_.end(), [](const auto& a, const auto& b) { return a.size() > b.size(); });
}

std::vector<std::string> InstructionParser::DefaultFillerWords() {
  return {"um", "uh", "uhm", "umm", "erm", "er", "ah", "hmm", "mm", "you know", "i mean", "sort of", "kind of"};
}

std::optional<double> InstructionParser::ParseTime(const std::string& raw) {
  const auto text = TrimSpaces(raw);
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.find(':') != std::string::npos) {
    std::vector<double> parts;
    std::size_t         begin = 0;
    while (true) {
      auto        colon = text.find(':', begin);
      std::string part  = text.substr(begin, colon == std::string::npos ? std::string::npos : colon - begin);
      if (part.empty() || part.find_first_not_of("0123456789.") != std::string::npos) {
        return std::nullopt;
      }
      auto value = ToNumber(part);
      if (!value) {
        return std::nullopt;
      }
      parts.push_back(*value);
      if (colon == std::string::npos) {
        break;
      }
      begin = colon + 1;
    }
    if (parts.size() == 2) {
      return Finite(parts[0] * 60 + parts[1]);
    }
    if (parts.size() == 3) {
      return Finite(parts[0] * 3600 + parts[1] * 60 + parts[2]);
    }
    return std::nullopt;
  }

  static const std::regex number_unit(R"(^(\d+(?:\.\d+)?)\s*([a-z]*)$)", kFlags);
  std::smatch             m;
  if (!std::regex_match(text, m, number_unit)) {
    return std::nullopt;
  }

  const auto  value = ToNumber(m[1].str());
  std::string unit  = m[2].str();
  if (!value) {
    return std::nullopt;
  }
  std::transform(unit.begin(), unit.end(), unit.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (unit.empty() || unit == "s" || unit == "sec" || unit == "secs" || unit == "second" || unit == "seconds") {
    return *value;
  }
  if (unit == "ms" || unit == "millisecond" || unit == "milliseconds") {
    return *value / 1000.0;
  }
  if (unit == "m" || unit == "min" || unit == "mins" || unit == "minute" || unit == "minutes") {
    return Finite(*value * 60.0);
  }
  return std::nullopt;
}

std::vector<std::string> InstructionParser::SplitClauses(const std::string& raw) {
  const auto text = ReplaceCurlyQuotes(raw);

  // Pass 1: punctuation and newlines, outside quotes, not inside decimals.
  std::vector<std::string> sentences;
  std::string              current;
  bool                     in_quote = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '"') {
      in_quote = !in_quote;
    }
    bool separator = !in_quote && (c == ';' || c == '!' || c == '?' || c == '\n');
    if (!in_quote && c == '.') {
      const bool decimal = i > 0 && i + 1 < text.size() && std::isdigit(static_cast<unsigned char>(text[i - 1])) &&
                           std::isdigit(static_cast<unsigned char>(text[i + 1]));
      separator = !decimal;
    }
    if (separator) {
      sentences.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  sentences.push_back(current);

  // Pass 2: "then" always, "and" only before an editing verb.
  static const std::regex splitter(R"(\s*,?\s*\b(?:and\s+)?then\b\s*|\s*,?\s*\band\s+(?=(?:also\s+)?(?:)" + kEditVerbs + R"()\b))",
                                   kFlags);

  std::vector<std::string> clauses;
  for (const auto& sentence : sentences) {
    // separators inside quotes do not count, so match on a masked copy
    std::string masked   = sentence;
    bool        in_quote = false;
    for (auto& c : masked) {
      if (c == '"') {
        in_quote = !in_quote;
      } else if (in_quote) {
        c = '_';
      }
    }

    std::size_t begin = 0;
    for (std::sregex_iterator it(masked.begin(), masked.end(), splitter), end; it != end; ++it) {
      const auto pos = static_cast<std::size_t>(it->position(0));
      clauses.push_back(sentence.substr(begin, pos - begin));
      begin = pos + static_cast<std::size_t>(it->length(0));
    }
    clauses.push_back(sentence.substr(begin));
  }

  std::vector<std::string> out;
  for (auto& clause : clauses) {
    auto trimmed = TrimSpaces(clause);
    if (!trimmed.empty()) {
      out.push_back(std::move(trimmed));
    }
  }
  return out;
}

ParseResult InstructionParser::Parse(const std::string& instructions, const ParseContext& context) const {
  ParseResult result;
  if (instructions.size() > options_.max_instruction_bytes) {
    result.dropped_fragments.push_back(instructions);
    return result;
  }

  const auto tokens = Tokenize(context.transcript_text);

  for (const auto& clause : SplitClauses(instructions)) {
    // std::regex recursion grows with the input; long clauses never reach it
    if (clause.size() > options_.max_clause_bytes) {
      result.dropped_fragments.push_back(clause);
      continue;
    }
    // timing and verbs are matched outside quotes only
    const std::string unquoted = std::regex_replace(clause, Quoted(), "\"\"");

    v1::EditOperation op;
    op.set_source_clause(clause);

    auto outcome = RuleOutcome::kNoMatch;

    if (std::regex_search(unquoted, FillerRule())) {
      auto* fillers = op.mutable_remove_fillers();
      for (std::size_t i = 0; i < tokens.size();) {
        std::size_t matched = 0;
        for (const auto& filler : fillers_) {
          if (i + filler.size() <= tokens.size() &&
              std::equal(filler.begin(), filler.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i))) {
            matched = filler.size();
            break;
          }
        }
        if (matched > 0) {
          auto* range = fillers->add_words();
          range->set_begin(static_cast<uint32_t>(i));
          range->set_end(static_cast<uint32_t>(i + matched));
          i += matched;
        } else {
          ++i;
        }
      }
      outcome = RuleOutcome::kMatched;
    } else if (std::regex_search(unquoted, SilenceRule())) {
      double      gap = options_.default_silence_gap_seconds;
      std::smatch m;
      if (std::regex_search(unquoted, m, SilenceThreshold())) {
        auto parsed = ParseTime(m[1].str());
        if (parsed) {
          gap = *parsed;
        }
      }
      if (gap > 0) {
        op.mutable_remove_silence()->set_min_gap_seconds(gap);
        op.mutable_remove_silence()->set_padding_seconds(0.0);
        outcome = RuleOutcome::kMatched;
      } else {
        outcome = RuleOutcome::kUnresolved;
      }
    } else if (std::regex_search(unquoted, OverlayRule()) && std::regex_search(clause, Quoted())) {
      std::smatch quoted;
      std::regex_search(clause, quoted, Quoted());

      Range range{0.0, options_.default_overlay_seconds};
      if (auto from_to = MatchFromTo(unquoted)) {
        range = *from_to;
      } else {
        std::smatch m;
        if (std::regex_search(unquoted, m, AtTime())) {
          if (auto at = ParseTime(m[1].str())) {
            range.start = *at;
          }
        }
        double length = options_.default_overlay_seconds;
        if (std::regex_search(unquoted, m, ForDuration())) {
          if (auto len = ParseTime(m[1].str())) {
            length = *len;
          }
        }
        range.end = range.start + length;
      }

      if (ResolveRange(range, context)) {
        SetRange(op.mutable_overlay()->mutable_range(), range);
        op.mutable_overlay()->set_text(quoted[1].str());
        outcome = RuleOutcome::kMatched;
      } else {
        outcome = RuleOutcome::kUnresolved;
      }
    } else if (std::regex_search(unquoted, TrimVerb()) &&
               (std::regex_search(unquoted, TrimEdge()) || std::regex_search(unquoted, TrimFromEdge()))) {
      double head = 0.0;
      double tail = 0.0;

      for (std::sregex_iterator it(unquoted.begin(), unquoted.end(), TrimEdge()), end; it != end; ++it) {
        std::string edge = (*it)[1].str();
        std::transform(edge.begin(), edge.end(), edge.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto amount = ParseTime((*it)[2].str());
        if (!amount) {
          continue;
        }
        if (edge == "first" || edge == "opening") {
          head = *amount;
        } else {
          tail = *amount;
        }
      }
      for (std::sregex_iterator it(unquoted.begin(), unquoted.end(), TrimFromEdge()), end; it != end; ++it) {
        std::string edge = (*it)[2].str();
        std::transform(edge.begin(), edge.end(), edge.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto amount = ParseTime((*it)[1].str());
        if (!amount) {
          continue;
        }
        if (edge == "end") {
          tail = *amount;
        } else {
          head = *amount;
        }
      }

      const bool past_end = context.duration_seconds && (head >= *context.duration_seconds || tail >= *context.duration_seconds);
      if (head + tail > 0 && !past_end) {
        op.mutable_trim()->set_head_seconds(head);
        op.mutable_trim()->set_tail_seconds(tail);
        outcome = RuleOutcome::kMatched;
      } else {
        outcome = RuleOutcome::kUnresolved;
      }
    } else if (std::smatch m; std::regex_search(unquoted, m, MoveRule())) {
      constexpr auto kMaxPosition = static_cast<uint32_t>(std::numeric_limits<int32_t>::max());

      const auto from = ToIndex(m[1].str());
      int        to   = -2;
      if (m[2].matched) {
        std::string where = m[2].str();
        std::transform(where.begin(), where.end(), where.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        to = (where == "end" || where == "back") ? -1 : 0;
      } else if (const auto position = ToIndex(m[3].str()); position && *position >= 1 && *position <= kMaxPosition) {
        to = static_cast<int>(*position) - 1;
      }

      if (from && *from >= 1 && to >= -1) {
        op.mutable_reorder()->set_from_position(*from - 1);
        op.mutable_reorder()->set_to_position(to);
        outcome = RuleOutcome::kMatched;
      } else {
        outcome = RuleOutcome::kUnresolved;
      }
    } else if (std::regex_search(unquoted, SpeedRule())) {
      const bool up   = std::regex_search(unquoted, SpeedUp());
      const bool down = !up && std::regex_search(unquoted, SlowDown());

      std::optional<double> speed;
      std::smatch           m;
      if (std::regex_search(unquoted, m, Percent())) {
        if (const auto pct = ToNumber(m[1].str())) {
          if (up) {
            speed = 1.0 + *pct / 100.0;
          } else if (down) {
            speed = 1.0 - *pct / 100.0;
          }
        }
      } else if (std::regex_search(unquoted, m, Multiplier())) {
        if (const auto factor = ToNumber(m[1].str()); factor && *factor > 0) {
          speed = (down && *factor > 1.0) ? 1.0 / *factor : *factor;
        }
      } else if (up) {
        speed = 1.25;
      } else if (down) {
        speed = 0.75;
      }

      bool resolved = speed && *speed >= kMinSpeed && *speed <= kMaxSpeed;
      if (resolved) {
        auto* pacing = op.mutable_adjust_pacing();
        pacing->set_speed(*speed);
        if (auto range = MatchFromTo(unquoted)) {
          resolved = ResolveRange(*range, context);
          SetRange(pacing->mutable_range(), *range);
        }
      }
      outcome = resolved ? RuleOutcome::kMatched : RuleOutcome::kUnresolved;
    } else if (std::regex_search(unquoted, PacingRule())) {
      op.mutable_adjust_pacing()->set_speed(1.15);
      outcome = RuleOutcome::kMatched;
    } else if (std::smatch m; std::regex_search(unquoted, m, RangeCutRule())) {
      auto start = ParseTime(m[1].str());
      auto end   = ParseTime(m[2].str());
      if (start && end) {
        Range range{*start, *end};
        if (ResolveRange(range, context)) {
          SetRange(op.mutable_cut()->mutable_range(), range);
          outcome = RuleOutcome::kMatched;
        } else {
          outcome = RuleOutcome::kUnresolved;
        }
      } else {
        outcome = RuleOutcome::kUnresolved;
      }
    } else if (std::smatch m; std::regex_search(clause, m, PhraseCutRule())) {
      const auto occurrences = FindSequence(tokens, Tokenize(m[1].str()));
      for (const auto& [begin, end] : occurrences) {
        auto* range = op.mutable_cut()->add_words();
        range->set_begin(begin);
        range->set_end(end);
      }
      outcome = occurrences.empty() ? RuleOutcome::kUnresolved : RuleOutcome::kMatched;
    }

    if (outcome == RuleOutcome::kMatched) {
      result.operations.push_back(std::move(op));
    } else {
      result.dropped_fragments.push_back(clause);
    }
  }

  return result;
}

} // namespace longform::core
