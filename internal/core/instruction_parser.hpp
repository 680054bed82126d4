#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "longform/editor/v1.hpp"

namespace longform::core {

struct ParserOptions {
  std::vector<std::string> filler_words;
  double                   default_silence_gap_seconds = 0.75;
  double                   default_overlay_seconds     = 3.0;
  // Whole instruction text. The compiler rejects anything longer.
  std::size_t max_instruction_bytes = 16 * 1024;
  // Longer clauses are dropped without being matched.
  std::size_t max_clause_bytes = 1024;
};

// What the instructions are resolved against.
struct ParseContext {
  // Whitespace-joined transcript words; token i is word i.
  std::string transcript_text;
  // Known media duration. Unset disables upper-bound range checks.
  std::optional<double> duration_seconds;
};

struct ParseResult {
  std::vector<longform::editor::v1::EditOperation> operations;
  // Clauses that matched no rule or could not be resolved.
  std::vector<std::string> dropped_fragments;
};

/*
  InstructionParser

  Deterministic rule engine turning free-form editing instructions into
  edit operations. Stateless after construction, safe to share between
  threads.

  Supported phrasing, one rule per clause:

    remove filler words
    remove silences longer than 1.5 seconds
    cut from 1:05 to 1:20              (also "between X and Y", "X-Y")
    cut "exact phrase"
    trim the first 5 seconds / cut the last 10s
    move segment 3 to the start        (also "to the end", "to 2")
    add text "Hello" at 0:05 for 4 seconds
    speed up by 20% / slow down to 0.5x [from X to Y]
    tighten the pacing
*/
class InstructionParser {
 public:
  explicit InstructionParser(ParserOptions options);

  // Never throws on instruction text. Input over max_instruction_bytes is
  // returned whole as a single dropped fragment.
  ParseResult Parse(const std::string& instructions, const ParseContext& context) const;

  const ParserOptions& Options() const {
    return options_;
  }

  // Splits on sentence punctuation, newlines and "then"; "and" only when it
  // starts a new editing verb. Quoted text is never split.
  static std::vector<std::string> SplitClauses(const std::string& instructions);

  // "hh:mm:ss(.f)", "mm:ss(.f)" or a number with optional unit. Seconds.
  static std::optional<double> ParseTime(const std::string& text);

  static std::vector<std::string> DefaultFillerWords();

 private:
  ParserOptions                         options_;
  std::vector<std::vector<std::string>> fillers_;
};

} // namespace longform::core
