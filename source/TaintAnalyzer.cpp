/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include <taint-engine/Assert.h>
#include <taint-engine/Compiler.h>
#include <taint-engine/FragmentScanner.h>
#include <taint-engine/Log.h>
#include <taint-engine/PatternRecognizer.h>
#include <taint-engine/TaintAnalyzer.h>
#include <taint-engine/TaintLevelDomain.h>
#include <taint-engine/TaintPropagation.h>

namespace taintengine {

namespace {

using Value = TaintedValue<std::string>;

bool is_identifier_start(char character) {
  return std::isalpha(static_cast<unsigned char>(character)) ||
      character == '_' || character == '$';
}

bool is_identifier_character(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) ||
      character == '_' || character == '$';
}

bool is_space(char character) {
  return std::isspace(static_cast<unsigned char>(character));
}

/* Name of a matched expression, without call parenthesis or assignment. */
std::string occurrence_name(std::string_view text) {
  auto begin = text.find_first_not_of(" \t\r\n.");
  auto end = text.find_last_not_of(" \t\r\n(=");
  if (begin == std::string_view::npos || end == std::string_view::npos ||
      end < begin) {
    return std::string(text);
  }
  return std::string(text.substr(begin, end - begin + 1));
}

/* A source occurrence or a use of a tainted variable. */
struct Operand {
  std::size_t offset;
  std::string name;
  // Level before applying the sanitizers of the current range.
  TaintLevel raw_level;
  // Value after applying the sanitizers of the current range.
  Value value;

  bool sanitized() const {
    return value.metadata() && !value.metadata()->sanitizers().empty();
  }
};

struct SanitizerCall {
  std::string name;
  std::size_t offset;
  std::size_t open;
  std::size_t close;
  Sanitizer sanitizer;
  Position position;
};

struct Sink {
  std::string name;
  std::size_t offset;
  SecuritySink kind;
  // Range of the arguments reaching the sink.
  std::size_t begin;
  std::size_t end;
  Position position;
};

struct Assignment {
  std::string variable;
  std::size_t offset;
  std::size_t right_hand_side;
  bool compound;
};

/* Pick the first operand with the highest level among those selected. */
template <typename Predicate>
const Operand* TE_NULLABLE highest(
    const std::vector<Operand>& operands,
    Predicate&& predicate) {
  const Operand* highest = nullptr;
  for (const auto& operand : operands) {
    if (!predicate(operand)) {
      continue;
    }
    if (highest == nullptr ||
        compare_taint_levels(operand.value.level(), highest->value.level()) >
            0) {
      highest = &operand;
    }
  }
  return highest;
}

class FragmentAnalysis final {
 public:
  FragmentAnalysis(
      std::string_view fragment,
      const FragmentScanner& scanner,
      const Recognizer& recognizer)
      : fragment_(fragment), scanner_(scanner), recognizer_(recognizer) {}

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(FragmentAnalysis)

  AnalysisResult run() {
    const auto& masked = scanner_.masked();

    sources_ = recognizer_.sources(masked);
    for (const auto& source : sources_) {
      result_.sources.push_back(RecognizedSource{
          .name = name_at(source.offset, source.length),
          .kind = source.kind,
          .level = source.level,
          .position = Position::from_offset(fragment_, source.offset),
      });
    }

    for (const auto& occurrence : recognizer_.sanitizers(masked)) {
      auto call = sanitizer_call(occurrence);
      if (!call) {
        continue;
      }
      result_.sanitizers.push_back(RecognizedSanitizer{
          .name = call->name,
          .type = call->sanitizer.type(),
          .effectiveness = call->sanitizer.effectiveness(),
          .position = call->position,
      });
      sanitizer_calls_.push_back(std::move(*call));
    }

    for (const auto& occurrence : recognizer_.sinks(masked)) {
      auto sink = make_sink(occurrence);
      if (!sink) {
        continue;
      }
      result_.sinks.push_back(RecognizedSink{
          .name = sink->name,
          .kind = sink->kind,
          .position = sink->position,
      });
      sinks_.push_back(std::move(*sink));
    }

    LOG(2,
        "Found {} sources, {} sanitizer calls and {} sinks in {} statements.",
        result_.sources.size(),
        result_.sanitizers.size(),
        result_.sinks.size(),
        scanner_.statements().size());

    for (const auto& statement : scanner_.statements()) {
      analyze_statement(statement);
    }

    LOG(2,
        "Found {} violations and {} coverage gaps.",
        result_.violations.size(),
        result_.coverage_gaps.size());
    return std::move(result_);
  }

 private:
  std::string name_at(std::size_t offset, std::size_t length) const {
    return occurrence_name(fragment_.substr(offset, length));
  }

  std::optional<std::size_t> call_parenthesis(std::size_t end) const {
    const auto& masked = scanner_.masked();
    if (end > 0 && masked[end - 1] == '(') {
      return end - 1;
    }
    while (end < masked.size() && is_space(masked[end])) {
      end++;
    }
    if (end < masked.size() && masked[end] == '(') {
      return end;
    }
    return std::nullopt;
  }

  std::optional<SanitizerCall> sanitizer_call(
      const SanitizerOccurrence& occurrence) const {
    auto open = call_parenthesis(occurrence.offset + occurrence.length);
    if (!open) {
      return std::nullopt;
    }
    auto close = scanner_.matching_parenthesis(*open);
    if (!close) {
      return std::nullopt;
    }
    return SanitizerCall{
        .name = name_at(occurrence.offset, *open - occurrence.offset),
        .offset = occurrence.offset,
        .open = *open,
        .close = *close,
        .sanitizer = occurrence.sanitizer,
        .position = Position::from_offset(fragment_, occurrence.offset),
    };
  }

  const Statement* TE_NULLABLE statement_at(std::size_t offset) const {
    for (const auto& statement : scanner_.statements()) {
      if (statement.begin <= offset && offset < statement.end) {
        return &statement;
      }
    }
    return nullptr;
  }

  std::optional<Sink> make_sink(const SinkOccurrence& occurrence) const {
    const auto* statement = statement_at(occurrence.offset);
    if (statement == nullptr) {
      return std::nullopt;
    }

    auto end = occurrence.offset + occurrence.length;
    std::size_t begin = end;
    std::size_t arguments_end = statement->end;
    const auto& masked = scanner_.masked();
    if (masked[end - 1] == '(') {
      auto close = scanner_.matching_parenthesis(end - 1);
      if (!close) {
        return std::nullopt;
      }
      arguments_end = *close;
    }

    return Sink{
        .name = name_at(occurrence.offset, occurrence.length),
        .offset = occurrence.offset,
        .kind = occurrence.kind,
        .begin = begin,
        .end = arguments_end,
        .position = Position::from_offset(fragment_, occurrence.offset),
    };
  }

  void add_flow(
      std::string from,
      std::string to,
      TaintLevel level,
      Position position) {
    auto flow = TaintFlow{
        .from = std::move(from),
        .to = std::move(to),
        .level = level,
        .position = position,
    };
    if (std::find(result_.flows.begin(), result_.flows.end(), flow) ==
        result_.flows.end()) {
      result_.flows.push_back(std::move(flow));
    }
  }

  /**
   * Collect the tainted operands within [begin, end): source occurrences and
   * uses of tainted variables. The sanitizer calls of the range wrapping an
   * operand are applied to it, innermost first.
   */
  std::vector<Operand> collect_operands(std::size_t begin, std::size_t end) {
    auto operands = find_operands(begin, end);
    for (auto& operand : operands) {
      apply_sanitizers(operand, begin, end);
    }
    return operands;
  }

  /* Record the flows into the sanitizer calls within [begin, end). */
  void record_sanitizer_flows(std::size_t begin, std::size_t end) {
    for (auto& operand : find_operands(begin, end)) {
      apply_sanitizers(operand, begin, end);
    }
  }

  /* Unsanitized operands within [begin, end), by offset. */
  std::vector<Operand> find_operands(std::size_t begin, std::size_t end) const {
    std::vector<Operand> operands;

    for (const auto& source : sources_) {
      if (source.offset < begin || source.offset >= end ||
          TaintLattice::is_bottom(source.level)) {
        continue;
      }
      auto name = name_at(source.offset, source.length);
      operands.push_back(Operand{
          .offset = source.offset,
          .name = name,
          .raw_level = source.level,
          .value = Value(
              name,
              source.level,
              source.kind,
              TaintMetadata(/* confidence */ 1.0, {source.kind})),
      });
    }

    const auto& masked = scanner_.masked();
    for (auto index = begin; index < end;) {
      if (!is_identifier_start(masked[index]) ||
          (index > 0 && is_identifier_character(masked[index - 1]))) {
        index++;
        continue;
      }
      auto identifier_end = index;
      while (identifier_end < end &&
             is_identifier_character(masked[identifier_end])) {
        identifier_end++;
      }
      auto identifier = masked.substr(index, identifier_end - index);
      bool is_property = index > 0 && masked[index - 1] == '.';
      auto variable = variables_.find(identifier);
      if (!is_property && variable != variables_.end() &&
          !within_source(index)) {
        operands.push_back(Operand{
            .offset = index,
            .name = identifier,
            .raw_level = variable->second.level(),
            .value = variable->second,
        });
      }
      index = identifier_end;
    }

    std::sort(
        operands.begin(),
        operands.end(),
        [](const Operand& left, const Operand& right) {
          return left.offset < right.offset;
        });
    return operands;
  }

  bool within_source(std::size_t offset) const {
    return std::any_of(
        sources_.begin(), sources_.end(), [offset](const auto& source) {
          return source.offset <= offset &&
              offset < source.offset + source.length;
        });
  }

  void apply_sanitizers(Operand& operand, std::size_t begin, std::size_t end) {
    std::vector<const SanitizerCall*> calls;
    for (const auto& call : sanitizer_calls_) {
      if (call.offset >= begin && call.close < end &&
          call.open < operand.offset && operand.offset < call.close) {
        calls.push_back(&call);
      }
    }
    // Innermost calls open last.
    std::sort(
        calls.begin(), calls.end(), [](const auto* left, const auto* right) {
          return left->open > right->open;
        });

    auto from = operand.name;
    for (const auto* call : calls) {
      auto input_level = operand.value.level();
      if (TaintLattice::is_bottom(input_level)) {
        break;
      }
      add_flow(from, call->name, input_level, call->position);
      operand.value = call->sanitizer.sanitize(operand.value);
      from = call->name;
    }
  }

  std::optional<Assignment> find_assignment(const Statement& statement) const {
    const auto& masked = scanner_.masked();
    int depth = 0;
    for (auto index = statement.begin; index < statement.end; index++) {
      char character = masked[index];
      if (character == '(' || character == '[' || character == '{') {
        depth++;
        continue;
      } else if (character == ')' || character == ']' || character == '}') {
        depth--;
        continue;
      } else if (character != '=' || depth != 0) {
        continue;
      }

      char next = index + 1 < statement.end ? masked[index + 1] : '\0';
      char previous = index > statement.begin ? masked[index - 1] : '\0';
      if (next == '=' || next == '>') {
        index++;
        continue;
      }
      if (previous == '=' || previous == '!' || previous == '<' ||
          previous == '>') {
        continue;
      }

      bool compound = std::string_view("+-*/%&|^").find(previous) !=
              std::string_view::npos &&
          previous != '\0';
      auto cursor = compound ? index - 1 : index;
      while (cursor > statement.begin && is_space(masked[cursor - 1])) {
        cursor--;
      }
      auto identifier_end = cursor;
      while (cursor > statement.begin &&
             is_identifier_character(masked[cursor - 1])) {
        cursor--;
      }
      if (cursor == identifier_end || !is_identifier_start(masked[cursor]) ||
          (cursor > statement.begin && masked[cursor - 1] == '.')) {
        return std::nullopt;
      }

      return Assignment{
          .variable = masked.substr(cursor, identifier_end - cursor),
          .offset = cursor,
          .right_hand_side = index + 1,
          .compound = compound,
      };
    }
    return std::nullopt;
  }

  void analyze_statement(const Statement& statement) {
    record_sanitizer_flows(statement.begin, statement.end);

    for (const auto& sink : sinks_) {
      if (statement.begin <= sink.offset && sink.offset < statement.end) {
        analyze_sink(sink);
      }
    }

    if (auto assignment = find_assignment(statement)) {
      analyze_assignment(*assignment, statement);
    }
  }

  void analyze_sink(const Sink& sink) {
    auto operands = collect_operands(sink.begin, sink.end);

    if (sink.kind == SecuritySink::DynamicCodeExecution) {
      analyze_code_execution(sink, operands);
      return;
    }

    auto reaching = TaintLevelDomain::bottom();
    for (const auto& operand : operands) {
      if (operand.value.is_tainted()) {
        reaching.join_with(TaintLevelDomain(operand.value.level()));
        add_flow(
            operand.name, sink.name, operand.value.level(), sink.position);
      }
    }
    LOG(4,
        "Sink `{}` at {} is reached at level {}.",
        sink.name,
        sink.position.to_string(),
        TaintLattice::to_string(reaching.level()));
    if (reaching.is_bottom()) {
      return;
    }

    const auto* unsanitized = highest(operands, [](const Operand& operand) {
      return operand.value.is_tainted() && !operand.sanitized();
    });
    if (unsanitized != nullptr) {
      te_assert(unsanitized->value.source().has_value());
      auto source = *unsanitized->value.source();
      result_.violations.push_back(TaintViolation{
          .severity = violation_severity(sink.kind, source),
          .message = fmt::format(
              "Tainted data from `{}` ({}) reaches {} `{}` without sanitization",
              unsanitized->name,
              taint_source_to_string(source),
              security_sink_description(sink.kind),
              sink.name),
          .position = sink.position,
          .sink = sink.kind,
          .source = source,
      });
      LOG(3, "Violation: {}", result_.violations.back().message);
      return;
    }

    const auto* residual = highest(operands, [](const Operand& operand) {
      return operand.value.is_tainted();
    });
    result_.coverage_gaps.push_back(CoverageGap{
        .message = fmt::format(
            "Sanitization of `{}` before {} `{}` leaves taint level {}",
            residual->name,
            security_sink_description(sink.kind),
            sink.name,
            TaintLattice::to_string(residual->value.level())),
        .sink = sink.kind,
        .residual_level = residual->value.level(),
        .position = sink.position,
    });
    LOG(3, "Coverage gap: {}", result_.coverage_gaps.back().message);
  }

  // Sanitizers do not make executing tainted data safe.
  void analyze_code_execution(
      const Sink& sink,
      const std::vector<Operand>& operands) {
    const Operand* tainted = nullptr;
    for (const auto& operand : operands) {
      if (TaintLattice::is_bottom(operand.raw_level)) {
        continue;
      }
      add_flow(operand.name, sink.name, operand.raw_level, sink.position);
      if (tainted == nullptr ||
          compare_taint_levels(operand.raw_level, tainted->raw_level) > 0) {
        tainted = &operand;
      }
    }
    if (tainted == nullptr) {
      return;
    }

    std::optional<TaintSource> source;
    if (auto sanitized_source = tainted->value.source()) {
      source = sanitized_source;
    } else if (tainted->value.metadata() &&
               !tainted->value.metadata()->sources().empty()) {
      source = *tainted->value.metadata()->sources().begin();
    }

    result_.violations.push_back(TaintViolation{
        .severity = Severity::Critical,
        .message = fmt::format(
            "Direct execution of tainted data: `{}` flows into `{}`",
            tainted->name,
            sink.name),
        .position = sink.position,
        .sink = sink.kind,
        .source = source,
    });
    LOG(3, "Violation: {}", result_.violations.back().message);
  }

  void analyze_assignment(
      const Assignment& assignment,
      const Statement& statement) {
    auto operands = collect_operands(assignment.right_hand_side, statement.end);

    std::vector<Value> values;
    auto previous = variables_.find(assignment.variable);
    if (assignment.compound && previous != variables_.end()) {
      values.push_back(previous->second);
    }

    auto position = Position::from_offset(fragment_, assignment.offset);
    for (const auto& operand : operands) {
      if (!operand.value.is_tainted()) {
        continue;
      }
      add_flow(
          operand.name,
          assignment.variable,
          operand.value.level(),
          position);
      values.push_back(operand.value);
    }

    if (values.empty()) {
      if (previous != variables_.end()) {
        LOG(4, "Variable `{}` is no longer tainted.", assignment.variable);
        variables_.erase(previous);
      }
      return;
    }

    auto value = TaintPropagation::propagate(
        fmt::format("assignment to `{}`", assignment.variable),
        values,
        [](const std::string& left, const std::string& right) {
          return left + " + " + right;
        });
    LOG(4,
        "Variable `{}` is tainted at level {}.",
        assignment.variable,
        TaintLattice::to_string(value.level()));
    variables_.insert_or_assign(assignment.variable, std::move(value));
  }

 private:
  std::string_view fragment_;
  const FragmentScanner& scanner_;
  const Recognizer& recognizer_;

  std::vector<SourceOccurrence> sources_;
  std::vector<SanitizerCall> sanitizer_calls_;
  std::vector<Sink> sinks_;
  std::unordered_map<std::string, Value> variables_;
  AnalysisResult result_;
};

} // namespace

TaintAnalyzer::TaintAnalyzer()
    : TaintAnalyzer(RecognizerConfig::defaults()) {}

TaintAnalyzer::TaintAnalyzer(const RecognizerConfig& config)
    : recognizer_(std::make_unique<PatternRecognizer>(config)) {}

TaintAnalyzer::TaintAnalyzer(std::unique_ptr<Recognizer> recognizer)
    : recognizer_(std::move(recognizer)) {
  te_assert(recognizer_ != nullptr);
}

AnalysisResult TaintAnalyzer::analyze(std::string_view fragment) const {
  FragmentScanner scanner(fragment);
  if (!scanner.tokenizable()) {
    WARNING(1, "Analysis is inconclusive: {}", *scanner.error());
    return AnalysisResult::make_inconclusive(*scanner.error());
  }

  return FragmentAnalysis(fragment, scanner, *recognizer_).run();
}

} // namespace taintengine
