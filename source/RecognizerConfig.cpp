/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>

#include <taint-engine/JsonValidation.h>
#include <taint-engine/Log.h>
#include <taint-engine/RE2.h>
#include <taint-engine/RecognizerConfig.h>

namespace taintengine {

namespace {

std::string validated_pattern(const Json::Value& value) {
  auto pattern = JsonValidation::string(value, /* field */ "pattern");
  try {
    (void)compile_regex(pattern);
  } catch (const std::invalid_argument& error) {
    WARNING(1, "{}", error.what());
    throw JsonValidationError(
        value,
        /* field */ "pattern",
        /* expected */ "a valid regular expression");
  }
  return pattern;
}

SourcePattern source_pattern_from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  JsonValidation::check_unexpected_members(value, {"pattern", "kind", "level"});

  auto pattern = validated_pattern(value);

  auto kind = taint_source_from_string(
      JsonValidation::string(value, /* field */ "kind"));
  if (!kind) {
    throw JsonValidationError(
        value, /* field */ "kind", /* expected */ "a valid taint source");
  }

  auto level = TaintLevel::PossiblyTainted;
  if (auto level_string =
          JsonValidation::optional_string(value, /* field */ "level")) {
    auto parsed_level = taint_level_from_string(*level_string);
    if (!parsed_level || TaintLattice::is_bottom(*parsed_level)) {
      throw JsonValidationError(
          value,
          /* field */ "level",
          /* expected */ "a taint level above `untainted`");
    }
    level = *parsed_level;
  }

  return SourcePattern{
      .pattern = std::move(pattern), .kind = *kind, .level = level};
}

SanitizerPattern sanitizer_pattern_from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  JsonValidation::check_unexpected_members(
      value, {"pattern", "type", "effectiveness"});

  auto pattern = validated_pattern(value);

  auto sanitizer_value = Json::Value(Json::objectValue);
  sanitizer_value["type"] = value["type"];
  if (value.isMember("effectiveness")) {
    sanitizer_value["effectiveness"] = value["effectiveness"];
  }

  return SanitizerPattern{
      .pattern = std::move(pattern),
      .sanitizer = Sanitizer::from_json(sanitizer_value),
  };
}

SinkPattern sink_pattern_from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  JsonValidation::check_unexpected_members(value, {"pattern", "kind"});

  auto pattern = validated_pattern(value);

  auto kind = security_sink_from_string(
      JsonValidation::string(value, /* field */ "kind"));
  if (!kind) {
    throw JsonValidationError(
        value, /* field */ "kind", /* expected */ "a valid security sink");
  }

  return SinkPattern{.pattern = std::move(pattern), .kind = *kind};
}

} // namespace

RecognizerConfig RecognizerConfig::defaults() {
  RecognizerConfig config;

  // Sources
  config.add_source({R"re(\buserInput\b)re", TaintSource::UserInput});
  config.add_source(
      {R"re(\breq(?:uest)?\.(?:query|params|body|headers|cookies)\b)re",
       TaintSource::UserInput});
  config.add_source(
      {R"re(\b(?:getUserInput|getInput|readUserInput)\b)re",
       TaintSource::UserInput});
  config.add_source(
      {R"re(\bwindow\.location\b|\bdocument\.(?:URL|referrer|cookie)\b)re",
       TaintSource::UserInput});
  config.add_source(
      {R"re(\bprocess\.env\b|\b(?:std::)?getenv\b)re",
       TaintSource::Environment});
  config.add_source(
      {R"re(\b(?:fetch|axios(?:\.\w+)?)\s*\()re", TaintSource::ExternalApi});
  config.add_source(
      {R"re(\bsocket\.(?:recv|read)\b)re", TaintSource::Network});
  config.add_source(
      {R"re(\bfs\.readFile(?:Sync)?\b)re", TaintSource::FileSystem});
  config.add_source(
      {R"re(\bcursor\.fetch(?:one|all|many)\b)re", TaintSource::Database});

  // Sanitizers
  config.add_sanitizer(
      {R"re(\b(?:escapeHtml|escapeHTML|htmlEscape|_\.escape|he\.encode)\b)re",
       Sanitizer(SanitizerType::HtmlEscape)});
  config.add_sanitizer(
      {R"re(\b(?:escapeSql|sqlEscape|mysql\.escape|escapeString)\b)re",
       Sanitizer(SanitizerType::SqlEscape)});
  config.add_sanitizer(
      {R"re(\bvalidate\w*)re", Sanitizer(SanitizerType::InputValidation)});
  config.add_sanitizer(
      {R"re(\b(?:parseInt|parseFloat|Number|std::sto(?:i|l|d))\b)re",
       Sanitizer(SanitizerType::TypeConversion)});
  config.add_sanitizer(
      {R"re(\b(?:sanitize\w*|encodeURIComponent|encodeURI)\b)re",
       Sanitizer(SanitizerType::StringSanitize)});
  config.add_sanitizer(
      {R"re(\bJSON\.parse\b)re", Sanitizer(SanitizerType::JsonParse)});
  config.add_sanitizer(
      {R"re(\b(?:sha256|sha1|md5|hash)\b)re",
       Sanitizer(SanitizerType::CryptoHash)});

  // Sinks
  config.add_sink(
      {R"re(\b(?:\w+\.)*(?:query|execute|executeQuery|raw)\s*\()re",
       SecuritySink::DatabaseQuery});
  config.add_sink(
      {R"re(\bdocument\.write(?:ln)?\s*\()re", SecuritySink::HtmlOutput});
  config.add_sink({R"re(\bres\.(?:send|write)\s*\()re", SecuritySink::HtmlOutput});
  config.add_sink(
      {R"re(\.(?:innerHTML|outerHTML)\s*=)re", SecuritySink::HtmlOutput});
  config.add_sink({R"re(\beval\s*\()re", SecuritySink::DynamicCodeExecution});
  config.add_sink(
      {R"re(\bnew\s+Function\s*\()re", SecuritySink::DynamicCodeExecution});
  // Bare calls and `child_process` calls only, `/re/.exec(x)` is a regex.
  config.add_sink(
      {R"re((?:^|[^.\w$])((?:(?:child_process|cp)\.)?)re"
       R"re((?:exec|execSync|spawn|system|popen)\s*\())re",
       SecuritySink::SystemCommand});
  config.add_sink(
      {R"re(\b(?:writeFile|writeFileSync|appendFile|appendFileSync)\s*\()re",
       SecuritySink::FileWrite});
  config.add_sink(
      {R"re(\b(?:expect|assert)\s*\()re", SecuritySink::TestAssertion});

  return config;
}

RecognizerConfig RecognizerConfig::from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  JsonValidation::check_unexpected_members(
      value, {"include_defaults", "sources", "sanitizers", "sinks"});

  auto config = JsonValidation::optional_boolean(
                    value,
                    /* field */ "include_defaults",
                    /* default_value */ true)
      ? RecognizerConfig::defaults()
      : RecognizerConfig();

  for (const auto& source :
       JsonValidation::null_or_array(value, /* field */ "sources")) {
    config.add_source(source_pattern_from_json(source));
  }
  for (const auto& sanitizer :
       JsonValidation::null_or_array(value, /* field */ "sanitizers")) {
    config.add_sanitizer(sanitizer_pattern_from_json(sanitizer));
  }
  for (const auto& sink :
       JsonValidation::null_or_array(value, /* field */ "sinks")) {
    config.add_sink(sink_pattern_from_json(sink));
  }

  LOG(2,
      "Configured {} source, {} sanitizer and {} sink patterns.",
      config.sources_.size(),
      config.sanitizers_.size(),
      config.sinks_.size());
  return config;
}

void RecognizerConfig::add_source(SourcePattern pattern) {
  sources_.push_back(std::move(pattern));
}

void RecognizerConfig::add_sanitizer(SanitizerPattern pattern) {
  sanitizers_.push_back(std::move(pattern));
}

void RecognizerConfig::add_sink(SinkPattern pattern) {
  sinks_.push_back(std::move(pattern));
}

void RecognizerConfig::extend(const RecognizerConfig& other) {
  sources_.insert(sources_.end(), other.sources_.begin(), other.sources_.end());
  sanitizers_.insert(
      sanitizers_.end(), other.sanitizers_.begin(), other.sanitizers_.end());
  sinks_.insert(sinks_.end(), other.sinks_.begin(), other.sinks_.end());
}

Json::Value RecognizerConfig::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["include_defaults"] = Json::Value(false);

  auto sources = Json::Value(Json::arrayValue);
  for (const auto& source : sources_) {
    auto source_value = Json::Value(Json::objectValue);
    source_value["pattern"] = Json::Value(source.pattern);
    source_value["kind"] =
        Json::Value(std::string(taint_source_to_string(source.kind)));
    source_value["level"] =
        Json::Value(std::string(taint_level_to_json_string(source.level)));
    sources.append(source_value);
  }
  value["sources"] = sources;

  auto sanitizers = Json::Value(Json::arrayValue);
  for (const auto& sanitizer : sanitizers_) {
    auto sanitizer_value = sanitizer.sanitizer.to_json();
    sanitizer_value["pattern"] = Json::Value(sanitizer.pattern);
    sanitizers.append(sanitizer_value);
  }
  value["sanitizers"] = sanitizers;

  auto sinks = Json::Value(Json::arrayValue);
  for (const auto& sink : sinks_) {
    auto sink_value = Json::Value(Json::objectValue);
    sink_value["pattern"] = Json::Value(sink.pattern);
    sink_value["kind"] =
        Json::Value(std::string(security_sink_to_string(sink.kind)));
    sinks.append(sink_value);
  }
  value["sinks"] = sinks;

  return value;
}

} // namespace taintengine
