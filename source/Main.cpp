/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <exception>
#include <iostream>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <taint-engine/Debug.h>
#include <taint-engine/ExitCode.h>
#include <taint-engine/JsonReaderWriter.h>
#include <taint-engine/JsonValidation.h>
#include <taint-engine/Log.h>
#include <taint-engine/Options.h>
#include <taint-engine/RecognizerConfig.h>
#include <taint-engine/TaintAnalyzer.h>

int main(int argc, char* argv[]) {
  namespace program_options = boost::program_options;
  program_options::options_description options;
  options.add_options()("help,h", "Show help dialog.");
  taintengine::Options::add_options(options);

  try {
    program_options::variables_map variables;
    program_options::store(
        program_options::parse_command_line(argc, argv, options), variables);
    if (variables.count("help")) {
      std::cerr << options;
      return ExitCode::success();
    }
    if (!variables.count("fragment")) {
      std::cerr << "error: missing parameter `--fragment`.\n";
      std::cerr << "Usage: " << argv[0]
                << " --fragment <path> [--config <json_config_file>]\n";
      return ExitCode::invalid_argument_error("No fragment provided.");
    }
    program_options::notify(variables);

    auto tool_options = taintengine::Options(variables);
    taintengine::Logger::set_level(tool_options.verbosity());

    auto config = taintengine::RecognizerConfig::defaults();
    if (const auto& config_path = tool_options.config_path()) {
      LOG(1, "Reading configuration from `{}`...", *config_path);
      config = taintengine::RecognizerConfig::from_json(
          taintengine::JsonReader::parse_json_file(*config_path));
    }

    auto analyzer = taintengine::TaintAnalyzer(config);
    auto result = analyzer.analyze(tool_options.read_fragment());

    auto value = result.to_json();
    if (const auto& output_path = tool_options.output_path()) {
      LOG(1, "Writing result to `{}`.", *output_path);
      taintengine::JsonWriter::write_json_file(*output_path, value);
    } else {
      std::cout << taintengine::JsonWriter::to_styled_string(value)
                << std::endl;
    }

    if (result.inconclusive) {
      return ExitCode::inconclusive(fmt::format(
          "Analysis is inconclusive: {}",
          result.inconclusive_reason.value_or("unknown reason")));
    }
  } catch (const program_options::error& exception) {
    return ExitCode::invalid_argument_error(exception.what());
  } catch (const taintengine::JsonValidationError& exception) {
    return ExitCode::invalid_argument_error(exception.what());
  } catch (const taintengine::AssertionError& exception) {
    taintengine::print_exception_backtrace(std::cerr, exception);
    return ExitCode::analysis_error(exception.what());
  } catch (const std::invalid_argument& exception) {
    return ExitCode::invalid_argument_error(exception.what());
  } catch (const std::runtime_error& exception) {
    return ExitCode::error(exception.what());
  } catch (const std::logic_error& exception) {
    return ExitCode::analysis_error(exception.what());
  } catch (const std::exception& exception) {
    return ExitCode::error(exception.what());
  }

  return ExitCode::success();
}
