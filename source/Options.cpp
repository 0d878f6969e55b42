/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>

#include <taint-engine/Log.h>
#include <taint-engine/Options.h>

namespace taintengine {

namespace {

std::string check_path_exists(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    throw std::invalid_argument(fmt::format("File `{}` does not exist.", path));
  }
  return path;
}

std::optional<std::string> optional_path(
    const boost::program_options::variables_map& variables,
    const std::string& name) {
  if (!variables.count(name)) {
    return std::nullopt;
  }
  return variables[name].as<std::string>();
}

} // namespace

Options::Options(
    std::string fragment_path,
    std::optional<std::string> config_path,
    std::optional<std::string> output_path,
    int verbosity)
    : fragment_path_(std::move(fragment_path)),
      config_path_(std::move(config_path)),
      output_path_(std::move(output_path)),
      verbosity_(verbosity) {}

namespace program_options = boost::program_options;

Options::Options(const program_options::variables_map& variables)
    : fragment_path_(variables["fragment"].as<std::string>()),
      config_path_(optional_path(variables, "config")),
      output_path_(optional_path(variables, "output")),
      verbosity_(
          variables.count("verbosity") ? variables["verbosity"].as<int>()
                                       : 0) {
  if (!read_from_stdin()) {
    check_path_exists(fragment_path_);
  }
  if (config_path_) {
    check_path_exists(*config_path_);
  }
  if (verbosity_ < 0) {
    throw std::invalid_argument(
        fmt::format("Verbosity `{}` must be positive.", verbosity_));
  }
}

void Options::add_options(program_options::options_description& options) {
  options.add_options()(
      "fragment,f",
      program_options::value<std::string>()->required(),
      "Path to the code fragment to analyze, `-` to read the standard "
      "input.")(
      "config,c",
      program_options::value<std::string>(),
      "Path to a JSON file with additional source, sanitizer and sink "
      "patterns.")(
      "output,o",
      program_options::value<std::string>(),
      "Path to the JSON file to write the result to. Defaults to the "
      "standard output.")(
      "verbosity,v",
      program_options::value<int>(),
      "Logging verbosity, between 0 and 5.");
}

const std::string& Options::fragment_path() const {
  return fragment_path_;
}

const std::optional<std::string>& Options::config_path() const {
  return config_path_;
}

const std::optional<std::string>& Options::output_path() const {
  return output_path_;
}

int Options::verbosity() const {
  return verbosity_;
}

bool Options::read_from_stdin() const {
  return fragment_path_ == "-";
}

std::string Options::read_fragment() const {
  if (read_from_stdin()) {
    LOG(2, "Reading fragment from the standard input...");
    return std::string(
        std::istreambuf_iterator<char>(std::cin),
        std::istreambuf_iterator<char>());
  }

  LOG(2, "Reading fragment from `{}`...", fragment_path_);
  std::ifstream file(fragment_path_, std::ios::binary);
  if (!file) {
    throw std::runtime_error(
        fmt::format("Unable to open `{}`.", fragment_path_));
  }
  return std::string(
      std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace taintengine
