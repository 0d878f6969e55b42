/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>

#include <boost/program_options.hpp>

#include <taint-engine/IncludeMacros.h>

namespace taintengine {

/**
 * Command line options of the `taint-engine` driver.
 */
class Options final {
 public:
  explicit Options(
      std::string fragment_path,
      std::optional<std::string> config_path = std::nullopt,
      std::optional<std::string> output_path = std::nullopt,
      int verbosity = 0);

  explicit Options(const boost::program_options::variables_map& variables);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Options)

  static void add_options(boost::program_options::options_description& options);

  /* Path of the fragment to analyze, `-` for the standard input. */
  const std::string& fragment_path() const;
  const std::optional<std::string>& config_path() const;
  const std::optional<std::string>& output_path() const;
  int verbosity() const;

  bool read_from_stdin() const;

  /* Read the fragment to analyze. */
  std::string read_fragment() const;

 private:
  std::string fragment_path_;
  std::optional<std::string> config_path_;
  std::optional<std::string> output_path_;
  int verbosity_;
};

} // namespace taintengine
