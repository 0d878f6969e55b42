/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include <taint-engine/JsonReaderWriter.h>
#include <taint-engine/Log.h>

namespace taintengine {

Json::Value JsonReader::parse_json(std::string string) {
  std::istringstream stream(std::move(string));

  static const auto reader = Json::CharReaderBuilder();
  std::string errors;
  Json::Value json;

  if (!Json::parseFromStream(reader, stream, &json, &errors)) {
    throw std::invalid_argument(fmt::format("Invalid json: {}", errors));
  }
  return json;
}

Json::Value JsonReader::parse_json_file(const std::filesystem::path& path) {
  std::ifstream file;
  file.exceptions(std::ifstream::failbit | std::ifstream::badbit);
  try {
    file.open(path, std::ios_base::binary);
  } catch (const std::ifstream::failure&) {
    ERROR(1, "Could not open json file: `{}`.", path.string());
    throw;
  }

  static const auto reader = Json::CharReaderBuilder();
  std::string errors;
  Json::Value json;

  if (!Json::parseFromStream(reader, file, &json, &errors)) {
    throw std::invalid_argument(
        fmt::format("File `{}` is not valid json: {}", path.string(), errors));
  }
  return json;
}

Json::Value JsonReader::parse_json_file(const std::string& path) {
  return parse_json_file(std::filesystem::path(path));
}

namespace {

Json::StreamWriterBuilder compact_writer_builder() {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "";
  return writer;
}

Json::StreamWriterBuilder styled_writer_builder() {
  Json::StreamWriterBuilder writer;
  writer["indentation"] = "  ";
  return writer;
}

} // namespace

std::unique_ptr<Json::StreamWriter> JsonWriter::compact_writer() {
  static const auto writer_builder = compact_writer_builder();
  return std::unique_ptr<Json::StreamWriter>(writer_builder.newStreamWriter());
}

std::unique_ptr<Json::StreamWriter> JsonWriter::styled_writer() {
  static const auto writer_builder = styled_writer_builder();
  return std::unique_ptr<Json::StreamWriter>(writer_builder.newStreamWriter());
}

void JsonWriter::write_json_file(
    const std::filesystem::path& path,
    const Json::Value& value) {
  std::ofstream file;
  file.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  file.open(path, std::ios_base::binary);
  styled_writer()->write(value, &file);
  file << "\n";
  file.close();
}

std::string JsonWriter::to_styled_string(const Json::Value& value) {
  std::ostringstream string;
  styled_writer()->write(value, &string);
  return string.str();
}

} // namespace taintengine
