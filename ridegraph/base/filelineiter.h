// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Allows to read a text file line by line with:
//   for (const std::string& line : FileLines("myfile.txt")) { ... }
//
// The trailing "\n" and "\r" are removed from each line. If the file cannot be
// opened, the loop is empty and `ok()` returns false, so callers that need to
// tell an empty file from a missing one should keep the FileLines object:
//
//   FileLines lines(path);
//   if (!lines.ok()) return absl::NotFoundError(...);
//   for (const std::string& line : lines) { ... }

#ifndef RIDEGRAPH_BASE_FILELINEITER_H_
#define RIDEGRAPH_BASE_FILELINEITER_H_

#include <fstream>
#include <istream>
#include <memory>
#include <string>

#include "absl/strings/string_view.h"

namespace ridegraph {

class FileLineIterator {
 public:
  // An end iterator.
  FileLineIterator() : stream_(nullptr) {}
  explicit FileLineIterator(std::istream* stream) : stream_(stream) {
    ReadNextLine();
  }

  const std::string& operator*() const { return line_; }
  const std::string* operator->() const { return &line_; }
  FileLineIterator& operator++() {
    ReadNextLine();
    return *this;
  }
  bool operator==(const FileLineIterator& other) const {
    return stream_ == other.stream_;
  }
  bool operator!=(const FileLineIterator& other) const {
    return !(*this == other);
  }

 private:
  void ReadNextLine() {
    if (stream_ == nullptr) return;
    if (!std::getline(*stream_, line_)) {
      stream_ = nullptr;
      line_.clear();
      return;
    }
    // Chop the last carriage return if present; getline() ate the linefeed.
    if (!line_.empty() && line_.back() == '\r') line_.pop_back();
  }

  std::istream* stream_;
  std::string line_;
};

class FileLines {
 public:
  explicit FileLines(absl::string_view filename)
      : stream_(std::make_unique<std::ifstream>(std::string(filename))) {}

  FileLines(const FileLines&) = delete;
  FileLines& operator=(const FileLines&) = delete;

  bool ok() const { return stream_->is_open(); }

  FileLineIterator begin() {
    return ok() ? FileLineIterator(stream_.get()) : FileLineIterator();
  }
  FileLineIterator end() const { return FileLineIterator(); }

 private:
  std::unique_ptr<std::ifstream> stream_;
};

}  // namespace ridegraph

#endif  // RIDEGRAPH_BASE_FILELINEITER_H_
