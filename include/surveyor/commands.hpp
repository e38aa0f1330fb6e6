// Copyright 2025 Siddhant Biradar
//
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

#pragma once

#include "document.hpp"
#include "loader.hpp"
#include <string>
#include <vector>

namespace surveyor {

constexpr const char *DEFAULT_DOCUMENT_FILE = ".surveyor.json";
constexpr const char *DEFAULT_DB_FILE = ".surveyor.db";
constexpr const char *DB_ENV_VAR = "SURVEYOR_DB";

// Options shared by all commands, filled from the command line
struct RunOptions {
    std::string db_path;
    unsigned int num_threads = 0;     // 0 = auto
    std::vector<std::string> ignore;  // Extra directory names to skip
    std::string repo_name;            // Empty = root directory basename
    bool clear = false;
    bool verbose = false;
};

// Command handlers
int cmd_analyze(const std::string &root, const std::string &output, const RunOptions &opts);
int cmd_load(const std::string &document, const RunOptions &opts);
int cmd_build(const std::string &root, const RunOptions &opts);
int cmd_stats(const RunOptions &opts);

// Helper functions

// Discover, analyze and resolve a source tree (throws std::runtime_error
// if root is not a directory)
AnalysisDocument analyze_tree(const std::string &root, const RunOptions &opts);

// Load a document into the store named by opts, honoring opts.clear
LoadReport load_document(const AnalysisDocument &doc, const RunOptions &opts);

// Store path from $SURVEYOR_DB, else DEFAULT_DB_FILE
std::string default_db_path();

// Repository node name: explicit name, else basename of root
std::string repository_name(const std::string &root, const std::string &explicit_name);

} // namespace surveyor
