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

#include <cxxopts.hpp>
#include <iostream>

#include "surveyor/commands.hpp"
#include "surveyor/version.hpp"

using namespace surveyor;

void print_banner() {
    std::cout << R"(
  ____                                        
 / ___| _   _ _ ____   _____ _   _  ___  _ __ 
 \___ \| | | | '__\ \ / / _ \ | | |/ _ \| '__|
  ___) | |_| | |   \ V /  __/ |_| | (_) | |   
 |____/ \__,_|_|    \_/ \___|\__, |\___/|_|   
                             |___/            
)" << "  Dependency Graph Builder v"
              << VERSION_STRING << "\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "surveyor",
        "Dependency Graph Builder - Map TypeScript monorepos into a persistent property graph");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("analyze", "Analyze a source tree and write the analysis document",
         cxxopts::value<std::string>());
    opts("o,output", "Analysis document path",
         cxxopts::value<std::string>()->default_value(DEFAULT_DOCUMENT_FILE));
    opts("load", "Load an analysis document into the graph store", cxxopts::value<std::string>());
    opts("build", "Analyze a source tree and load it in one run", cxxopts::value<std::string>());
    opts("stats", "Print node and edge counts of the graph store");
    opts("db", "Graph store path (default $SURVEYOR_DB or .surveyor.db)",
         cxxopts::value<std::string>());
    opts("j,jobs", "Number of threads for analysis (0 = auto)",
         cxxopts::value<unsigned int>()->default_value("0"));
    opts("ignore", "Extra directory names to skip (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("repo-name", "Repository node name (default: root directory name)",
         cxxopts::value<std::string>());
    opts("clear", "Wipe the graph store before loading");
    opts("verbose", "Print per-file progress and skipped external imports");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  surveyor --analyze .               Write .surveyor.json for this tree"
                      << std::endl;
            std::cout << "  surveyor --analyze . -o out.json   Write the analysis to out.json"
                      << std::endl;
            std::cout << "  surveyor --load out.json           Load a saved analysis" << std::endl;
            std::cout << "  surveyor --build . -j 8            Analyze with 8 threads and load"
                      << std::endl;
            std::cout << "  surveyor --build . --clear         Rebuild the graph from scratch"
                      << std::endl;
            std::cout << "  surveyor --stats --db graph.db     Count nodes and edges in graph.db"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "surveyor v" << VERSION_STRING << std::endl;
            return 0;
        }

        RunOptions run;
        run.db_path = result.count("db") ? result["db"].as<std::string>() : default_db_path();
        run.num_threads = result["jobs"].as<unsigned int>();
        if (result.count("ignore"))
            run.ignore = result["ignore"].as<std::vector<std::string>>();
        if (result.count("repo-name"))
            run.repo_name = result["repo-name"].as<std::string>();
        run.clear = result.count("clear") > 0;
        run.verbose = result.count("verbose") > 0;

        if (result.count("analyze")) {
            return cmd_analyze(result["analyze"].as<std::string>(),
                               result["output"].as<std::string>(), run);
        }

        if (result.count("load")) {
            return cmd_load(result["load"].as<std::string>(), run);
        }

        if (result.count("build")) {
            return cmd_build(result["build"].as<std::string>(), run);
        }

        if (result.count("stats")) {
            return cmd_stats(run);
        }

        print_banner();
        std::cout << options.help() << std::endl;
        return 0;

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
