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

#include "codegraph/commands.hpp"
#include "codegraph/version.hpp"

using namespace codegraph;

void print_banner() {
    std::cout << "codegraph v" << VERSION_STRING
              << " - Incremental code graph recorder for Python sources\n"
              << std::endl;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "codegraph", "Record and query the code graph (imports, classes, calls) of a Python tree");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("record", "Record the code graph of the source roots");
    opts("r,root", "Source root (repeatable)",
         cxxopts::value<std::vector<std::string>>()->default_value("."));
    opts("o,output", "Graph output file, or 'stdout'",
         cxxopts::value<std::string>()->default_value(DEFAULT_OUTPUT));
    opts("f,filter", "Only record code under these directories (default: the roots)",
         cxxopts::value<std::vector<std::string>>());
    opts("all", "Record everything, without path filtering");
    opts("append", "Append to the output file instead of truncating it");
    opts("flush", "Flush the output after every record");
    opts("recheck", "Recheck these modules after the initial pass (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());
    opts("verbose", "Print progress while recording");

    opts("validate", "Validate a recorded graph stream", cxxopts::value<std::string>());
    opts("summary", "Summarize a recorded graph stream", cxxopts::value<std::string>());
    opts("i,input", "Recorded graph stream for queries",
         cxxopts::value<std::string>()->default_value(DEFAULT_OUTPUT));
    opts("callers", "Find callers of a function", cxxopts::value<std::string>());
    opts("callees", "Find callees of a function", cxxopts::value<std::string>());
    opts("subclasses", "Find direct subclasses of a class", cxxopts::value<std::string>());
    opts("export", "Export the deduplicated graph as one JSON document",
         cxxopts::value<std::string>());

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  codegraph --record                      Record ./ into "
                      << DEFAULT_OUTPUT << std::endl;
            std::cout << "  codegraph --record -r src -o stdout     Stream the graph of src/"
                      << std::endl;
            std::cout << "  codegraph --record -r . -f ./myproj     Keep edges landing in myproj/"
                      << std::endl;
            std::cout << "  codegraph --record --recheck pkg.mod    Record, then recheck pkg.mod"
                      << std::endl;
            std::cout << "  codegraph --validate graph.jsonl        Check every record"
                      << std::endl;
            std::cout << "  codegraph --summary graph.jsonl         Count deduplicated facts"
                      << std::endl;
            std::cout << "  codegraph --callers pkg.mod.func        Who calls pkg.mod.func"
                      << std::endl;
            std::cout << "  codegraph --subclasses pkg.mod.Base     Direct subclasses"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "codegraph v" << VERSION_STRING << std::endl;
            return 0;
        }

        if (result.count("record")) {
            AnalyzerConfig analyzer_config;
            analyzer_config.roots = result["root"].as<std::vector<std::string>>();
            analyzer_config.verbose = result.count("verbose") > 0;

            RecorderConfig recorder_config;
            recorder_config.output = result["output"].as<std::string>();
            recorder_config.append = result.count("append") > 0;
            recorder_config.flush_each_record = result.count("flush") > 0;
            if (result.count("all") == 0) {
                recorder_config.filter_paths = result.count("filter")
                                                   ? result["filter"].as<std::vector<std::string>>()
                                                   : analyzer_config.roots;
            }

            std::vector<std::string> recheck;
            if (result.count("recheck"))
                recheck = result["recheck"].as<std::vector<std::string>>();

            return cmd_record(recorder_config, analyzer_config, recheck);
        }

        if (result.count("validate")) {
            return cmd_validate(result["validate"].as<std::string>());
        }

        if (result.count("summary")) {
            return cmd_summary(result["summary"].as<std::string>());
        }

        std::string input = result["input"].as<std::string>();

        if (result.count("callers")) {
            return cmd_callers(input, result["callers"].as<std::string>());
        }

        if (result.count("callees")) {
            return cmd_callees(input, result["callees"].as<std::string>());
        }

        if (result.count("subclasses")) {
            return cmd_subclasses(input, result["subclasses"].as<std::string>());
        }

        if (result.count("export")) {
            return cmd_export(input, result["export"].as<std::string>());
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
