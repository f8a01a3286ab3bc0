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

#include "codegraph/commands.hpp"
#include "codegraph/reader.hpp"
#include <iostream>

namespace codegraph {

// Helper function to load the deduplicated graph from a recorded stream
bool load_graph(Graph &graph, const std::string &input) {
    try {
        graph = Graph::load(input);
        return true;
    } catch (const std::exception &e) {
        std::cerr << "Error loading graph: " << e.what() << std::endl;
        std::cerr << "Please run 'codegraph --record' first." << std::endl;
        return false;
    }
}

static void print_list(const std::vector<std::string> &names, const std::string &label) {
    std::cout << names.size() << " " << label << std::endl;
    if (names.empty()) {
        std::cout << "  (none found)" << std::endl;
        return;
    }
    for (const auto &name : names) {
        std::cout << "  " << name << std::endl;
    }
}

int cmd_record(const RecorderConfig &recorder_config, const AnalyzerConfig &analyzer_config,
               const std::vector<std::string> &recheck) {
    // Keep stdout parseable when the graph itself goes there
    std::ostream &log = (recorder_config.output == STDOUT_SINK) ? std::cerr : std::cout;

    Recorder recorder;
    try {
        recorder.enable(recorder_config);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    log << "Recording code graph..." << std::endl;

    try {
        Analyzer analyzer(recorder, analyzer_config);
        analyzer.run();
        if (!recheck.empty()) {
            log << "Rechecking " << recheck.size() << " module(s)..." << std::endl;
            analyzer.recheck(recheck);
        }
        recorder.flush();

        const auto &as = analyzer.stats();
        const auto &rs = recorder.stats();
        log << "  Modules:              " << as.files_found - as.files_failed << std::endl;
        log << "  Checks:               " << as.modules_checked << std::endl;
        log << "  Failed files:         " << as.files_failed << std::endl;
        log << "  Records written:      " << rs.records_written << std::endl;
        log << "  Filtered out:         " << rs.records_filtered << std::endl;
        log << "  Unresolved refs:      " << rs.references_unresolved << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error recording graph: " << e.what() << std::endl;
        return 1;
    }

    if (recorder_config.output != STDOUT_SINK) {
        log << "\nGraph written to: " << recorder_config.output << std::endl;
    }
    return 0;
}

int cmd_validate(const std::string &input) {
    try {
        constexpr size_t num_types = std::variant_size_v<GraphEvent>;
        size_t counts[num_types] = {};
        size_t total = read_records(input, [&counts](const Record &record, size_t) {
            counts[record.event.index()]++;
        });

        std::cout << input << ": " << total << " valid records" << std::endl;
        for (size_t i = 0; i < num_types; ++i) {
            if (counts[i] == 0)
                continue;
            std::cout << "  " << event_type_to_string(static_cast<EventType>(i)) << ": "
                      << counts[i] << std::endl;
        }
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << input << ": " << e.what() << std::endl;
        return 1;
    }
}

int cmd_summary(const std::string &input) {
    Graph graph;
    if (!load_graph(graph, input))
        return 1;

    auto s = graph.summary();
    std::cout << "Graph summary (" << input << ")" << std::endl;
    std::cout << "  Records:        " << s.records << std::endl;
    std::cout << "  Invalidations:  " << s.invalidations << std::endl;
    std::cout << "  Modules:        " << s.modules << std::endl;
    std::cout << "  Imports:        " << s.imports << std::endl;
    std::cout << "  Classes:        " << s.classes << std::endl;
    std::cout << "  Functions:      " << s.functions << std::endl;
    std::cout << "  Class refs:     " << s.class_refs << std::endl;
    std::cout << "  Calls:          " << s.calls << std::endl;
    return 0;
}

int cmd_callers(const std::string &input, const std::string &symbol) {
    Graph graph;
    if (!load_graph(graph, input))
        return 1;
    print_list(graph.callers(symbol), "callers of " + symbol);
    return 0;
}

int cmd_callees(const std::string &input, const std::string &symbol) {
    Graph graph;
    if (!load_graph(graph, input))
        return 1;
    print_list(graph.callees(symbol), "callees of " + symbol);
    return 0;
}

int cmd_subclasses(const std::string &input, const std::string &fullname) {
    Graph graph;
    if (!load_graph(graph, input))
        return 1;
    if (!graph.has_class(fullname)) {
        std::cerr << "Warning: class not defined in graph: " << fullname << std::endl;
    }
    print_list(graph.subclasses(fullname), "subclasses of " + fullname);
    return 0;
}

int cmd_export(const std::string &input, const std::string &output) {
    Graph graph;
    if (!load_graph(graph, input))
        return 1;

    try {
        graph.save(output);
        std::cout << "Graph exported to: " << output << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error saving graph: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace codegraph
