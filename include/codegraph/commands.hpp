#pragma once

#include "analyzer.hpp"
#include "graph.hpp"
#include "recorder.hpp"
#include <string>
#include <vector>

namespace codegraph {

// Default graph stream written by --record
constexpr const char *DEFAULT_OUTPUT = ".codegraph.jsonl";

// Command handlers
int cmd_record(const RecorderConfig &recorder_config, const AnalyzerConfig &analyzer_config,
               const std::vector<std::string> &recheck);
int cmd_validate(const std::string &input);
int cmd_summary(const std::string &input);
int cmd_callers(const std::string &input, const std::string &symbol);
int cmd_callees(const std::string &input, const std::string &symbol);
int cmd_subclasses(const std::string &input, const std::string &fullname);
int cmd_export(const std::string &input, const std::string &output);

// Helper functions
bool load_graph(Graph &graph, const std::string &input);

} // namespace codegraph
