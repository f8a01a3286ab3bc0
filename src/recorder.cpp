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

#include "codegraph/recorder.hpp"

namespace codegraph {

void Recorder::enable(const RecorderConfig &config) {
    emitter_.open(config.output, config.append);
    emitter_.set_filter(PathFilter(config.filter_paths));
    emitter_.set_flush_each_record(config.flush_each_record);
}

void Recorder::enable(std::ostream &sink, const std::vector<std::string> &filter_paths) {
    emitter_.attach(sink);
    emitter_.set_filter(PathFilter(filter_paths));
    emitter_.set_flush_each_record(false);
}

void Recorder::record(const GraphEvent &event, const std::string &scope_file,
                      const std::string &unit_file) {
    if (!emitter_.enabled())
        return;
    if (emitter_.emit(event, scope_file, unit_file)) {
        stats_.records_written++;
    } else {
        stats_.records_filtered++;
    }
}

void Recorder::record_reference(const CodeUnit &unit, const GraphEvent &event,
                                const std::string &destination) {
    if (!emitter_.enabled())
        return;
    auto dst_file = modules_.resolve_symbol(destination);
    if (!dst_file) {
        // Not registered yet: dropped for good, never replayed
        stats_.references_unresolved++;
        return;
    }
    record(event, *dst_file, unit.path);
}

void Recorder::on_module_seen(const CodeUnit &unit) {
    modules_.register_module(unit.module, unit.path);
    record(ModuleEvent{unit.module}, unit.path, unit.path);
}

void Recorder::on_import(const CodeUnit &unit, const std::string &importer,
                         const std::string &importee) {
    record(ImportEvent{importer, importee}, unit.path, unit.path);
}

void Recorder::on_invalidate(const CodeUnit &unit, const std::string &module) {
    record(InvalidateEvent{module}, unit.path, unit.path);
}

void Recorder::on_class_def(const CodeUnit &unit, const std::string &fullname) {
    modules_.register_class(fullname);
    record(ClassDefEvent{fullname}, unit.path, unit.path);
}

void Recorder::on_class_ref(const CodeUnit &unit, const std::string &src, const std::string &dst,
                            ClassRefKind kind) {
    record_reference(unit, ClassRefEvent{src, dst, kind}, dst);
}

void Recorder::on_function_def(const CodeUnit &unit, const std::string &fullname) {
    record(FunctionDefEvent{fullname}, unit.path, unit.path);
}

void Recorder::on_function_call(const CodeUnit &unit, const std::string &caller,
                                const std::string &callee) {
    record_reference(unit, FunctionCallEvent{caller, callee}, callee);
}

} // namespace codegraph
