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

#include "codegraph/emitter.hpp"
#include <iostream>
#include <stdexcept>

namespace codegraph {

namespace {

struct EventFields {
    json &j;

    void operator()(const ModuleEvent &e) const { j["module"] = e.module; }
    void operator()(const ImportEvent &e) const {
        j["importer"] = e.importer;
        j["importee"] = e.importee;
    }
    void operator()(const InvalidateEvent &e) const { j["module"] = e.module; }
    void operator()(const ClassDefEvent &e) const { j["fullname"] = e.fullname; }
    void operator()(const ClassRefEvent &e) const {
        j["src"] = e.src;
        j["dst"] = e.dst;
        j["kind"] = class_ref_kind_to_string(e.kind);
    }
    void operator()(const FunctionDefEvent &e) const { j["fullname"] = e.fullname; }
    void operator()(const FunctionCallEvent &e) const {
        j["caller"] = e.caller;
        j["callee"] = e.callee;
    }
};

} // namespace

json event_to_json(const GraphEvent &event) {
    json j = json::object();
    j["type"] = event_type_to_string(event_type(event));
    std::visit(EventFields{j}, event);
    return j;
}

void EventEmitter::open(const std::string &destination, bool append) {
    if (out_) {
        flush();
    }
    file_.reset();
    out_ = nullptr;

    if (destination == STDOUT_SINK) {
        out_ = &std::cout;
    } else {
        auto mode = std::ios::out | (append ? std::ios::app : std::ios::trunc);
        auto file = std::make_unique<std::ofstream>(destination, mode);
        if (!file->is_open()) {
            throw std::runtime_error("Failed to open graph output for writing: " + destination);
        }
        file_ = std::move(file);
        out_ = file_.get();
    }
    destination_ = destination;
}

void EventEmitter::attach(std::ostream &stream) {
    if (out_) {
        flush();
    }
    file_.reset();
    out_ = &stream;
    destination_ = "<stream>";
}

bool EventEmitter::emit(const GraphEvent &event, const std::string &scope_file,
                        const std::string &file_tag) {
    if (!out_)
        return false;
    if (!filter_.in_scope(scope_file))
        return false;

    json record = event_to_json(event);
    record["file"] = file_tag;

    // Names are recorded as given; invalid UTF-8 is replaced rather than thrown
    *out_ << record.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    if (flush_each_record_)
        out_->flush();

    if (!*out_) {
        throw std::runtime_error("Failed to write graph record to " + destination_);
    }
    return true;
}

void EventEmitter::flush() {
    if (!out_)
        return;
    out_->flush();
    if (!*out_) {
        throw std::runtime_error("Failed to flush graph output " + destination_);
    }
}

} // namespace codegraph
