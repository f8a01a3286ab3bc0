#include <gtest/gtest.h>

#include <sstream>

#include "codegraph/graph.hpp"
#include "codegraph/recorder.hpp"
#include "tests/temp_dir_fixture.hpp"

namespace codegraph {
namespace {

// Builds a stream the way a host run would, then loads it back
class GraphTest : public test::TempDirFixture {
protected:
    std::ostringstream sink;
    Recorder recorder;

    const CodeUnit base{"pkg.base", "/proj/pkg/base.py"};
    const CodeUnit app{"pkg.app", "/proj/pkg/app.py"};

    void SetUp() override {
        TempDirFixture::SetUp();
        recorder.enable(sink);
        recorder.on_module_seen(base);
        recorder.on_module_seen(app);
        recorder.on_import(app, "pkg.app", "pkg.base");
    }

    void CheckBase() {
        recorder.on_invalidate(base, "pkg.base");
        recorder.on_class_def(base, "pkg.base.Base");
        recorder.on_function_def(base, "pkg.base.helper");
    }

    Graph Load() const {
        std::istringstream in(sink.str());
        return Graph::from_stream(in);
    }
};

TEST_F(GraphTest, CollectsModulesAndImports) {
    Graph graph = Load();
    EXPECT_EQ(*graph.module_file("pkg.app"), "/proj/pkg/app.py");
    EXPECT_FALSE(graph.module_file("pkg.missing").has_value());
    EXPECT_EQ(graph.imports_of("pkg.app"), std::vector<std::string>{"pkg.base"});
    EXPECT_TRUE(graph.imports_of("pkg.base").empty());
}

TEST_F(GraphTest, LaterImportBatchReplacesImporterEdges) {
    const CodeUnit util{"pkg.util", "/proj/pkg/util.py"};
    recorder.on_module_seen(util);
    recorder.on_import(util, "pkg.util", "pkg.base");
    CheckBase();

    // Recheck of app: it now imports util instead of base
    recorder.on_import(app, "pkg.app", "pkg.util");
    recorder.on_invalidate(app, "pkg.app");

    Graph graph = Load();
    EXPECT_EQ(graph.imports_of("pkg.app"), std::vector<std::string>{"pkg.util"});
    EXPECT_EQ(graph.imports_of("pkg.util"), std::vector<std::string>{"pkg.base"});
    EXPECT_EQ(graph.summary().imports, 2u);
    EXPECT_EQ(graph.to_json()["imports"].size(), 2u);
}

TEST_F(GraphTest, ImportsOfOneBatchAccumulate) {
    recorder.on_import(app, "pkg.app", "os");

    Graph graph = Load();
    EXPECT_EQ(graph.imports_of("pkg.app"), (std::vector<std::string>{"os", "pkg.base"}));
}

TEST_F(GraphTest, QueriesCallsAndClassRefs) {
    CheckBase();
    recorder.on_invalidate(app, "pkg.app");
    recorder.on_class_def(app, "pkg.app.Child");
    recorder.on_class_ref(app, "pkg.app.Child", "pkg.base.Base", ClassRefKind::Inheritance);
    recorder.on_function_def(app, "pkg.app.main");
    recorder.on_class_ref(app, "pkg.app.main", "pkg.base.Base", ClassRefKind::Instantiation);
    recorder.on_function_call(app, "pkg.app.main", "pkg.base.helper");

    Graph graph = Load();
    EXPECT_EQ(graph.callers("pkg.base.helper"), std::vector<std::string>{"pkg.app.main"});
    EXPECT_EQ(graph.callees("pkg.app.main"), std::vector<std::string>{"pkg.base.helper"});
    EXPECT_EQ(graph.subclasses("pkg.base.Base"), std::vector<std::string>{"pkg.app.Child"});
    EXPECT_EQ(graph.instantiations("pkg.base.Base"), std::vector<std::string>{"pkg.app.main"});
    EXPECT_TRUE(graph.has_class("pkg.app.Child"));
    EXPECT_TRUE(graph.has_function("pkg.base.helper"));
    EXPECT_TRUE(graph.callers("pkg.unknown").empty());
}

TEST_F(GraphTest, RepeatedRecordsAreDeduplicated) {
    CheckBase();
    recorder.on_invalidate(app, "pkg.app");
    recorder.on_function_call(app, "pkg.app.main", "pkg.base.helper");
    recorder.on_function_call(app, "pkg.app.main", "pkg.base.helper");

    auto s = Load().summary();
    EXPECT_EQ(s.calls, 1u);
}

TEST_F(GraphTest, InvalidateDropsPreviousGeneration) {
    CheckBase();
    recorder.on_invalidate(app, "pkg.app");
    recorder.on_function_def(app, "pkg.app.old");
    recorder.on_function_call(app, "pkg.app.old", "pkg.base.helper");

    // Recheck: old is gone, new calls helper
    recorder.on_invalidate(app, "pkg.app");
    recorder.on_function_def(app, "pkg.app.new");
    recorder.on_function_call(app, "pkg.app.new", "pkg.base.helper");

    Graph graph = Load();
    EXPECT_FALSE(graph.has_function("pkg.app.old"));
    EXPECT_TRUE(graph.has_function("pkg.app.new"));
    EXPECT_EQ(graph.callers("pkg.base.helper"), std::vector<std::string>{"pkg.app.new"});
    EXPECT_EQ(graph.generation("pkg.app"), 2u);
    EXPECT_EQ(graph.generation("pkg.base"), 1u);

    // Facts of other files are untouched
    EXPECT_TRUE(graph.has_class("pkg.base.Base"));
}

TEST_F(GraphTest, InvalidateWithoutFileFallsBackToModuleFile) {
    std::istringstream in(
        R"({"type":"module","module":"m","file":"/p/m.py"})"
        "\n"
        R"({"type":"function_def","fullname":"m.f","file":"/p/m.py"})"
        "\n"
        R"({"type":"invalidate","module":"m"})"
        "\n");
    Graph graph = Graph::from_stream(in);
    EXPECT_FALSE(graph.has_function("m.f"));
}

TEST_F(GraphTest, SummaryCountsRecordsAndFacts) {
    CheckBase();
    auto s = Load().summary();
    EXPECT_EQ(s.records, 6u);
    EXPECT_EQ(s.modules, 2u);
    EXPECT_EQ(s.imports, 1u);
    EXPECT_EQ(s.classes, 1u);
    EXPECT_EQ(s.functions, 1u);
    EXPECT_EQ(s.invalidations, 1u);
    EXPECT_EQ(s.class_refs, 0u);
}

TEST_F(GraphTest, ExportsSortedDocument) {
    CheckBase();
    recorder.on_invalidate(app, "pkg.app");
    recorder.on_class_ref(app, "pkg.app.Child", "pkg.base.Base", ClassRefKind::Inheritance);
    recorder.on_function_call(app, "pkg.app.main", "pkg.base.helper");

    json j = Load().to_json();
    EXPECT_EQ(j["modules"]["pkg.base"].get<std::string>(), "/proj/pkg/base.py");
    ASSERT_EQ(j["imports"].size(), 1u);
    EXPECT_EQ(j["imports"][0]["importer"].get<std::string>(), "pkg.app");
    EXPECT_TRUE(j["classes"] == json::array({"pkg.base.Base"}));
    EXPECT_TRUE(j["functions"] == json::array({"pkg.base.helper"}));
    ASSERT_EQ(j["class_refs"].size(), 1u);
    EXPECT_EQ(j["class_refs"][0]["kind"].get<std::string>(), "INHERITANCE");
    ASSERT_EQ(j["calls"].size(), 1u);
    EXPECT_EQ(j["calls"][0]["callee"].get<std::string>(), "pkg.base.helper");
}

TEST_F(GraphTest, SaveAndLoadFromDisk) {
    CheckBase();
    WriteFile("graph.jsonl", sink.str());

    Graph graph = Graph::load(PathOf("graph.jsonl"));
    graph.save(PathOf("export.json"));

    json exported = json::parse(ReadFile("export.json"));
    EXPECT_TRUE(exported == graph.to_json());
}

TEST_F(GraphTest, LoadMissingFileThrows) {
    EXPECT_THROW(Graph::load(PathOf("absent.jsonl")), std::runtime_error);
}

} // namespace
} // namespace codegraph
