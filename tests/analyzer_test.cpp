#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

#include "codegraph/analyzer.hpp"
#include "codegraph/graph.hpp"
#include "tests/temp_dir_fixture.hpp"

namespace codegraph {
namespace {

// Analyzes a small package written into the test directory
class AnalyzerTest : public test::TempDirFixture {
protected:
    std::ostringstream sink;
    Recorder recorder;

    void SetUp() override {
        TempDirFixture::SetUp();
        WriteFile("pkg/__init__.py", "");
        WriteFile("pkg/base.py",
                  "class Base:\n"
                  "    def run(self):\n"
                  "        self.helper()\n"
                  "\n"
                  "    def helper(self):\n"
                  "        pass\n"
                  "\n"
                  "def make():\n"
                  "    return Base()\n");
        WriteFile("pkg/app.py",
                  "from pkg.base import Base, make\n"
                  "from . import base\n"
                  "import os\n"
                  "\n"
                  "class Child(Base):\n"
                  "    pass\n"
                  "\n"
                  "def main():\n"
                  "    make()\n"
                  "    base.make()\n"
                  "    Child()\n"
                  "    os.getcwd()\n");
        recorder.enable(sink, {TestDir().string()});
    }

    AnalyzerConfig Config() const {
        AnalyzerConfig config;
        config.roots = {TestDir().string()};
        return config;
    }

    std::vector<Record> Records() const {
        std::vector<Record> records;
        std::istringstream in(sink.str());
        read_records(in, [&records](const Record &record, size_t) { records.push_back(record); });
        return records;
    }

    Graph Load() const {
        std::istringstream in(sink.str());
        return Graph::from_stream(in);
    }
};

// =============================================================================
// Full pass
// =============================================================================

TEST_F(AnalyzerTest, DiscoversModules) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();

    EXPECT_EQ(analyzer.stats().files_found, 3u);
    EXPECT_EQ(analyzer.stats().files_failed, 0u);
    EXPECT_EQ(analyzer.stats().modules_checked, 3u);

    Graph graph = Load();
    EXPECT_EQ(*graph.module_file("pkg"), PathOf("pkg/__init__.py"));
    EXPECT_EQ(*graph.module_file("pkg.base"), PathOf("pkg/base.py"));
    EXPECT_EQ(*graph.module_file("pkg.app"), PathOf("pkg/app.py"));
}

TEST_F(AnalyzerTest, ChecksDependenciesFirst) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();

    EXPECT_EQ(analyzer.check_order(), (std::vector<std::string>{"pkg", "pkg.base", "pkg.app"}));
}

TEST_F(AnalyzerTest, HookOrderIsModulesImportsThenChecks) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();

    auto records = Records();
    ASSERT_FALSE(records.empty());

    // Phases never interleave: module < import < everything else
    int phase = 0;
    for (const auto &record : records) {
        int p = 2;
        if (event_type(record.event) == EventType::Module)
            p = 0;
        else if (event_type(record.event) == EventType::Import)
            p = 1;
        EXPECT_GE(p, phase);
        phase = p;
    }

    // Each check starts with its invalidate
    auto first_check = std::find_if(records.begin(), records.end(), [](const Record &r) {
        return event_type(r.event) > EventType::Import;
    });
    ASSERT_NE(first_check, records.end());
    EXPECT_EQ(event_type(first_check->event), EventType::Invalidate);
}

TEST_F(AnalyzerTest, RecordsImports) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();

    // "from . import base" resolves to the submodule; os is recorded though unknown
    EXPECT_EQ(Load().imports_of("pkg.app"), (std::vector<std::string>{"os", "pkg.base"}));
}

TEST_F(AnalyzerTest, RecordsDefinitionsAndReferences) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();
    Graph graph = Load();

    EXPECT_TRUE(graph.has_class("pkg.base.Base"));
    EXPECT_TRUE(graph.has_class("pkg.app.Child"));
    EXPECT_TRUE(graph.has_function("pkg.base.Base.run"));
    EXPECT_TRUE(graph.has_function("pkg.app.main"));

    EXPECT_EQ(graph.subclasses("pkg.base.Base"), std::vector<std::string>{"pkg.app.Child"});
    EXPECT_EQ(graph.instantiations("pkg.app.Child"), std::vector<std::string>{"pkg.app.main"});
    EXPECT_EQ(graph.instantiations("pkg.base.Base"), std::vector<std::string>{"pkg.base.make"});
    EXPECT_EQ(graph.callers("pkg.base.make"), std::vector<std::string>{"pkg.app.main"});
    EXPECT_EQ(graph.callers("pkg.base.Base.helper"),
              std::vector<std::string>{"pkg.base.Base.run"});
}

TEST_F(AnalyzerTest, ExternalCallsAreNotRecorded) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();

    EXPECT_TRUE(Load().callers("os.getcwd").empty());
    EXPECT_GE(recorder.stats().references_unresolved, 1u);
}

TEST_F(AnalyzerTest, FilterDropsEdgesIntoExcludedCode) {
    std::ostringstream filtered;
    Recorder narrow;
    narrow.enable(filtered, {PathOf("pkg/app.py")});

    Analyzer analyzer(narrow, Config());
    analyzer.run();

    std::istringstream in(filtered.str());
    Graph graph = Graph::from_stream(in);
    EXPECT_FALSE(graph.has_class("pkg.base.Base"));
    EXPECT_TRUE(graph.has_class("pkg.app.Child"));
    // Child(Base) lands in base.py, which is filtered out
    EXPECT_TRUE(graph.subclasses("pkg.base.Base").empty());
    EXPECT_EQ(graph.instantiations("pkg.app.Child"), std::vector<std::string>{"pkg.app.main"});
}

TEST_F(AnalyzerTest, IgnoredDirectoriesAreSkipped) {
    WriteFile("build/gen.py", "def g():\n    pass\n");
    WriteFile(".hidden/h.py", "def h():\n    pass\n");
    WriteFile("pkg/__pycache__/stale.py", "def s():\n    pass\n");

    Analyzer analyzer(recorder, Config());
    analyzer.run();

    EXPECT_EQ(analyzer.stats().files_found, 3u);
    EXPECT_FALSE(Load().module_file("build.gen").has_value());
}

TEST_F(AnalyzerTest, ReportsProgress) {
    AnalyzerConfig config = Config();
    std::vector<std::string> seen;
    config.progress_callback = [&seen](const std::string &module, size_t current, size_t total) {
        EXPECT_EQ(total, 3u);
        EXPECT_EQ(current, seen.size() + 1);
        seen.push_back(module);
    };

    Analyzer analyzer(recorder, config);
    analyzer.run();
    EXPECT_EQ(seen, analyzer.check_order());
}

// =============================================================================
// Recheck
// =============================================================================

TEST_F(AnalyzerTest, RecheckReplacesStaleFacts) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();

    WriteFile("pkg/app.py",
              "from pkg.base import Base\n"
              "\n"
              "def renamed():\n"
              "    Base()\n");
    analyzer.recheck({"pkg.app"});

    Graph graph = Load();
    EXPECT_EQ(graph.generation("pkg.app"), 2u);
    EXPECT_EQ(graph.generation("pkg.base"), 1u);
    EXPECT_FALSE(graph.has_function("pkg.app.main"));
    EXPECT_FALSE(graph.has_class("pkg.app.Child"));
    EXPECT_TRUE(graph.has_function("pkg.app.renamed"));
    EXPECT_EQ(graph.imports_of("pkg.app"), std::vector<std::string>{"pkg.base"});
    EXPECT_TRUE(graph.callers("pkg.base.make").empty());
    EXPECT_EQ(graph.instantiations("pkg.base.Base"),
              (std::vector<std::string>{"pkg.app.renamed", "pkg.base.make"}));
}

TEST_F(AnalyzerTest, RecheckIgnoresUnknownModules) {
    Analyzer analyzer(recorder, Config());
    analyzer.run();
    size_t before = Records().size();

    EXPECT_NO_THROW(analyzer.recheck({"pkg.nope"}));
    EXPECT_EQ(Records().size(), before);
}

// =============================================================================
// Module naming
// =============================================================================

TEST(ModuleNameTest, MapsFilesToModules) {
    EXPECT_EQ(Analyzer::module_name_for("/r", "/r/top.py"), "top");
    EXPECT_EQ(Analyzer::module_name_for("/r", "/r/pkg/mod.py"), "pkg.mod");
    EXPECT_EQ(Analyzer::module_name_for("/r", "/r/pkg/__init__.py"), "pkg");
    EXPECT_EQ(Analyzer::module_name_for("/r", "/r/pkg/sub/__init__.py"), "pkg.sub");
}

TEST(ModuleNameTest, RejectsNonModules) {
    EXPECT_EQ(Analyzer::module_name_for("/r", "/r/notes.txt"), "");
    EXPECT_EQ(Analyzer::module_name_for("/r", "/elsewhere/x.py"), "");
    EXPECT_EQ(Analyzer::module_name_for("/r", "/r/my-dir/x.py"), "");
    EXPECT_EQ(Analyzer::module_name_for("/r", "/r/x.tar.py"), "");
}

TEST(ImportBaseTest, ResolvesRelativeImports) {
    EXPECT_EQ(Analyzer::resolve_import_base("pkg.sub.mod", false, 0, "x"), "x");
    EXPECT_EQ(Analyzer::resolve_import_base("pkg.sub.mod", false, 1, "x"), "pkg.sub.x");
    EXPECT_EQ(Analyzer::resolve_import_base("pkg.sub.mod", false, 2, "x"), "pkg.x");
    EXPECT_EQ(Analyzer::resolve_import_base("pkg.sub", true, 1, "x"), "pkg.sub.x");
    EXPECT_EQ(Analyzer::resolve_import_base("pkg.mod", false, 1, ""), "pkg");
}

} // namespace
} // namespace codegraph
