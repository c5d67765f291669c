#include <gtest/gtest.h>

#include "AssertionReporter.hpp"
#include "ClassRuntime.hpp"
#include "ast_builder.hpp"
#include "evaluator.hpp"
#include "memory_tracking.hpp"

using namespace AstBuilder;

// Counters are process-wide; each test compares against what was live when it started.
class MemoryTest : public ::testing::Test {
   protected:
    void SetUp() override {
        containers_before = MemoryTracking::live_containers();
        functions_before = MemoryTracking::g_function_count.load();
        classes_before = MemoryTracking::g_class_count.load();
    }

    void expect_nothing_leaked() {
        EXPECT_EQ(MemoryTracking::live_containers(), containers_before);
        EXPECT_EQ(MemoryTracking::g_function_count.load(), functions_before);
        EXPECT_EQ(MemoryTracking::g_class_count.load(), classes_before);
    }

    size_t containers_before = 0;
    size_t functions_before = 0;
    size_t classes_before = 0;
};

static ClassDeclPtr node_class() {
    return klass("Node",
        field("next", null()),
        function("describe", {}, block(ret(str("node")))));
}

TEST_F(MemoryTest, AcyclicValuesAreFreedWhenTheRunEnds) {
    {
        auto prog = program(klass("Test", function("main", {}, block(
                                                                   var("d", dict(entry("xs", list(integer(1), integer(2))))),
                                                                   var("n", construct("Test")),
                                                                   ret(null())))));
        RunResult r = run_program(*prog);
        ASSERT_TRUE(r.ok()) << r.error->rendered;
    }
    expect_nothing_leaked();
}

TEST_F(MemoryTest, DictCycleIsBrokenAfterRun) {
    {
        auto prog = program(klass("Test", function("main", {}, block(
                                                                   var("d", dict(entry("name", str("loop")))),
                                                                   assign(member(ident("d"), "self"), ident("d")),
                                                                   var("xs", list(ident("d"))),
                                                                   assign(member(ident("d"), "items"), ident("xs")),
                                                                   assertion(binary(path("d", {"self", "self", "name"}), "==", str("loop")))))));
        RunResult r = run_program(*prog);
        ASSERT_TRUE(r.ok()) << r.error->rendered;
    }
    expect_nothing_leaked();
}

TEST_F(MemoryTest, InstanceCyclesAndBoundMethodsAreBroken) {
    {
        auto prog = program(node_class(), klass("Test", function("main", {}, block(
                                                                                 var("a", construct("Node")),
                                                                                 var("b", construct("Node")),
                                                                                 assign(member(ident("a"), "next"), ident("b")),
                                                                                 assign(member(ident("b"), "next"), ident("a")),
                                                                                 // a -> bound method -> a
                                                                                 assign(member(ident("a"), "cb"), member(ident("a"), "describe")),
                                                                                 assertion(binary(method_call(ident("a"), "cb"), "==", str("node")))))));
        RunResult r = run_program(*prog);
        ASSERT_TRUE(r.ok()) << r.error->rendered;
    }
    expect_nothing_leaked();
}

TEST_F(MemoryTest, CyclesAreBrokenWhenTheRunFails) {
    {
        auto prog = program(node_class(), klass("Test", function("main", {}, block(
                                                                                 var("a", construct("Node")),
                                                                                 assign(member(ident("a"), "next"), ident("a")),
                                                                                 assertion(boolean(false))))));
        RunResult r = run_program(*prog);
        ASSERT_FALSE(r.ok());
        EXPECT_EQ(r.status, RunStatus::AssertionFailed);
    }
    expect_nothing_leaked();
}

TEST_F(MemoryTest, ResultValueSurvivesIntact) {
    {
        auto prog = program(klass("Test", function("main", {}, block(
                                                                   var("d", dict(entry("inner", dict(entry("k", integer(7)))))),
                                                                   assign(member(ident("d"), "self"), ident("d")),
                                                                   ret(ident("d"))))));
        RunResult r = run_program(*prog);
        ASSERT_TRUE(r.ok()) << r.error->rendered;

        DictPtr d = std::get<DictPtr>(r.value);
        ASSERT_TRUE(d->has("self"));
        EXPECT_EQ(std::get<DictPtr>(*d->find("self")), d);
        DictPtr inner = std::get<DictPtr>(*d->find("inner"));
        EXPECT_EQ(std::get<int64_t>(*inner->find("k")), 7);

        // the host owns the cycle now
        d->clear();
    }
    expect_nothing_leaked();
}

TEST_F(MemoryTest, BreakCyclesSparesRootsAndGlobals) {
    {
        Evaluator evaluator;
        ListPtr kept = evaluator.make_list();
        kept->elements.push_back(kept);
        ListPtr dropped = evaluator.make_list();
        dropped->elements.push_back(dropped);
        DictPtr global = evaluator.make_dict();
        global->set("me", global);
        evaluator.global_environment()->define("g", global);

        size_t cleared = evaluator.break_cycles({kept});

        EXPECT_EQ(cleared, 1u);
        EXPECT_TRUE(dropped->elements.empty());
        EXPECT_EQ(kept->elements.size(), 1u);
        EXPECT_TRUE(global->has("me"));

        kept->elements.clear();
        global->clear();
    }
    expect_nothing_leaked();
}

TEST_F(MemoryTest, RunLeavesEarlierHostHandlesIntact) {
    {
        auto prog = program(klass("Test", function("main", {}, block(
                                                                   var("d", dict(entry("n", integer(1)))),
                                                                   assign(member(ident("d"), "self"), ident("d")),
                                                                   ret(ident("d"))))));
        Evaluator evaluator;
        evaluator.load(*prog);

        Value first = evaluator.run();
        DictPtr host = evaluator.make_dict();
        evaluator.set_path(host, {"a"}, Value{int64_t{7}});
        Value second = evaluator.run();

        DictPtr d1 = std::get<DictPtr>(first);
        EXPECT_EQ(d1->size(), 2u);
        EXPECT_EQ(std::get<int64_t>(evaluator.get_path(first, {"self", "n"})), 1);
        EXPECT_EQ(std::get<int64_t>(evaluator.get_path(host, {"a"})), 7);
        EXPECT_NE(d1, std::get<DictPtr>(second));

        d1->clear();
        std::get<DictPtr>(second)->clear();
    }
    expect_nothing_leaked();
}

TEST_F(MemoryTest, TrackingStaysBoundedWhileAllocatingInLoop) {
    {
        auto prog = program(klass("Test",
            function("churn", {"n"}, block(
                                         for_range("i", integer(1), ident("n"), block(
                                                                                    var("o", construct("Test")),
                                                                                    var("d", dict(entry("i", ident("i")))))),
                                         ret(null())))));
        Evaluator evaluator;
        evaluator.load(*prog);

        evaluator.call_class_method("Test", "churn", {Value{int64_t{20000}}});

        // dead entries are dropped as the tracking lists fill up
        EXPECT_LT(evaluator.tracked_count(), 10000u);
    }
    expect_nothing_leaked();
}
