#include <gtest/gtest.h>

#include "AssertionReporter.hpp"
#include "ClassRuntime.hpp"
#include "ScriptError.hpp"
#include "ast_builder.hpp"
#include "evaluator.hpp"

using namespace AstBuilder;

// Point with a constructor, a getter that uses self, a sibling call and a class-level helper
static ClassDeclPtr point_class() {
    return klass("Point",
        field("x", integer(0)),
        field("y", integer(0)),
        function("constructor", {"x", "y"}, block(
                                                assign(member(self(), "x"), ident("x")),
                                                assign(member(self(), "y"), ident("y")))),
        function("sum", {}, block(ret(binary(member(self(), "x"), "+", member(self(), "y"))))),
        function("doubled", {}, block(ret(binary(call_name("sum"), "*", integer(2))))),
        function("origin_name", {}, block(ret(str("origin")))),
        function("whoami", {}, block(ret(self()))));
}

static RunResult run_with(ClassDeclPtr extra, StatementList main_body) {
    auto prog = program(std::move(extra), klass("Test", function("main", {}, std::move(main_body))));
    return run_program(*prog);
}

// ============================================================================
// BARE CALLS
// ============================================================================

TEST(DispatchTest, BareCallResolvesSiblingMethodWithSameSelf) {
    RunResult r = run_with(point_class(), block(
                                              var("p", construct("Point", integer(3), integer(4))),
                                              ret(method_call(ident("p"), "doubled"))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<int64_t>(r.value), 14);
}

TEST(DispatchTest, BareCallFallsBackToFreeFunction) {
    auto prog = program(
        function("square", {"n"}, block(ret(binary(ident("n"), "*", ident("n"))))),
        klass("Test", function("main", {}, block(ret(call_name("square", integer(9)))))));

    RunResult r = run_program(*prog);

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<int64_t>(r.value), 81);
}

TEST(DispatchTest, ClassMethodWinsOverFreeFunctionOfSameName) {
    auto prog = program(
        function("pick", {}, block(ret(str("free")))),
        klass("Test",
            function("pick", {}, block(ret(str("method")))),
            function("main", {}, block(ret(call_name("pick"))))));

    RunResult r = run_program(*prog);

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<std::string>(r.value), "method");
}

TEST(DispatchTest, BareCallToUnknownNameIsUnboundNameError) {
    RunResult r = run_with(point_class(), block(expr_stmt(call_name("nowhere"))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::UnboundNameError);
}

TEST(DispatchTest, CallingNonCallableIsTypeError) {
    RunResult r = run_with(point_class(), block(
                                              var("n", integer(1)),
                                              expr_stmt(call_name("n"))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::TypeError);
}

// ============================================================================
// INSTANCE CALLS
// ============================================================================

TEST(DispatchTest, InstanceCallBindsSelf) {
    RunResult r = run_with(point_class(), block(
                                              var("p", construct("Point", integer(1), integer(2))),
                                              var("q", construct("Point", integer(10), integer(20))),
                                              assertion(binary(method_call(ident("p"), "whoami"), "==", ident("p"))),
                                              ret(binary(method_call(ident("p"), "sum"), "+", method_call(ident("q"), "sum")))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<int64_t>(r.value), 33);
}

TEST(DispatchTest, InstanceCallFallsBackToFunctionField) {
    RunResult r = run_with(point_class(), block(
                                              var("p", construct("Point", integer(1), integer(2))),
                                              assign(member(ident("p"), "scale"),
                                                  lambda({"k"}, block(ret(binary(ident("k"), "*", integer(2)))))),
                                              ret(method_call(ident("p"), "scale", integer(21)))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<int64_t>(r.value), 42);
}

TEST(DispatchTest, CallingNonFunctionFieldIsTypeError) {
    RunResult r = run_with(point_class(), block(
                                              var("p", construct("Point", integer(1), integer(2))),
                                              expr_stmt(method_call(ident("p"), "x"))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::TypeError);
}

TEST(DispatchTest, InstanceCallOfUnknownMemberIsMemberNotFound) {
    RunResult r = run_with(point_class(), block(
                                              var("p", construct("Point", integer(1), integer(2))),
                                              expr_stmt(method_call(ident("p"), "area"))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::MemberNotFoundError);
}

TEST(DispatchTest, MethodReadThroughInstanceStaysBound) {
    RunResult r = run_with(point_class(), block(
                                              var("p", construct("Point", integer(5), integer(6))),
                                              var("f", member(ident("p"), "sum")),
                                              ret(call(ident("f")))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<int64_t>(r.value), 11);
}

TEST(DispatchTest, DictEntryHoldingFunctionIsCallable) {
    RunResult r = run_with(point_class(), block(
                                              var("ops", dict(entry("inc", lambda({"n"}, block(ret(binary(ident("n"), "+", integer(1)))))))),
                                              ret(method_call(ident("ops"), "inc", integer(41)))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<int64_t>(r.value), 42);
}

// ============================================================================
// CLASS-QUALIFIED CALLS
// ============================================================================

TEST(DispatchTest, ClassQualifiedCallRunsWithoutInstance) {
    RunResult r = run_with(point_class(), block(ret(method_call(ident("Point"), "origin_name"))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<std::string>(r.value), "origin");
}

TEST(DispatchTest, ClassQualifiedCallTouchingSelfIsUnboundName) {
    RunResult r = run_with(point_class(), block(ret(method_call(ident("Point"), "sum"))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::UnboundNameError);
    EXPECT_NE(r.error->message.find("self"), std::string::npos);
}

TEST(DispatchTest, ClassQualifiedCallOfUnknownMethodIsMemberNotFound) {
    RunResult r = run_with(point_class(), block(ret(method_call(ident("Point"), "area"))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::MemberNotFoundError);
}

TEST(DispatchTest, MethodReadThroughClassIsUnbound) {
    RunResult r = run_with(point_class(), block(
                                              var("f", member(ident("Point"), "origin_name")),
                                              ret(call(ident("f")))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<std::string>(r.value), "origin");
}

TEST(DispatchTest, CallingAClassDirectlyIsTypeError) {
    RunResult r = run_with(point_class(), block(expr_stmt(call_name("Point"))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::TypeError);
}

// ============================================================================
// INVOCATION
// ============================================================================

TEST(DispatchTest, ArityMismatchIsArityError) {
    RunResult r = run_with(point_class(), block(
                                              var("p", construct("Point", integer(1), integer(2))),
                                              expr_stmt(method_call(ident("p"), "sum", integer(1)))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ArityError);
}

TEST(DispatchTest, ConstructorArityIsChecked) {
    RunResult r = run_with(point_class(), block(expr_stmt(construct("Point", integer(1)))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ArityError);
}

TEST(DispatchTest, ArgumentsWithoutConstructorAreArityError) {
    RunResult r = run_with(klass("Plain"), block(expr_stmt(construct("Plain", integer(1)))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ArityError);
}

TEST(DispatchTest, BodyWithoutReturnYieldsNull) {
    auto prog = program(klass("Test",
        function("nothing", {}, block(var("x", integer(1)))),
        function("bare", {}, block(ret())),
        function("main", {}, block(
                                 assertion(binary(call_name("nothing"), "==", null())),
                                 assertion(binary(call_name("bare"), "==", null())),
                                 ret(integer(1))))));

    RunResult r = run_program(*prog);

    ASSERT_TRUE(r.ok()) << r.error->rendered;
}

TEST(DispatchTest, FirstReturnUnwindsNestedBlocks) {
    auto prog = program(klass("Test",
        function("find", {"xs", "target"}, block(
                                               for_in("x", ident("xs"), block(
                                                                            if_stmt(binary(ident("x"), "==", ident("target")), block(ret(ident("x")))))),
                                               ret(unary("-", integer(1))))),
        function("main", {}, block(
                                 ret(call_name("find", list(integer(4), integer(8), integer(15)), integer(8)))))));

    RunResult r = run_program(*prog);

    ASSERT_TRUE(r.ok()) << r.error->rendered;
    EXPECT_EQ(std::get<int64_t>(r.value), 8);
}

TEST(DispatchTest, FunctionLiteralsDoNotCaptureLocals) {
    RunResult r = run_with(point_class(), block(
                                              var("local", integer(1)),
                                              var("f", lambda({}, block(ret(ident("local"))))),
                                              ret(call(ident("f")))));

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::UnboundNameError);
}

TEST(DispatchTest, FieldInitializersRunPerInstance) {
    auto bag = klass("Bag", field("items", list()), field("owner", self()));

    RunResult r = run_with(std::move(bag), block(
                                               var("a", construct("Bag")),
                                               var("b", construct("Bag")),
                                               assertion(binary(member(ident("a"), "items"), "!=", member(ident("b"), "items"))),
                                               assertion(binary(member(ident("a"), "owner"), "==", ident("a"))),
                                               ret(boolean(true))));

    ASSERT_TRUE(r.ok()) << r.error->rendered;
}

// ============================================================================
// CALL DEPTH
// ============================================================================

static std::unique_ptr<ProgramNode> countdown_program() {
    // down(n) recurses n more times before returning
    return program(klass("Test",
        function("down", {"n"}, block(
                                    if_stmt(binary(ident("n"), "==", integer(0)), block(ret(integer(0)))),
                                    ret(call_name("down", binary(ident("n"), "-", integer(1)))))),
        function("forever", {}, block(ret(call_name("forever")))),
        function("main", {}, block(ret(call_name("forever"))))));
}

TEST(DispatchTest, DepthLimitCountsEveryActiveCall) {
    auto prog = countdown_program();
    RuntimeOptions options;
    options.max_call_depth = 10;

    Evaluator evaluator(options);
    evaluator.load(*prog);

    // down(9) .. down(0) is exactly ten frames
    EXPECT_NO_THROW(evaluator.call_class_method("Test", "down", {Value{int64_t{9}}}));
    EXPECT_EQ(evaluator.call_depth(), 0u);

    try {
        evaluator.call_class_method("Test", "down", {Value{int64_t{10}}});
        FAIL() << "expected StackOverflow";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::StackOverflow);
    }
    // frames unwound on the way out
    EXPECT_EQ(evaluator.call_depth(), 0u);
}

TEST(DispatchTest, UnboundedRecursionIsStackOverflow) {
    auto prog = countdown_program();

    RunResult r = run_program(*prog);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.status, RunStatus::StackOverflow);
    EXPECT_EQ(r.error->kind, ErrorKind::StackOverflow);
    EXPECT_EQ(exit_code(r.status), 3);
}

// ============================================================================
// LOADING & ENTRY POINT
// ============================================================================

TEST(DispatchTest, DuplicateClassIsRedefinitionError) {
    auto prog = program(klass("Test"), klass("Test"));

    Evaluator evaluator;
    try {
        evaluator.load(*prog);
        FAIL() << "expected RedefinitionError";
    } catch (const ScriptError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RedefinitionError);
    }
}

TEST(DispatchTest, DuplicateMethodIsRedefinitionError) {
    auto prog = program(klass("Test",
        function("main", {}, block()),
        function("main", {}, block())));

    RunResult r = run_program(*prog);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::RedefinitionError);
}

TEST(DispatchTest, EntryPointIsConfigurable) {
    auto prog = program(klass("App", function("start", {"name"}, block(ret(binary(str("hello "), "+", ident("name")))))));
    RuntimeOptions options;
    options.entry_class = "App";
    options.entry_method = "start";

    Evaluator evaluator(options);
    evaluator.load(*prog);
    Value result = evaluator.run({Value{std::string("world")}});

    EXPECT_EQ(std::get<std::string>(result), "hello world");
}

TEST(DispatchTest, MissingEntryPoint) {
    auto no_class = program(klass("Other", function("main", {}, block())));
    RunResult r = run_program(*no_class);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::UnboundNameError);

    auto no_method = program(klass("Test", function("start", {}, block())));
    r = run_program(*no_method);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::MemberNotFoundError);
}

TEST(DispatchTest, MainWithParametersNeedsHostArguments) {
    auto prog = program(klass("Test", function("main", {"argv"}, block(ret(ident("argv"))))));

    RunResult r = run_program(*prog);

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, ErrorKind::ArityError);
}
