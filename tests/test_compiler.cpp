#include <gtest/gtest.h>

#include "compiler/errors.hpp"
#include "compiler/nodePattern.hpp"
#include "source/sourceParser.hpp"

using namespace treepat;

static NodePtr source(const std::string &text) {
  return SourceParser(text).parse().root;
}

static bool matches(const std::string &pattern, const std::string &text) {
  return NodePattern(pattern).match(source(text)).matched;
}

TEST(Compiler, NodeTypeAndSequence) {
  EXPECT_TRUE(matches("send", "foo"));
  EXPECT_FALSE(matches("int", "foo"));
  EXPECT_TRUE(matches("(send nil? :foo)", "foo"));
  EXPECT_FALSE(matches("(send nil? :foo)", "bar"));
  EXPECT_FALSE(matches("(send nil? :foo)", "x.foo"));
  EXPECT_FALSE(matches("(send nil? :foo)", "foo(1)"));
}

TEST(Compiler, Literals) {
  EXPECT_TRUE(matches("(int 1)", "1"));
  EXPECT_TRUE(matches("(int -1)", "-1"));
  EXPECT_FALSE(matches("(int 1)", "2"));
  EXPECT_TRUE(matches("(float 1.5)", "1.5"));
  EXPECT_TRUE(matches("(str \"hi\")", "\"hi\""));
  EXPECT_TRUE(matches("(sym :a)", ":a"));
  EXPECT_TRUE(matches("(send _ :+ _)", "1 + 2"));
}

TEST(Compiler, Predicates) {
  EXPECT_TRUE(matches("(send !nil? :foo)", "x.foo"));
  EXPECT_TRUE(matches("(send nil? :foo (int int?))", "foo(1)"));
  EXPECT_TRUE(matches("(send nil? :foo int_type?)", "foo(1)"));
  EXPECT_FALSE(matches("(send nil? :foo int_type?)", "foo(:a)"));
  EXPECT_TRUE(matches("(send nil? sym? (str str?))", "foo(\"s\")"));
  EXPECT_TRUE(matches("(send nil? literal? node?)", "foo(nil)"));
}

TEST(Compiler, UserPredicates) {
  CompilerOptions options;
  options.predicates.define("even?", [](const Value &value) {
    return value.isInteger() && value.asInteger() % 2 == 0;
  });
  NodePattern pattern("(int even?)", options);
  EXPECT_TRUE(pattern.match(source("2")).matched);
  EXPECT_FALSE(pattern.match(source("3")).matched);
}

TEST(Compiler, UnknownPredicate) {
  EXPECT_THROW(NodePattern("(send foo? _)"), CompileError);
}

TEST(Compiler, UnionAndIntersection) {
  EXPECT_TRUE(matches("({send csend} _ :foo)", "x.foo"));
  EXPECT_TRUE(matches("({send csend} _ :foo)", "x&.foo"));
  EXPECT_FALSE(matches("({send csend} _ :foo)", "x.bar"));
  EXPECT_TRUE(matches("[send (send nil? ...)]", "foo(1)"));
  EXPECT_FALSE(matches("[send (send !nil? ...)]", "foo(1)"));
  EXPECT_TRUE(matches("(send nil? {:foo :bar})", "bar"));
}

TEST(Compiler, Rest) {
  EXPECT_TRUE(matches("(send nil? :foo ...)", "foo"));
  EXPECT_TRUE(matches("(send nil? :foo ...)", "foo(1, 2)"));
  EXPECT_TRUE(matches("(send nil? :foo ... int)", "foo(:a, 1)"));
  EXPECT_FALSE(matches("(send nil? :foo ... int)", "foo(1, :a)"));
  EXPECT_TRUE(matches("(send nil? :foo _)", "foo(1)"));
  EXPECT_FALSE(matches("(send nil? :foo _)", "foo(1, 2)"));
}

TEST(Compiler, Repetition) {
  EXPECT_TRUE(matches("(array int*)", "[]"));
  EXPECT_TRUE(matches("(array int*)", "[1, 2]"));
  EXPECT_FALSE(matches("(array int*)", "[1, :a]"));
  EXPECT_FALSE(matches("(array int+)", "[]"));
  EXPECT_TRUE(matches("(array int+)", "[1]"));
  EXPECT_TRUE(matches("(array (int _)? sym)", "[:a]"));
  EXPECT_TRUE(matches("(array (int _)? sym)", "[1, :a]"));
  EXPECT_FALSE(matches("(array (int _)? sym)", "[1, 2, :a]"));
}

TEST(Compiler, Backtracking) {
  EXPECT_TRUE(matches("(send nil? :foo _* (sym :end))", "foo(1, 2, :end)"));
  EXPECT_TRUE(matches("(array int* int)", "[1, 2]"));
  EXPECT_FALSE(matches("(array int* int)", "[]"));
}

TEST(Compiler, Captures) {
  NodePattern pattern("(send nil? $_ $_)");
  EXPECT_EQ(pattern.matcher().captureCount(), 2u);

  MatchResult result = pattern.match(source("foo(1)"));
  ASSERT_TRUE(result.matched);
  ASSERT_EQ(result.captures.size(), 2u);
  EXPECT_EQ(result.captures[0], Value::symbol("foo"));
  ASSERT_TRUE(result.captures[1].isNode());
  EXPECT_EQ(result.captures[1].asNode()->type, "int");
}

TEST(Compiler, NoCapturesWithoutMatch) {
  MatchResult result = NodePattern("(send nil? $_ int)").match(source("foo"));
  EXPECT_FALSE(result);
  EXPECT_TRUE(result.captures.empty());
}

TEST(Compiler, VariadicCaptureIsAList) {
  MatchResult rest = NodePattern("(send nil? :foo $...)").match(source("foo(1, 2)"));
  ASSERT_TRUE(rest.matched);
  ASSERT_TRUE(rest.captures[0].isList());
  EXPECT_EQ(rest.captures[0].asList().size(), 2u);

  MatchResult repeated = NodePattern("(array $int* sym)").match(source("[1, 2, :a]"));
  ASSERT_TRUE(repeated.matched);
  ASSERT_TRUE(repeated.captures[0].isList());
  EXPECT_EQ(repeated.captures[0].asList().size(), 2u);
}

TEST(Compiler, CaptureInsideRepetitionKeepsLastValue) {
  NodePattern pattern("(array (int $_)*)");
  EXPECT_EQ(pattern.matcher().captureCount(), 1u);

  MatchResult result = pattern.match(source("[1, 2]"));
  ASSERT_TRUE(result.matched);
  ASSERT_EQ(result.captures.size(), 1u);
  EXPECT_EQ(result.captures[0], Value::integer(2));
}

TEST(Compiler, UnionBranchesShareCaptureSlots) {
  NodePattern pattern("{(int $_) (float $_)}");
  EXPECT_EQ(pattern.matcher().captureCount(), 1u);
  EXPECT_EQ(pattern.match(source("1.5")).captures[0], Value::floating(1.5));

  EXPECT_THROW(NodePattern("{(int $_) float}"), CompileError);
}

TEST(Compiler, Parameters) {
  NodePattern pattern("(send nil? %method %method)");
  std::vector<std::string> expected = {"node", "method"};
  EXPECT_EQ(pattern.matcher().parameters(), expected);

  NodePattern single("(send nil? %method)");
  EXPECT_TRUE(single.call({{"node", source("foo")}, {"method", Value::symbol("foo")}}).matched);
  EXPECT_FALSE(single.call({{"node", source("bar")}, {"method", Value::symbol("foo")}}).matched);
}

TEST(Compiler, ArgumentContract) {
  NodePattern pattern("(send nil? %method)");
  NodePtr node = source("foo");

  try {
    pattern.match(node);
    FAIL() << "expected an argument error";
  } catch (const ArgumentError &error) {
    EXPECT_EQ(error.diagnostic().message, "missing keyword: method");
  }

  EXPECT_THROW(pattern.call({{"node", node},
                             {"method", Value::symbol("foo")},
                             {"extra", Value::nil()}}),
               ArgumentError);

  Trace *noTrace = nullptr;
  EXPECT_THROW(pattern.call({{"node", node}, {"method", noTrace}}), ArgumentError);
  EXPECT_THROW(pattern.call({{"node", node},
                             {"method", Value::symbol("foo")},
                             {"trace", noTrace}}),
               ArgumentError);
}

TEST(Compiler, ReservedParameterNames) {
  EXPECT_THROW(NodePattern("(send nil? %node)"), CompileError);
  EXPECT_THROW(NodePattern("(send nil? %trace)"), CompileError);
}

TEST(Compiler, NonNodeSubject) {
  EXPECT_TRUE(NodePattern("_").match(Value::integer(1)).matched);
  EXPECT_TRUE(NodePattern("int?").match(Value::integer(1)).matched);
  EXPECT_FALSE(NodePattern("(int 1)").match(Value::integer(1)).matched);
}

TEST(Compiler, RenderedCode) {
  EXPECT_EQ(NodePattern("(send nil? :foo)").matcher().code(),
            "(node.node? && node.children.size == 2 && node.send_type? && "
            "node.children[0].nil? && node.children[1] == :foo)");
  EXPECT_EQ(NodePattern("(send _ ... :foo)").matcher().code(),
            "(node.node? && node.children.size >= 2 && node.send_type? && "
            "true && true && node.children[-1] == :foo)");
  EXPECT_EQ(NodePattern("$!nil?").matcher().code(),
            "(captures[0] = node) && !(node.nil?)");
  EXPECT_EQ(NodePattern("%a").matcher().toString(),
            "lambda(node, a) {\n  node == %a\n}");
}

TEST(Compiler, MatcherIsReusable) {
  NodePattern pattern("(send nil? $_)");
  EXPECT_EQ(pattern.match(source("foo")).captures[0], Value::symbol("foo"));
  EXPECT_EQ(pattern.match(source("bar")).captures[0], Value::symbol("bar"));
}
