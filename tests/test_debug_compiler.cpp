#include <gtest/gtest.h>

#include "compiler/debug/debugCompiler.hpp"
#include "compiler/errors.hpp"
#include "pattern/patternParser.hpp"
#include "source/sourceParser.hpp"
#include "trace/trace.hpp"

#include <utility>

using namespace treepat;

static NodePtr source(const std::string &text) {
  return SourceParser(text).parse().root;
}

// Pattern text of every identity, in identity order
static std::vector<std::string> identities(const std::string &pattern) {
  PatternNodePtr tree = PatternParser(pattern).parse();
  DebugCompiler compiler;
  compiler.compile(*tree);
  std::vector<std::string> result;
  for (const PatternNode *node : compiler.nodeIds().nodes()) {
    result.push_back(node->toString());
  }
  return result;
}

TEST(DebugCompiler, IdentitiesFollowPreOrder) {
  PatternNodePtr pattern = PatternParser("(send nil? :foo)").parse();
  DebugCompiler compiler;
  compiler.compile(*pattern);

  const NodeIds &ids = compiler.nodeIds();
  ASSERT_EQ(ids.size(), 4u);
  EXPECT_EQ(ids.find(*pattern), std::optional<NodeId>(0));
  EXPECT_EQ(ids.find(pattern->child(0)), std::optional<NodeId>(1));
  EXPECT_EQ(ids.find(pattern->child(1)), std::optional<NodeId>(2));
  EXPECT_EQ(ids.find(pattern->child(2)), std::optional<NodeId>(3));
  EXPECT_EQ(&ids.node(3), &pattern->child(2));
}

TEST(DebugCompiler, IdentitiesAreDeterministic) {
  EXPECT_EQ(identities("(send {nil? _} $... (int 1))"),
            identities("(send {nil? _} $... (int 1))"));
}

TEST(DebugCompiler, IdentitiesAreKeyedByObject) {
  PatternNodePtr pattern = PatternParser("(send _ _)").parse();
  PatternNodePtr twin = PatternParser("(send _ _)").parse();
  DebugCompiler compiler;
  compiler.compile(*pattern);

  EXPECT_NE(compiler.nodeIds().find(pattern->child(1)),
            compiler.nodeIds().find(pattern->child(2)));
  EXPECT_FALSE(compiler.nodeIds().find(*twin).has_value());
}

TEST(DebugCompiler, DeclaresTraceParameter) {
  PatternNodePtr pattern = PatternParser("(send nil? %method)").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  std::vector<std::string> expected = {"node", "method", "trace"};
  EXPECT_EQ(matcher.parameters(), expected);
  EXPECT_TRUE(matcher.traced());
}

TEST(DebugCompiler, WrapsRenderedCode) {
  PatternNodePtr pattern = PatternParser("_").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  EXPECT_EQ(matcher.code(), "(trace.enter(0) && true && trace.success(0))");
}

TEST(DebugCompiler, RequiresTrace) {
  PatternNodePtr pattern = PatternParser("send").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  NodePtr node = source("foo");

  EXPECT_THROW(matcher.match(node), ArgumentError);
  Trace *noTrace = nullptr;
  EXPECT_THROW(matcher.call({{"node", node}, {"trace", noTrace}}), ArgumentError);
  EXPECT_THROW(matcher.call({{"node", node}, {"trace", Value::nil()}}),
               ArgumentError);
}

TEST(DebugCompiler, MatchesLikePlainCompiler) {
  const std::vector<std::pair<std::string, std::string>> cases = {
      {"(send nil? :foo)", "foo"},
      {"(send nil? :foo)", "bar"},
      {"(send nil? $_ $...)", "foo(1, 2)"},
      {"(array $int* (int _)? sym)", "[1, 2, :a]"},
      {"(send {nil? (send nil? _)} $_)", "a.b"},
      {"[!int $(send ...)]", "x.y(1)"},
      {"(send nil? :foo _* $(sym _))", "foo(1, :a, :b)"},
  };

  for (const auto &[patternText, sourceText] : cases) {
    PatternNodePtr pattern = PatternParser(patternText).parse();
    CompiledMatcher plain = PatternCompiler().compile(*pattern);
    CompiledMatcher traced = DebugCompiler().compile(*pattern);
    NodePtr node = source(sourceText);

    Trace trace;
    MatchResult expected = plain.match(node);
    MatchResult actual = traced.match(node, trace);
    EXPECT_EQ(actual.matched, expected.matched) << patternText << " on " << sourceText;
    EXPECT_EQ(actual.captures, expected.captures) << patternText << " on " << sourceText;
  }
}

TEST(DebugCompiler, FailedNodeIsEnteredButNotSucceeded) {
  // 0 sequence, 1 send, 2 negation, 3 nil?, 4 :foo
  PatternNodePtr pattern = PatternParser("(send !nil? :foo)").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);

  Trace trace;
  EXPECT_FALSE(matcher.match(source("bar"), trace).matched);
  EXPECT_EQ(trace.matched(0), std::optional<bool>(false));
  EXPECT_EQ(trace.matched(1), std::optional<bool>(true));
  EXPECT_EQ(trace.matched(2), std::optional<bool>(false));
  EXPECT_EQ(trace.matched(3), std::optional<bool>(true));
  EXPECT_EQ(trace.matched(4), std::nullopt);
}

TEST(DebugCompiler, SuccessOnlyWhereMatched) {
  // 0 sequence, 1 send, 2 nil?, 3 :foo
  PatternNodePtr pattern = PatternParser("(send nil? :foo)").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);

  Trace trace;
  EXPECT_FALSE(matcher.match(source("bar"), trace).matched);
  EXPECT_EQ(trace.matched(0), std::optional<bool>(false));
  EXPECT_EQ(trace.matched(1), std::optional<bool>(true));
  EXPECT_EQ(trace.matched(2), std::optional<bool>(true));
  EXPECT_EQ(trace.matched(3), std::optional<bool>(false));
}

TEST(DebugCompiler, FreshTracesDoNotShareEntries) {
  PatternNodePtr pattern = PatternParser("(send nil? :foo)").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  NodePtr call = source("foo");
  NodePtr number = source("1");

  Trace first;
  EXPECT_TRUE(matcher.match(call, first).matched);
  Trace second;
  EXPECT_FALSE(matcher.match(number, second).matched);

  EXPECT_EQ(first.matched(1), std::optional<bool>(true));
  EXPECT_EQ(second.matched(0), std::optional<bool>(false));
  EXPECT_EQ(second.matched(1), std::nullopt);
  EXPECT_EQ(second.visits().size(), 1u);
  EXPECT_FALSE(second.binding(*call).has_value());
}

TEST(DebugCompiler, BindsExaminedNodes) {
  // 0 sequence, 1 send, 2 nil?, 3 :foo, 4 (int 1), 5 int, 6 1, 7 (int 2), 8 int, 9 2
  PatternNodePtr pattern =
      PatternParser("(send nil? :foo (int 1) (int 2))").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  NodePtr node = source("foo(2, 3)");

  Trace trace;
  EXPECT_FALSE(matcher.match(node, trace).matched);
  EXPECT_EQ(trace.binding(*node), std::optional<NodeId>(0));
  EXPECT_EQ(trace.binding(*node->children[2].asNode()), std::optional<NodeId>(4));
  EXPECT_EQ(trace.binding(*node->children[3].asNode()), std::optional<NodeId>(7));
  EXPECT_EQ(trace.matched(4), std::optional<bool>(false));
  EXPECT_EQ(trace.matched(7), std::nullopt);
}

TEST(DebugCompiler, BindsNodesConsumedByVariadicTerms) {
  // 0 sequence, 1 send, 2 nil?, 3 :foo, 4 ...
  PatternNodePtr pattern = PatternParser("(send nil? :foo ...)").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  NodePtr node = source("foo(1, 2)");

  Trace trace;
  EXPECT_TRUE(matcher.match(node, trace).matched);
  EXPECT_EQ(trace.binding(*node->children[2].asNode()), std::optional<NodeId>(4));
  EXPECT_EQ(trace.binding(*node->children[3].asNode()), std::optional<NodeId>(4));
  EXPECT_EQ(trace.matched(4), std::optional<bool>(true));
}

TEST(DebugCompiler, RepeatedNodesBelongToTheRepetition) {
  // 0 sequence, 1 array, 2 repetition, 3 (int _), 4 int, 5 _, 6 (str _), 7 str, 8 _
  PatternNodePtr pattern = PatternParser("(array (int _)* (str _))").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  NodePtr node = source("[1, 2, \"a\"]");

  Trace trace;
  EXPECT_TRUE(matcher.match(node, trace).matched);
  // The greedy attempt on the string leaves the inner term failed
  EXPECT_EQ(trace.matched(3), std::optional<bool>(false));
  EXPECT_EQ(trace.matched(2), std::optional<bool>(true));

  EXPECT_EQ(trace.binding(*node), std::optional<NodeId>(0));
  EXPECT_EQ(trace.binding(*node->children[0].asNode()), std::optional<NodeId>(2));
  EXPECT_EQ(trace.binding(*node->children[1].asNode()), std::optional<NodeId>(2));
  EXPECT_EQ(trace.binding(*node->children[2].asNode()), std::optional<NodeId>(6));
}

TEST(DebugCompiler, FailedUnionBranchGivesNodesBack) {
  // 0 union, 1 first branch, 5 (int _), 8 second branch, 12 (str _)
  PatternNodePtr pattern =
      PatternParser("{(send nil? :foo (int _)) (send nil? :foo (str _))}")
          .parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  NodePtr node = source("foo(\"x\")");

  Trace trace;
  EXPECT_TRUE(matcher.match(node, trace).matched);
  EXPECT_EQ(trace.matched(5), std::optional<bool>(false));
  EXPECT_EQ(trace.binding(*node), std::optional<NodeId>(0));
  EXPECT_EQ(trace.binding(*node->children[2].asNode()), std::optional<NodeId>(12));
  EXPECT_EQ(trace.matched(12), std::optional<bool>(true));
}

TEST(DebugCompiler, NegatedMatchConfirmsNothingInside) {
  // 0 sequence, 1 send, 2 nil?, 3 :foo, 4 negation, 5 (int _), 6 int, 7 _
  PatternNodePtr pattern = PatternParser("(send nil? :foo !(int _))").parse();
  CompiledMatcher matcher = DebugCompiler().compile(*pattern);
  NodePtr node = source("foo(1)");

  Trace trace;
  EXPECT_FALSE(matcher.match(node, trace).matched);
  EXPECT_EQ(trace.matched(5), std::optional<bool>(true));
  EXPECT_EQ(trace.matched(4), std::optional<bool>(false));
  EXPECT_EQ(trace.binding(*node->children[2].asNode()), std::optional<NodeId>(4));
}
