#include <gtest/gtest.h>

#include "compiler/errors.hpp"
#include "compiler/patternCompiler.hpp"
#include "compiler/registry.hpp"
#include "compiler/subcompiler.hpp"
#include "pattern/patternParser.hpp"

using namespace treepat;

static Fragment matchAnything(Subcompiler &, const PatternNode &) {
  return Fragment::single("true", [](MatchFrame &, const Value &) { return true; });
}

static bool scopeRestored = false;

// Compiles the operand, swallowing its failure, and checks the current node
static Fragment lenientNegation(Subcompiler &compiler, const PatternNode &node) {
  try {
    compiler.compile(node.child(0));
  } catch (const CompileError &) {
    scopeRestored = compiler.context().currentNode() == &node;
  }
  return matchAnything(compiler, node);
}

TEST(Registry, BuiltinDefinitions) {
  const Registry &nodePattern = nodePatternDefinition().registry;
  const Registry &sequence = sequenceDefinition().registry;

  EXPECT_EQ(nodePatternDefinition().name, "node pattern");
  EXPECT_EQ(sequenceDefinition().name, "sequence");

  EXPECT_TRUE(nodePattern.defines(PatternType::Sequence));
  EXPECT_FALSE(nodePattern.defines(PatternType::Rest));
  EXPECT_FALSE(nodePattern.defines(PatternType::Repetition));
  EXPECT_EQ(nodePattern.lookup(PatternType::Rest), nodePattern.missingHandler());

  EXPECT_TRUE(sequence.defines(PatternType::Rest));
  EXPECT_TRUE(sequence.defines(PatternType::Repetition));
  EXPECT_NE(sequence.lookup(PatternType::Capture),
            nodePattern.lookup(PatternType::Capture));
  EXPECT_EQ(sequence.lookup(PatternType::Literal),
            nodePattern.lookup(PatternType::Literal));
}

TEST(Registry, DeriveIsIndependent) {
  Definition custom = nodePatternDefinition().derive("custom");
  custom.registry.define(PatternType::Rest, matchAnything);

  EXPECT_TRUE(custom.registry.defines(PatternType::Rest));
  EXPECT_FALSE(nodePatternDefinition().registry.defines(PatternType::Rest));

  Definition sibling = nodePatternDefinition().derive("sibling");
  EXPECT_FALSE(sibling.registry.defines(PatternType::Rest));
}

TEST(Registry, DerivedHandlerDoesNotChangeBaseBehavior) {
  PatternNodePtr pattern = PatternParser("...").parse();

  Definition custom = nodePatternDefinition().derive("custom");
  custom.registry.define(PatternType::Rest, matchAnything);
  CompilerOptions options;
  options.nodePattern = &custom;
  CompiledMatcher matcher = PatternCompiler(options).compile(*pattern);
  EXPECT_TRUE(matcher.match(Value::integer(1)).matched);

  EXPECT_THROW(PatternCompiler().compile(*pattern), CompileError);
}

TEST(Registry, MissingHandlerNamesConstructAndPosition) {
  PatternNodePtr pattern = PatternParser("(send !...)").parse();
  try {
    PatternCompiler().compile(*pattern);
    FAIL() << "expected a compile error";
  } catch (const CompileError &error) {
    EXPECT_EQ(error.diagnostic().message,
              "unsupported pattern construct 'rest' in node pattern");
    EXPECT_EQ(error.diagnostic().line, 1u);
    EXPECT_EQ(error.diagnostic().column, 8u);
  }
}

TEST(Registry, CurrentNodeRestoredAfterHandlerError) {
  Definition custom = nodePatternDefinition().derive("lenient");
  custom.registry.define(PatternType::Negation, lenientNegation);
  CompilerOptions options;
  options.nodePattern = &custom;

  scopeRestored = false;
  PatternNodePtr pattern = PatternParser("!...").parse();
  CompiledMatcher matcher = PatternCompiler(options).compile(*pattern);
  EXPECT_TRUE(scopeRestored);
  EXPECT_TRUE(matcher.match(Value::nil()).matched);
}

TEST(Registry, CompilerIsReusableAfterFailure) {
  PatternCompiler compiler;

  PatternNodePtr unbalanced = PatternParser("{$_ _}").parse();
  EXPECT_THROW(compiler.compile(*unbalanced), CompileError);

  PatternNodePtr unsupported = PatternParser("...").parse();
  EXPECT_THROW(compiler.compile(*unsupported), CompileError);

  PatternNodePtr capture = PatternParser("$_").parse();
  CompiledMatcher matcher = compiler.compile(*capture);
  EXPECT_EQ(matcher.captureCount(), 1u);
  EXPECT_EQ(matcher.parameters(), std::vector<std::string>{"node"});
  EXPECT_TRUE(matcher.match(Value::integer(7)).matched);
}
