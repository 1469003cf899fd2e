#include <gtest/gtest.h>

#include "parser/languages/pattern_analyzer.hpp"
#include "test_helpers.hpp"

using depgraph::model::DependencyKind;
using depgraph::model::NodeKind;
using depgraph::parser::ParserContext;
using depgraph::parser::languages::PatternAnalyzer;
using depgraph::parser::languages::PatternSet;
using depgraph::testing::edge_targets;
using depgraph::testing::node_names;

namespace {

const std::string kAppSource =
  "import React from 'react';\n"
  "import { useState } from 'react';\n"
  "const path = require('path');\n"
  "const fs = require(\"fs\");\n"
  "\n"
  "function render(props) {\n"
  "  return null;\n"
  "}\n"
  "\n"
  "class Component {}\n"
  "class App extends Component {}\n";

} // namespace

TEST(PatternAnalyzer, JavaScriptFunctionsThenClasses)
{
  PatternAnalyzer analyzer(depgraph::parser::languages::javascript_patterns());
  ASSERT_TRUE(analyzer.initialize());

  ParserContext context{kAppSource, "/web/app.js", "app"};
  const auto result = analyzer.analyze(context);

  EXPECT_FALSE(result.parse_error.has_value());
  EXPECT_EQ(node_names(result.nodes), (std::vector<std::string>{"render", "Component", "App"}));
  EXPECT_EQ(result.nodes[0].kind, NodeKind::function);
  EXPECT_EQ(result.nodes[1].kind, NodeKind::class_);

  for (const auto &node : result.nodes) {
    EXPECT_EQ(node.language, "javascript");
    EXPECT_EQ(node.path, "/web/app.js");
    EXPECT_EQ(node.line, 0U);
    EXPECT_DOUBLE_EQ(node.complexity, 1.0);
    EXPECT_EQ(node.lines_of_code, 0U);
    EXPECT_TRUE(node.dependency_refs.empty());
  }
  EXPECT_EQ(result.nodes[2].id, "app.App");
}

TEST(PatternAnalyzer, ImportAndRequireTargets)
{
  PatternAnalyzer analyzer(depgraph::parser::languages::javascript_patterns());
  ParserContext context{kAppSource, "/web/app.js", "app"};
  const auto result = analyzer.analyze(context);

  EXPECT_EQ(edge_targets(result.edges, DependencyKind::imports),
            (std::vector<std::string>{"react", "react", "path", "fs"}));
  for (const auto &edge : result.edges) {
    EXPECT_EQ(edge.source, "app");
    EXPECT_FALSE(edge.line.has_value());
  }
}

TEST(PatternAnalyzer, TypeScriptIsTaggedSeparately)
{
  PatternAnalyzer analyzer(depgraph::parser::languages::typescript_patterns());
  EXPECT_EQ(analyzer.get_language_name(), "typescript");

  ParserContext context{"import * as fs from 'fs';\nexport class Store {}\n", "store.ts", "store"};
  const auto result = analyzer.analyze(context);

  ASSERT_EQ(result.nodes.size(), 1U);
  EXPECT_EQ(result.nodes[0].language, "typescript");
  EXPECT_EQ(edge_targets(result.edges, DependencyKind::imports), (std::vector<std::string>{"fs"}));
}

TEST(PatternAnalyzer, UnrecognizedTextYieldsNothing)
{
  PatternAnalyzer analyzer(depgraph::parser::languages::javascript_patterns());
  ParserContext context{"}}}{{ not javascript (((", "junk.js", "junk"};
  const auto result = analyzer.analyze(context);

  EXPECT_TRUE(result.empty());
  EXPECT_FALSE(result.parse_error.has_value());
}

TEST(PatternAnalyzer, CustomPatternSetAndClone)
{
  PatternSet set;
  set.language = "lua";
  set.extensions = {"lua"};
  set.import_patterns = {R"(require[[:space:]]*\(?[[:space:]]*['"]([^'"]+)['"])"};
  set.function_patterns = {R"(function[[:space:]]+([[:alnum:]_.:]+)[[:space:]]*\()"};

  PatternAnalyzer prototype(set);
  auto analyzer = prototype.clone();
  ASSERT_TRUE(analyzer->initialize());
  EXPECT_EQ(analyzer->get_extensions(), (std::vector<std::string>{"lua"}));

  ParserContext context{"local json = require 'json'\nfunction M.encode(v)\nend\n", "m.lua", "m"};
  const auto result = analyzer->analyze(context);

  EXPECT_EQ(node_names(result.nodes), (std::vector<std::string>{"M.encode"}));
  EXPECT_EQ(edge_targets(result.edges, DependencyKind::imports), (std::vector<std::string>{"json"}));
}

TEST(PatternAnalyzer, InvalidPatternFailsInitialization)
{
  PatternSet set;
  set.language = "broken";
  set.extensions = {"brk"};
  set.class_patterns = {"class[[:space:]]+(unclosed"};

  PatternAnalyzer analyzer(set);
  EXPECT_FALSE(analyzer.initialize());
}

TEST(PatternAnalyzer, UnterminatedImportOverAMegabyte)
{
  const std::string source = "import {" + std::string(1 << 20, 'a') + "\nfunction ok() {}\n";

  PatternAnalyzer analyzer(depgraph::parser::languages::javascript_patterns());
  ASSERT_TRUE(analyzer.initialize());
  ParserContext context{source, "big.js", "big"};
  const auto result = analyzer.analyze(context);

  EXPECT_FALSE(result.parse_error.has_value());
  EXPECT_EQ(node_names(result.nodes), (std::vector<std::string>{"ok"}));
  EXPECT_TRUE(result.edges.empty());
}

TEST(PatternAnalyzer, LongRunsBetweenMatches)
{
  const std::string filler(1 << 20, ' ');
  const std::string source = "const a = require('left');" + filler +
                             "function " + std::string(1 << 12, 'x') + "() {}" + filler +
                             "import { b } from 'right';\n";

  PatternAnalyzer analyzer(depgraph::parser::languages::javascript_patterns());
  ParserContext context{source, "wide.js", "wide"};
  const auto result = analyzer.analyze(context);

  ASSERT_EQ(result.nodes.size(), 1U);
  EXPECT_EQ(result.nodes[0].name.size(), 1U << 12);
  EXPECT_EQ(edge_targets(result.edges, DependencyKind::imports),
            (std::vector<std::string>{"right", "left"}));
}

TEST(PatternAnalyzer, ClonesAnalyzeIndependently)
{
  PatternAnalyzer prototype(depgraph::parser::languages::javascript_patterns());
  auto first = prototype.clone();
  auto second = first->clone();
  ASSERT_TRUE(first->initialize());
  ASSERT_TRUE(second->initialize());

  ParserContext context{kAppSource, "/web/app.js", "app"};
  EXPECT_EQ(node_names(first->analyze(context).nodes), node_names(second->analyze(context).nodes));
  EXPECT_EQ(node_names(second->analyze(context).nodes), node_names(prototype.analyze(context).nodes));
}
