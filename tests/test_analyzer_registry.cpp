#include <gtest/gtest.h>

#include "parser/analyzer_registry.hpp"
#include "parser/languages/null_analyzer.hpp"
#include "parser/languages/python_analyzer.hpp"
#include <algorithm>

using depgraph::parser::AnalyzerRegistry;
using depgraph::parser::LanguageAnalyzer;
using depgraph::parser::ParserContext;
using depgraph::parser::languages::NullAnalyzer;
using depgraph::parser::languages::PythonAnalyzer;

namespace {

class FailingAnalyzer : public NullAnalyzer {
public:
  FailingAnalyzer() : NullAnalyzer("broken", {"brk"}) {}
  bool initialize() override { return false; }
};

} // namespace

TEST(AnalyzerRegistry, DefaultRegistryLanguages)
{
  const auto registry = depgraph::parser::make_default_registry();
  const auto languages = registry.get_supported_languages();

  for (const char *language :
       {"python", "cpp", "javascript", "typescript", "java", "c", "csharp", "php", "ruby", "go", "rust"}) {
    EXPECT_NE(std::find(languages.begin(), languages.end(), language), languages.end()) << language;
  }
  EXPECT_TRUE(std::is_sorted(languages.begin(), languages.end()));
}

TEST(AnalyzerRegistry, DefaultExtensionTable)
{
  const auto table = depgraph::parser::make_default_registry().language_table();

  EXPECT_EQ(table.at("py"), "python");
  EXPECT_EQ(table.at("js"), "javascript");
  EXPECT_EQ(table.at("jsx"), "javascript");
  EXPECT_EQ(table.at("ts"), "typescript");
  EXPECT_EQ(table.at("java"), "java");
  EXPECT_EQ(table.at("cpp"), "cpp");
  EXPECT_EQ(table.at("h"), "cpp");
  EXPECT_EQ(table.at("c"), "c");
  EXPECT_EQ(table.at("cs"), "csharp");
  EXPECT_EQ(table.at("rb"), "ruby");
  EXPECT_EQ(table.at("go"), "go");
  EXPECT_EQ(table.at("rs"), "rust");
  EXPECT_EQ(table.at("php"), "php");
  EXPECT_EQ(table.count("md"), 0U);
}

TEST(AnalyzerRegistry, LookupReturnsIndependentInstances)
{
  const auto registry = depgraph::parser::make_default_registry();

  auto first = registry.analyzer_for("python");
  auto second = registry.analyzer_for("python");
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_NE(first.get(), second.get());

  ParserContext context{"class A(B):\n    pass\n", "a.py", "a"};
  EXPECT_EQ(first->analyze(context).nodes.size(), 1U);
  EXPECT_EQ(second->analyze(context).nodes.size(), 1U);
}

TEST(AnalyzerRegistry, UnknownLanguage)
{
  const auto registry = depgraph::parser::make_default_registry();
  EXPECT_EQ(registry.analyzer_for("cobol"), nullptr);
  EXPECT_FALSE(registry.supports("cobol"));
}

TEST(AnalyzerRegistry, NullAnalyzersProduceNothing)
{
  const auto registry = depgraph::parser::make_default_registry();
  auto analyzer = registry.analyzer_for("rust");
  ASSERT_NE(analyzer, nullptr);

  ParserContext context{"fn main() { println!(\"hi\"); }\n", "main.rs", "main"};
  const auto result = analyzer->analyze(context);
  EXPECT_TRUE(result.empty());
  EXPECT_FALSE(result.parse_error.has_value());
}

TEST(AnalyzerRegistry, RegistrationReplacesByLanguage)
{
  AnalyzerRegistry registry;
  ASSERT_TRUE(registry.register_analyzer<PythonAnalyzer>());
  ASSERT_TRUE(registry.register_analyzer<NullAnalyzer>("python", std::vector<std::string>{"py", "pyw"}));

  EXPECT_EQ(registry.get_supported_languages(), (std::vector<std::string>{"python"}));
  EXPECT_EQ(registry.language_table().at("pyw"), "python");

  ParserContext context{"def f():\n    pass\n", "f.py", "f"};
  EXPECT_TRUE(registry.analyzer_for("python")->analyze(context).empty());
}

TEST(AnalyzerRegistry, RejectsFailedOrNullAnalyzers)
{
  AnalyzerRegistry registry;
  EXPECT_FALSE(registry.register_analyzer<FailingAnalyzer>());
  EXPECT_FALSE(registry.register_analyzer(std::unique_ptr<LanguageAnalyzer>()));

  EXPECT_FALSE(registry.supports("broken"));
  EXPECT_TRUE(registry.language_table().empty());
}
