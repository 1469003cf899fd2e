#include <gtest/gtest.h>

#include "config/analysis_options.hpp"
#include "utils/filesystem.hpp"
#include <stdexcept>
#include <string>

using depgraph::config::AnalysisOptions;
using depgraph::config::IdScheme;
using depgraph::config::parse_id_scheme;
using depgraph::config::parse_language_mapping;
using depgraph::utils::PathMatcher;

TEST(AnalysisOptions, Defaults)
{
  AnalysisOptions options;
  EXPECT_FALSE(options.language_table.has_value());
  EXPECT_EQ(options.max_workers, 0U);
  EXPECT_TRUE(options.ordered_merge);
  EXPECT_EQ(options.id_scheme, IdScheme::file_stem);
  EXPECT_GE(options.effective_workers(), 1U);

  options.max_workers = 3;
  EXPECT_EQ(options.effective_workers(), 3U);
}

TEST(AnalysisOptions, DefaultIgnorePatternsMatchWholeComponents)
{
  const PathMatcher matcher(AnalysisOptions::default_ignore_patterns());
  auto ignored = [&matcher](const std::string &path) { return matcher.matches(path); };

  EXPECT_TRUE(ignored(".git"));
  EXPECT_TRUE(ignored(".git/config"));
  EXPECT_TRUE(ignored("web/node_modules/react/index.js"));
  EXPECT_TRUE(ignored("pkg/__pycache__"));
  EXPECT_TRUE(ignored(".venv/lib/site.py"));
  EXPECT_FALSE(ignored(".github/workflows/ci.yml"));
  EXPECT_FALSE(ignored("src/my_node_modules.py"));
  EXPECT_FALSE(ignored("src/main.py"));
}

TEST(AnalysisOptions, ParseLanguageMapping)
{
  EXPECT_EQ(parse_language_mapping("pyw=python"), std::make_pair(std::string("pyw"), std::string("python")));
  EXPECT_EQ(parse_language_mapping(".PYI = python"), std::make_pair(std::string("pyi"), std::string("python")));

  EXPECT_THROW(parse_language_mapping("pyw"), std::invalid_argument);
  EXPECT_THROW(parse_language_mapping("=python"), std::invalid_argument);
  EXPECT_THROW(parse_language_mapping("pyw="), std::invalid_argument);
}

TEST(AnalysisOptions, ParseIdScheme)
{
  EXPECT_EQ(parse_id_scheme("stem").value(), IdScheme::file_stem);
  EXPECT_EQ(parse_id_scheme("path").value(), IdScheme::relative_path);
  EXPECT_FALSE(parse_id_scheme("uuid").has_value());
  EXPECT_EQ(depgraph::config::to_string(IdScheme::relative_path), "path");
}

TEST(FilesystemUtils, ExtensionAndRelativePath)
{
  EXPECT_EQ(depgraph::utils::extension_of("a/b/Main.PY"), "py");
  EXPECT_EQ(depgraph::utils::extension_of("Makefile"), "");
  EXPECT_EQ(depgraph::utils::relative_generic_path("/root/proj", "/root/proj/pkg/util.py"), "pkg/util.py");
}

TEST(FilesystemUtils, InvalidPatternFallsBackToSubstring)
{
  const PathMatcher matcher({"gen(old", "^build/"});
  EXPECT_TRUE(matcher.matches("src/gen(old)/a.py"));
  EXPECT_FALSE(matcher.matches("src/a.py"));
  EXPECT_TRUE(matcher.matches("build/out.py"));
  EXPECT_FALSE(matcher.matches("src/build/out.py"));
}

TEST(FilesystemUtils, EmptyMatcherMatchesNothing)
{
  const PathMatcher matcher;
  EXPECT_TRUE(matcher.empty());
  EXPECT_FALSE(matcher.matches(""));
  EXPECT_FALSE(matcher.matches("src/a.py"));
}

TEST(FilesystemUtils, MatcherIsReusedAcrossManyPaths)
{
  const PathMatcher matcher(AnalysisOptions::default_ignore_patterns());
  size_t ignored = 0;
  for (int i = 0; i < 10000; ++i) {
    const std::string dir = i % 2 == 0 ? "node_modules" : "src";
    if (matcher.matches("pkg" + std::to_string(i) + "/" + dir + "/m.js")) {
      ++ignored;
    }
  }
  EXPECT_EQ(ignored, 5000U);
}
