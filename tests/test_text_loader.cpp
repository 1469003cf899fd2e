#include <gtest/gtest.h>

#include "loader/text_loader.hpp"
#include "test_helpers.hpp"

using depgraph::loader::Encoding;
using depgraph::loader::ReadFailure;
using depgraph::loader::TextLoader;
using depgraph::testing::TempDir;

TEST(TextLoader, LoadsUtf8)
{
  TempDir dir;
  const auto file = dir.write("util.py", "def f():\n    return '\xC3\xA9'\n");

  const auto loaded = TextLoader().load(file);
  EXPECT_EQ(loaded.encoding, Encoding::utf8);
  EXPECT_EQ(loaded.text, "def f():\n    return '\xC3\xA9'\n");
}

TEST(TextLoader, StripsByteOrderMark)
{
  TempDir dir;
  const auto file = dir.write("bom.py", "\xEF\xBB\xBFimport os\n");

  const auto loaded = TextLoader().load(file);
  EXPECT_EQ(loaded.text, "import os\n");
}

TEST(TextLoader, FallsBackToLatin1)
{
  TempDir dir;
  const auto file = dir.write("legacy.py", "name = 'caf\xE9'\n");

  const auto loaded = TextLoader().load(file);
  EXPECT_EQ(loaded.encoding, Encoding::latin1);
  EXPECT_EQ(loaded.text, "name = 'caf\xC3\xA9'\n");
}

TEST(TextLoader, MissingFileIsReadFailure)
{
  TempDir dir;
  const auto missing = dir.path() / "missing.py";

  try {
    TextLoader().load(missing);
    FAIL() << "expected ReadFailure";
  } catch (const ReadFailure &e) {
    EXPECT_EQ(e.path(), missing);
    EXPECT_FALSE(e.cause().empty());
    EXPECT_NE(std::string(e.what()).find("missing.py"), std::string::npos);
  }
}

TEST(TextLoader, UndecodableContentIsReadFailure)
{
  TempDir dir;
  const auto file = dir.write("bad.py", "x = '\xFF\xFE'\n");

  TextLoader strict(Encoding::utf8, Encoding::utf8);
  EXPECT_THROW(strict.load(file), ReadFailure);
  EXPECT_THROW(strict.decode("\xC3"), ReadFailure);
  EXPECT_EQ(strict.decode("ok").text, "ok");
}

TEST(TextLoader, EncodingNames)
{
  EXPECT_EQ(depgraph::loader::to_string(Encoding::utf8), "utf-8");
  EXPECT_EQ(depgraph::loader::to_string(Encoding::latin1), "latin-1");
}
