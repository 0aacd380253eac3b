// tests/unit/driver/test_completion.cpp - Shell completion scripts

#include <gtest/gtest.h>

#include <string>

#include "schema_gen/driver/completion.hpp"

using namespace schema_gen;

namespace
{

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(CompletionTest, ParseShell)
{
  EXPECT_EQ(parse_shell("bash"), Shell::Bash);
  EXPECT_EQ(parse_shell("zsh"), Shell::Zsh);
  EXPECT_EQ(parse_shell("fish"), Shell::Fish);
  EXPECT_FALSE(parse_shell("Bash").has_value());
  EXPECT_FALSE(parse_shell("powershell").has_value());
  EXPECT_FALSE(parse_shell("").has_value());

  for (const Shell shell : {Shell::Bash, Shell::Zsh, Shell::Fish}) {
    EXPECT_EQ(parse_shell(to_string(shell)), shell);
  }
}

TEST(CompletionTest, EveryScriptCoversTheCommandLine)
{
  for (const Shell shell : {Shell::Bash, Shell::Zsh, Shell::Fish}) {
    const std::string script = generate_completion(shell, "schemagen");
    SCOPED_TRACE(to_string(shell));

    EXPECT_TRUE(contains(script, "schemagen"));
    EXPECT_TRUE(contains(script, "basic standard comprehensive expert"));
    EXPECT_TRUE(contains(script, "saturate error"));
    EXPECT_TRUE(contains(script, "completion"));
    EXPECT_TRUE(contains(script, "init-config"));
    EXPECT_TRUE(contains(script, "bash zsh fish"));
    EXPECT_TRUE(contains(script, "validate"));
    EXPECT_TRUE(contains(script, "overflow"));
  }
}

TEST(CompletionTest, Bash)
{
  const std::string script = generate_completion(Shell::Bash, "schemagen");

  EXPECT_TRUE(contains(script, "_schemagen() {"));
  EXPECT_TRUE(contains(script, "-t|--tier)"));
  EXPECT_TRUE(contains(script, "-o|--output|-c|--config)"));
  EXPECT_TRUE(contains(script, "complete -F _schemagen schemagen\n"));
}

TEST(CompletionTest, Zsh)
{
  const std::string script = generate_completion(Shell::Zsh, "schemagen");

  EXPECT_EQ(script.rfind("#compdef schemagen\n", 0), 0U);
  EXPECT_TRUE(contains(script, "'(-o --output)'{-o,--output}'[Output file path]:file:_files'"));
  EXPECT_TRUE(contains(script, "'--verbose[Print progress]'"));
  EXPECT_TRUE(contains(script, ":tier:(basic standard comprehensive expert)"));
}

TEST(CompletionTest, Fish)
{
  const std::string script = generate_completion(Shell::Fish, "schemagen");

  EXPECT_TRUE(contains(script, "complete -c schemagen -s t -l tier -x -a "));
  EXPECT_TRUE(contains(script, "complete -c schemagen -l overflow -x -a 'saturate error'"));
  EXPECT_TRUE(contains(script, "complete -c schemagen -s o -l output -r -F"));
}

TEST(CompletionTest, ProgramNameIsSanitizedForFunctions)
{
  const std::string script = generate_completion(Shell::Bash, "schema-gen.v2");

  EXPECT_TRUE(contains(script, "_schema_gen_v2() {"));
  EXPECT_TRUE(contains(script, "complete -F _schema_gen_v2 schema-gen.v2\n"));
}
