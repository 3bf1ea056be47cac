#include "test_utils.h"

#include "wpcsh/Executor.hpp"
#include "wpcsh/Shell.hpp"

#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace wpcsh;
using namespace wpcsh::test;

namespace fs = std::filesystem;

namespace {

class Execution : public InTempDir {
protected:
  Shell shell_{makeState()};

  // Runs a line and returns its status; errors count with their status.
  int run(std::string_view line) {
    auto result = shell_.execute(line);
    return result ? *result : result.error().exitStatus();
  }

  [[nodiscard]] std::string output(std::string const& name = "out") const {
    return readFile(dir_.path() / name);
  }
};

} // namespace

TEST_F(Execution, StatusOfPreviousStatement) {
  EXPECT_EQ(run("false; echo $? > out"), 0);
  EXPECT_EQ(output(), "1\n");
  EXPECT_EQ(shell_.state().lastStatus(), 0);
}

TEST_F(Execution, AndOrLists) {
  EXPECT_EQ(run("true && echo ok > out"), 0);
  EXPECT_EQ(output(), "ok\n");

  EXPECT_EQ(run("false && echo no > skipped"), 1);
  EXPECT_FALSE(fs::exists(dir_.path() / "skipped"));
  EXPECT_EQ(shell_.state().lastStatus(), 1);

  EXPECT_EQ(run("false || echo yes > out"), 0);
  EXPECT_EQ(output(), "yes\n");

  EXPECT_EQ(run("true || echo no > skipped"), 0);
  EXPECT_FALSE(fs::exists(dir_.path() / "skipped"));
}

TEST_F(Execution, PipelineConnectsStages) {
  EXPECT_EQ(run("printf \"b\\na\\n\" | sort > out"), 0);
  EXPECT_EQ(output(), "a\nb\n");
}

TEST_F(Execution, PipelineStatusIsLastStage) {
  EXPECT_EQ(run("true | false"), 1);
  EXPECT_EQ(run("false | true"), 0);
  EXPECT_EQ(run("sh -c 'exit 3' | sh -c 'exit 5'"), 5);
}

TEST_F(Execution, OutputAndAppend) {
  EXPECT_EQ(run("echo one > f; echo two >> f"), 0);
  EXPECT_EQ(output("f"), "one\ntwo\n");
  EXPECT_EQ(run("echo three > f"), 0);
  EXPECT_EQ(output("f"), "three\n");
}

TEST_F(Execution, InputRedirect) {
  writeFile(dir_.path() / "in", "z\ny\n");
  EXPECT_EQ(run("sort < in > out"), 0);
  EXPECT_EQ(output(), "y\nz\n");
}

TEST_F(Execution, DuplicateDescriptor) {
  EXPECT_EQ(run("sh -c 'echo err >&2' > out 2>&1"), 0);
  EXPECT_EQ(output(), "err\n");
  EXPECT_EQ(run("sh -c 'echo err >&2' 2> out"), 0);
  EXPECT_EQ(output(), "err\n");
}

TEST_F(Execution, RedirectErrors) {
  auto missing = shell_.execute("cat < no-such-file");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind(), ErrorKind::INVALID_INPUT);
  EXPECT_EQ(shell_.state().lastStatus(), 1);

  auto ambiguous = shell_.execute("echo hi >& somewhere");
  ASSERT_FALSE(ambiguous.has_value());
  EXPECT_EQ(ambiguous.error().message(), "somewhere: ambiguous redirect");
}

TEST_F(Execution, RedirectOnlyCreatesFile) {
  EXPECT_EQ(run("> created"), 0);
  EXPECT_TRUE(fs::exists(dir_.path() / "created"));
  EXPECT_EQ(output("created"), "");
}

TEST_F(Execution, CommandNotFound) {
  auto result = shell_.execute("no-such-command-xyz arg");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::NOT_FOUND);
  EXPECT_EQ(result.error().message(), "no-such-command-xyz: command not found");
  EXPECT_EQ(shell_.state().lastStatus(), 127);
}

TEST_F(Execution, NotFoundStopsTheLine) {
  EXPECT_EQ(run("no-such-command-xyz; echo after > out"), 127);
  EXPECT_FALSE(fs::exists(dir_.path() / "out"));
}

TEST_F(Execution, NotFoundInPipelineWaitsForOtherStages) {
  EXPECT_EQ(run("echo hi > out | no-such-command-xyz"), 127);
  EXPECT_EQ(output(), "hi\n");
}

TEST_F(Execution, PermissionDenied) {
  writeFile(dir_.path() / "plain", "echo hi\n");
  auto result = shell_.execute("./plain");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::SPAWN_FAILED);
  EXPECT_EQ(shell_.state().lastStatus(), 126);
}

TEST_F(Execution, SignalledProcess) {
  EXPECT_EQ(run("sh -c 'kill -TERM $$'"), 128 + 15);
}

TEST_F(Execution, PrefixAssignmentOnlyForThatCommand) {
  EXPECT_EQ(run("GREETING=hi sh -c 'echo $GREETING' > out"), 0);
  EXPECT_EQ(output(), "hi\n");
  EXPECT_FALSE(shell_.state().variable("GREETING").has_value());
}

TEST_F(Execution, AssignmentAndExport) {
  EXPECT_EQ(run("X=5 Y=$X"), 0);
  EXPECT_EQ(shell_.state().variable("X"), "5");
  EXPECT_EQ(shell_.state().variable("Y"), "5");

  EXPECT_EQ(run("export Z='a $X'; export W=\"b $X\"; export V"), 0);
  EXPECT_EQ(shell_.state().variable("Z"), "a $X");
  EXPECT_EQ(shell_.state().variable("W"), "b 5");
  EXPECT_EQ(shell_.state().variable("V"), "");
}

TEST_F(Execution, VariablesReachChildren) {
  EXPECT_EQ(run("export SEEN=yes; sh -c 'echo $SEEN' > out"), 0);
  EXPECT_EQ(output(), "yes\n");
}

TEST_F(Execution, AliasApplies) {
  EXPECT_EQ(run("alias say='echo hi'"), 0);
  EXPECT_EQ(run("say there > out"), 0);
  EXPECT_EQ(output(), "hi there\n");
  EXPECT_EQ(run("'say' there > quoted"), 127);
}

TEST_F(Execution, BuiltinRedirectionIsRestored) {
  EXPECT_EQ(run("alias ll='ls -l'"), 0);
  EXPECT_EQ(run("alias > out"), 0);
  EXPECT_EQ(output(), "alias ll='ls -l'\n");
  EXPECT_EQ(run("echo after > out2"), 0);
  EXPECT_EQ(output("out2"), "after\n");
}

TEST_F(Execution, CdChangesWhereChildrenRun) {
  fs::create_directory(dir_.path() / "sub");
  EXPECT_EQ(run("cd sub && pwd > ../out"), 0);
  EXPECT_EQ(output(), (dir_.path() / "sub").string() + "\n");
  EXPECT_EQ(shell_.state().cwd(), dir_.path() / "sub");
}

TEST_F(Execution, BuiltinInPipelineRunsInChild) {
  EXPECT_EQ(run("cd / | true"), 0);
  EXPECT_EQ(shell_.state().cwd(), dir_.path());
  EXPECT_EQ(fs::current_path(), dir_.path());

  EXPECT_EQ(run("export PIPED=1 OTHER=2 | true"), 0);
  EXPECT_FALSE(shell_.state().variable("PIPED").has_value());

  EXPECT_EQ(run("alias a=b; alias | cat > out"), 0);
  EXPECT_EQ(output(), "alias a='b'\n");
}

TEST_F(Execution, BuiltinStageSeesEarlyReaderExit) {
  shell_.state().setVariable("BIG", std::string(200000, 'x'));
  alarm(30);
  EXPECT_EQ(run("export | head -c 1 > out"), 0);
  alarm(0);
  EXPECT_EQ(output().size(), 1U);
}

TEST_F(Execution, PrefixAssignmentOnBuiltin) {
  EXPECT_EQ(run("TEMPORARY=1 export > out"), 0);
  EXPECT_NE(output().find("TEMPORARY=1\n"), std::string::npos);
  EXPECT_FALSE(shell_.state().variable("TEMPORARY").has_value());

  EXPECT_EQ(run("KEPT=old"), 0);
  EXPECT_EQ(run("KEPT=new export > out"), 0);
  EXPECT_NE(output().find("KEPT=new\n"), std::string::npos);
  EXPECT_EQ(shell_.state().variable("KEPT"), "old");
}

TEST_F(Execution, PathComesFromVariables) {
  fs::create_directory(dir_.path() / "bin");
  auto script = dir_.path() / "bin" / "hello";
  writeFile(script, "#!/bin/sh\necho hello from script\n");
  ASSERT_EQ(chmod(script.c_str(), 0755), 0);

  EXPECT_EQ(run("hello > out"), 127);
  shell_.state().setVariable("PATH", (dir_.path() / "bin").string() + ":/usr/bin:/bin");
  EXPECT_EQ(run("hello > out"), 0);
  EXPECT_EQ(output(), "hello from script\n");

  shell_.state().setVariable("PATH", "");
  EXPECT_EQ(run("ls"), 127);
}

TEST_F(Execution, FindProgram) {
  auto state = makeState();
  EXPECT_EQ(findProgram("/bin/sh", state).value_or(""), "/bin/sh");
  EXPECT_EQ(findProgram("./relative", state).value_or(""), "./relative");
  auto sh = findProgram("sh", state);
  ASSERT_TRUE(sh.has_value());
  EXPECT_TRUE(sh->ends_with("/sh"));
  EXPECT_EQ(findProgram("no-such-command-xyz", state).error().kind(), ErrorKind::NOT_FOUND);
}

TEST_F(Execution, BracesInArgumentsAreLiteral) {
  EXPECT_EQ(run("echo {} } a{b} > out"), 0);
  EXPECT_EQ(output(), "{} } a{b}\n");
  writeFile(dir_.path() / "x", "");
  EXPECT_EQ(run("find . -name x -exec echo {} \\; > out"), 0);
  EXPECT_EQ(output(), "./x\n");
}

TEST_F(Execution, UnsupportedConstructs) {
  for (auto const* line : {
           "if true; then echo x > out; fi",
           "echo $(echo x) > out",
           "echo \"$(echo x)\" > out",
           "echo `echo x` > out",
           "echo \"$((1 + 2))\" > out",
           "X=`echo x` true > out",
           "sleep 0 &",
           "cat <<EOF",
           "cat <<< word",
           "for i in a; do echo $i; done",
           "f() { echo x; }",
           "(echo x)",
           "true | (echo x)",
       }) {
    auto result = shell_.execute(line);
    ASSERT_FALSE(result.has_value()) << line;
    EXPECT_EQ(result.error().kind(), ErrorKind::UNSUPPORTED) << line;
    EXPECT_EQ(shell_.state().lastStatus(), 1) << line;
  }
  EXPECT_FALSE(fs::exists(dir_.path() / "out"));
}

TEST_F(Execution, UnsupportedMessage) {
  auto result = shell_.execute("while true; do true; done");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message(), "while loop is not supported");
}

TEST_F(Execution, CommentKeepsStatus) {
  EXPECT_EQ(run("false"), 1);
  EXPECT_EQ(run("# nothing to see"), 1);
  EXPECT_EQ(run("echo a > out # trailing"), 0);
  EXPECT_EQ(output(), "a\n");
}

TEST_F(Execution, ParseErrorRunsNothing) {
  auto result = shell_.execute("echo \"abc > out");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind(), ErrorKind::INVALID_INPUT);
  EXPECT_EQ(shell_.state().lastStatus(), 2);
  EXPECT_FALSE(fs::exists(dir_.path() / "out"));
}

TEST_F(Execution, StatusVariableIsReadOnly) {
  EXPECT_EQ(run("false"), 1);
  EXPECT_EQ(run("export ?=3"), 1);
  EXPECT_FALSE(shell_.state().variables().contains("?"));
}
