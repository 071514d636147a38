#include <string>

#include "gtest/gtest.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MathExtras.h"
#include "llvm/Support/Path.h"

#include "evalexpr/driver.h"
#include "test_helpers.h"

using namespace evalexpr;
using evalexpr::test::faultMessage;

namespace {

/// Runs programs the way the command line tool does, capturing print output.
class DriverTest : public ::testing::Test {
protected:
    std::string printed;
    llvm::raw_string_ostream out{printed};
    InterpreterContext ctx;

    void SetUp() override { ctx.out = &out; }

    Value eval(llvm::StringRef source) {
        llvm::Expected<Value> result = compileAndRun(source, "main.ee", ctx);
        if (!result) {
            ADD_FAILURE() << faultMessage(result.takeError());
            return Value();
        }
        return *result;
    }

    std::string evalFault(llvm::StringRef source) {
        llvm::Expected<Value> result = compileAndRun(source, "main.ee", ctx);
        if (result) {
            ADD_FAILURE() << "expected a fault, got " << result->str();
            return "";
        }
        return faultMessage(result.takeError());
    }

    std::string output() { return out.str(); }
};

} // end anonymous namespace

TEST_F(DriverTest, SequenceYieldsLastValueAndRunsInOrder) {
    EXPECT_EQ(eval("print(1); print(2); 3").str(), "3");
    EXPECT_EQ(output(), "1\n2\n");
}

TEST_F(DriverTest, LargeIntegerComparisonsAreExact) {
    EXPECT_EQ(eval("9007199254740993 == 9007199254740992.0").str(), "FALSE");
    EXPECT_EQ(eval("9007199254740993 > 9007199254740992.0").str(), "TRUE");
    EXPECT_EQ(eval("9007199254740992 == 9007199254740992.0").str(), "TRUE");
}

TEST_F(DriverTest, DivisionProducesAFloat) {
    Value v = eval("7 / 2");
    EXPECT_TRUE(v.isFloat());
    EXPECT_EQ(v.str(), "3.5");
    EXPECT_EQ(eval("4 / 2").str(), "2.0");
    EXPECT_EQ(eval("20 / 2").str(), "10.0");
    EXPECT_EQ(eval("3000 / 2").str(), "1500.0");
    EXPECT_EQ(eval("100.0").str(), "100.0");
}

TEST_F(DriverTest, PrintShowsRoundFloatsInFixedNotation) {
    eval("print(20 / 2, 100.0 * 3)");
    EXPECT_EQ(output(), "10.0 300.0\n");
}

TEST_F(DriverTest, AssignmentMutatesTheSharedEnvironment) {
    EXPECT_EQ(eval("x = 5; x + 1").str(), "6");
}

TEST_F(DriverTest, CallerKeepsTheEnvironment) {
    llvm::raw_null_ostream sink;
    Environment env = makeGlobalEnvironment(sink);
    llvm::Expected<Value> result = compileAndRun("a = b = 2; a + b", "main.ee", env, ctx);
    ASSERT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result->str(), "4");
    EXPECT_EQ(env.lookup("a")->str(), "2");
    EXPECT_EQ(env.lookup("b")->str(), "2");
}

TEST_F(DriverTest, EachRunStartsFresh) {
    eval("x = 1");
    EXPECT_EQ(evalFault("x"), "main.ee:1:1:name 'x' is not defined");
}

TEST_F(DriverTest, IfWithoutElseYieldsNone) {
    EXPECT_TRUE(eval("if FALSE then 1 end").isNone());
    EXPECT_EQ(eval("if TRUE then 1 end").str(), "1");
}

TEST_F(DriverTest, IfElseChoosesABranch) {
    EXPECT_EQ(eval("if 1 < 2 then a = 1; a + 1 else 0 end").str(), "2");
    EXPECT_EQ(eval("if 1 > 2 then 1 else 2; 3 end").str(), "3");
    EXPECT_EQ(eval("if NONE then 1 else 2 end").str(), "2");
}

TEST_F(DriverTest, ZeroIsTruthy) {
    EXPECT_EQ(eval("if 0 then 1 else 2 end").str(), "1");
}

TEST_F(DriverTest, WhileLoopAccumulates) {
    EXPECT_EQ(eval("i = 0; while i < 3 do i = i + 1 end; i").str(), "3");
}

TEST_F(DriverTest, WhileYieldsLastBodyValue) {
    EXPECT_EQ(eval("i = 0; while i < 3 do i = i + 1; i * 10 end").str(), "30");
}

TEST_F(DriverTest, WhileThatNeverRunsYieldsNone) {
    EXPECT_TRUE(eval("while FALSE do 1 end").isNone());
}

TEST_F(DriverTest, NestedLoops) {
    EXPECT_EQ(eval("total = 0; i = 0;\n"
                   "while i < 3 do\n"
                   "  j = 0;\n"
                   "  while j < 4 do total = total + 1; j = j + 1 end;\n"
                   "  i = i + 1\n"
                   "end;\n"
                   "total").str(),
              "12");
}

TEST_F(DriverTest, SinOfZero) {
    Value v = eval("sin(0)");
    ASSERT_TRUE(v.isFloat());
    EXPECT_NEAR(v.getFloat(), 0.0, 1e-12);
}

TEST_F(DriverTest, Constants) {
    EXPECT_DOUBLE_EQ(eval("pi").getFloat(), llvm::numbers::pi);
    EXPECT_NEAR(eval("sin(pi / 2)").getFloat(), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(eval("e * 2").getFloat(), 2 * llvm::numbers::e);
}

TEST_F(DriverTest, PrintReturnsNone) {
    EXPECT_TRUE(eval("print(1, 2.5, TRUE, NONE)").isNone());
    EXPECT_EQ(output(), "1 2.5 TRUE NONE\n");
}

TEST_F(DriverTest, PrintWithoutArguments) {
    eval("print()");
    EXPECT_EQ(output(), "\n");
}

TEST_F(DriverTest, NestedCalls) {
    eval("print(sin(0), print)");
    EXPECT_EQ(output(), "0.0 <built-in function print>\n");
}

TEST_F(DriverTest, LeadingSign) {
    EXPECT_EQ(eval("-2 + 3").str(), "1");
    EXPECT_EQ(eval("- 2 * 3").str(), "-6");
    EXPECT_EQ(eval("-(1 - 4)").str(), "3");
}

TEST_F(DriverTest, Comparisons) {
    EXPECT_EQ(eval("1 + 1 == 2").str(), "TRUE");
    EXPECT_EQ(eval("2 != 2.0").str(), "FALSE");
    EXPECT_EQ(eval("NONE == NONE").str(), "TRUE");
    EXPECT_EQ(eval("3 >= 4").str(), "FALSE");
}

TEST_F(DriverTest, CyrillicVariableNames) {
    EXPECT_EQ(eval("и = 2; и * 3").str(), "6");
}

TEST_F(DriverTest, BuiltinsCanBeRebound) {
    EXPECT_EQ(eval("print = 1; print + 1").str(), "2");
}

TEST_F(DriverTest, UnfinishedInputIsASyntaxFault) {
    EXPECT_EQ(evalFault("(1 + "),
              "main.ee:1:6:expected number, identifier, 'if', 'while' or '(', "
              "but got end of input");
}

TEST_F(DriverTest, CompilationFaultPreventsExecution) {
    evalFault("print(1); 1 +");
    EXPECT_EQ(output(), "");
}

TEST_F(DriverTest, UnboundVariableIsANameFault) {
    EXPECT_EQ(evalFault("y + 1"), "main.ee:1:1:name 'y' is not defined");
}

TEST_F(DriverTest, RuntimeFaultAbortsTheRun) {
    EXPECT_EQ(evalFault("print(1); z; print(2)"), "main.ee:1:11:name 'z' is not defined");
    EXPECT_EQ(output(), "1\n");
}

TEST_F(DriverTest, TypeFaultReportsOperatorPosition) {
    EXPECT_EQ(evalFault("x = NONE; x + 1"),
              "main.ee:1:13:unsupported operand types for add: 'none' and 'integer'");
}

TEST_F(DriverTest, CallingANonCallable) {
    EXPECT_EQ(evalFault("x = 5; x(1)"), "main.ee:1:9:'integer' value is not callable");
}

TEST_F(DriverTest, BuiltinFaultReportsCallPosition) {
    EXPECT_EQ(evalFault("sin(1, 2)"), "main.ee:1:4:sin expects 1 argument, got 2");
}

TEST_F(DriverTest, DivisionByZero) {
    EXPECT_EQ(evalFault("1 / (2 - 2)"), "main.ee:1:3:division by zero");
}

TEST_F(DriverTest, LexicalFault) {
    EXPECT_EQ(evalFault("1 +\n  2 & 3"), "main.ee:2:5:unrecognized input '& 3...'");
}

namespace {

/// Writes programs to temporary files and runs them through runFile.
class RunFileTest : public ::testing::Test {
protected:
    std::string printed;
    llvm::raw_string_ostream out{printed};
    std::string result;
    llvm::raw_string_ostream resultStream{result};
    InterpreterContext ctx;
    llvm::SmallVector<llvm::SmallString<128>, 2> files;

    void SetUp() override { ctx.out = &out; }

    void TearDown() override {
        for (const llvm::SmallString<128>& path : files)
            llvm::sys::fs::remove(path);
    }

    std::string writeProgram(llvm::StringRef source) {
        int fd;
        llvm::SmallString<128> path;
        std::error_code ec = llvm::sys::fs::createTemporaryFile("evalexpr", "ee", fd, path);
        if (ec) {
            ADD_FAILURE() << "cannot create temporary file: " << ec.message();
            return "";
        }
        {
            llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
            os << source;
        }
        files.push_back(path);
        return path.str().str();
    }

    int run(llvm::StringRef source) { return runFile(writeProgram(source), ctx, resultStream); }
};

} // end anonymous namespace

TEST_F(RunFileTest, SuccessPrintsResultAndExitsZero) {
    EXPECT_EQ(run("print(1); 7 / 2"), 0);
    EXPECT_EQ(out.str(), "1\n");
    EXPECT_EQ(resultStream.str(), "3.5\n");
}

TEST_F(RunFileTest, ResultCanBeSuppressed) {
    ctx.printResult = false;
    EXPECT_EQ(run("print(2); 40 + 2"), 0);
    EXPECT_EQ(out.str(), "2\n");
    EXPECT_EQ(resultStream.str(), "");
}

TEST_F(RunFileTest, CompilationFaultExitsOneWithoutRunning) {
    EXPECT_EQ(run("print(1); (2"), 1);
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(resultStream.str(), "");
}

TEST_F(RunFileTest, RuntimeFaultExitsOne) {
    EXPECT_EQ(run("print(1); missing"), 1);
    EXPECT_EQ(out.str(), "1\n");
    EXPECT_EQ(resultStream.str(), "");
}

TEST_F(RunFileTest, UnreadableFileExitsOne) {
    llvm::SmallString<128> dir;
    ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("evalexpr", dir));
    llvm::SmallString<128> missing(dir);
    llvm::sys::path::append(missing, "missing.ee");

    EXPECT_EQ(runFile(missing, ctx, resultStream), 1);
    EXPECT_EQ(resultStream.str(), "");
    llvm::sys::fs::remove(dir);
}
