#include "runtime/bytecode.hpp"
#include "runtime/debug.hpp"
#include "runtime/error.hpp"
#include "runtime/parser.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace losp;

static Chunk compileForm(const std::string& code)
{
    auto top = parse(code);
    BytecodeBuilder builder;
    top->statements_.at(0)->visit(builder);
    return builder.result();
}

static uint8_t op(Opcode opcode)
{
    return static_cast<uint8_t>(opcode);
}

static const Chunk& functionChunk(const Chunk& chunk)
{
    for (const auto& constant : chunk.constants_) {
        if (constant.type() == Value::Type::Function) {
            return constant.asFunction()->chunk();
        }
    }
    throw std::runtime_error("no function constant");
}

TEST(Compiler, Literal)
{
    auto chunk = compileForm("42");
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::Return)}),
              chunk.code_);
    ASSERT_EQ(1u, chunk.constants_.size());
    EXPECT_EQ(Value(42), chunk.constants_[0]);
    EXPECT_EQ(chunk.code_.size(), chunk.lines_.size());
}

TEST(Compiler, KeywordLiteralsNeedNoConstants)
{
    auto chunk = compileForm("(do nil true false)");
    EXPECT_EQ((Bytecode{op(Opcode::PushNull), op(Opcode::Discard),
                        op(Opcode::PushTrue), op(Opcode::Discard),
                        op(Opcode::PushFalse), op(Opcode::Return)}),
              chunk.code_);
    EXPECT_TRUE(chunk.constants_.empty());
}

TEST(Compiler, Def)
{
    auto chunk = compileForm("(def x 1)");
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::StoreGlobal), 1,
                        0, op(Opcode::PushNull), op(Opcode::Return)}),
              chunk.code_);
    EXPECT_EQ(Value("x"), chunk.constants_[1]);
}

TEST(Compiler, ConstantsAreInterned)
{
    auto chunk = compileForm("(+ 1 1 1.0 \"a\" \"a\")");
    EXPECT_EQ(3u, chunk.constants_.size());
}

TEST(Compiler, LetSlotsFollowStackDepth)
{
    auto chunk = compileForm("(let ((a 1) (b 2)) b)");
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::PushI), 1, 0,
                        op(Opcode::LoadLocal), 1, 0, op(Opcode::ExitLet), 2,
                        0, op(Opcode::Return)}),
              chunk.code_);
}

TEST(Compiler, SiblingLetsShareStackSlots)
{
    auto chunk = compileForm("(do (let (a 1) a) (let (b 2) b))");
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::LoadLocal), 0, 0,
                        op(Opcode::ExitLet), 1, 0, op(Opcode::Discard),
                        op(Opcode::PushI), 1, 0, op(Opcode::LoadLocal), 0, 0,
                        op(Opcode::ExitLet), 1, 0, op(Opcode::Return)}),
              chunk.code_);
}

TEST(Compiler, LetInsideCallArguments)
{
    auto chunk = compileForm("(foo (let (a 1) a))");
    EXPECT_EQ((Bytecode{op(Opcode::LoadGlobal), 0, 0, op(Opcode::PushI), 1, 0,
                        op(Opcode::LoadLocal), 1, 0, op(Opcode::ExitLet), 1,
                        0, op(Opcode::Call), 1, op(Opcode::Return)}),
              chunk.code_);
}

TEST(Compiler, FunctionLocalsFollowParameters)
{
    auto chunk = compileForm("(defn f (x) (let ((y 2)) (+ x y)))");
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::StoreGlobal), 1,
                        0, op(Opcode::PushNull), op(Opcode::Return)}),
              chunk.code_);
    const auto& fn = chunk.constants_[0].asFunction();
    EXPECT_EQ("f", fn->name());
    EXPECT_EQ(1u, fn->argCount());
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::LoadLocal), 0, 0,
                        op(Opcode::LoadLocal), 1, 0, op(Opcode::Add),
                        op(Opcode::ExitLet), 1, 0, op(Opcode::Return)}),
              fn->chunk().code_);
}

TEST(Compiler, FunctionsCaptureNothing)
{
    // y inside g is not the enclosing let's y: it compiles to a global load.
    auto chunk = compileForm("(let (y 1) (defn g () y))");
    const auto& body = functionChunk(chunk);
    EXPECT_EQ((Bytecode{op(Opcode::LoadGlobal), 0, 0, op(Opcode::Return)}),
              body.code_);
}

TEST(Compiler, IfBackpatching)
{
    auto chunk = compileForm("(if true 1 2)");
    EXPECT_EQ((Bytecode{op(Opcode::PushTrue), op(Opcode::JumpIfFalse), 6, 0,
                        op(Opcode::PushI), 0, 0, op(Opcode::Jump), 3, 0,
                        op(Opcode::PushI), 1, 0, op(Opcode::Return)}),
              chunk.code_);
}

TEST(Compiler, WhileLoopsBack)
{
    auto chunk = compileForm("(while x 1)");
    EXPECT_EQ((Bytecode{op(Opcode::LoadGlobal), 0, 0,
                        op(Opcode::JumpIfFalse), 7, 0, op(Opcode::PushI), 1, 0,
                        op(Opcode::Discard), op(Opcode::Loop), 13, 0,
                        op(Opcode::PushNull), op(Opcode::Return)}),
              chunk.code_);
}

TEST(Compiler, AndShortCircuits)
{
    auto chunk = compileForm("(and a b)");
    EXPECT_EQ((Bytecode{op(Opcode::LoadGlobal), 0, 0, op(Opcode::Dup),
                        op(Opcode::JumpIfFalse), 4, 0, op(Opcode::Discard),
                        op(Opcode::LoadGlobal), 1, 0, op(Opcode::Return)}),
              chunk.code_);
}

TEST(Compiler, Intrinsics)
{
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::PushI), 1, 0,
                        op(Opcode::Add), op(Opcode::Return)}),
              compileForm("(+ 1 2)").code_);
    EXPECT_EQ((Bytecode{op(Opcode::PushI), 0, 0, op(Opcode::PushI), 1, 0,
                        op(Opcode::Greater), op(Opcode::Not),
                        op(Opcode::Return)}),
              compileForm("(<= 1 2)").code_);
    EXPECT_EQ((Bytecode{op(Opcode::LoadGlobal), 0, 0, op(Opcode::Negate),
                        op(Opcode::Return)}),
              compileForm("(- x)").code_);
    EXPECT_EQ((Bytecode{op(Opcode::LoadGlobal), 0, 0, op(Opcode::Return)}),
              compileForm("(* x)").code_);
}

TEST(Compiler, LocalsShadowIntrinsics)
{
    auto chunk = compileForm("(defn f (+) (+ 1 2))");
    EXPECT_EQ((Bytecode{op(Opcode::LoadLocal), 0, 0, op(Opcode::PushI), 0, 0,
                        op(Opcode::PushI), 1, 0, op(Opcode::Call), 2,
                        op(Opcode::Return)}),
              functionChunk(chunk).code_);
}

TEST(Compiler, Errors)
{
    EXPECT_THROW(compileForm("(let ((1 2)) 1)"), CompileError);
    EXPECT_THROW(compileForm("(let (a 1 a 2) a)"), CompileError);
    EXPECT_THROW(compileForm("(defn f (a a) a)"), CompileError);
    EXPECT_THROW(compileForm("(defn 5 () 1)"), CompileError);
    EXPECT_THROW(compileForm("(defn f (1) 1)"), CompileError);
    EXPECT_THROW(compileForm("(/ 1)"), CompileError);
    EXPECT_THROW(compileForm("(= 1)"), CompileError);
    EXPECT_THROW(compileForm("(< 1 2 3)"), CompileError);
    EXPECT_THROW(compileForm("(not)"), CompileError);
    EXPECT_THROW(compileForm("(+)"), CompileError);
    EXPECT_THROW(compileForm("(print 1 2)"), CompileError);
}

TEST(Compiler, NestedLetMayShadow)
{
    EXPECT_NO_THROW(compileForm("(let (a 1) (let (a 2) a))"));
}

TEST(Compiler, LinesAreRecorded)
{
    auto chunk = compileForm("(do 1\n 2)");
    ASSERT_EQ(chunk.code_.size(), chunk.lines_.size());
    EXPECT_EQ(1u, chunk.lines_[0]);
    EXPECT_EQ(2u, chunk.lines_[4]);
}

TEST(Disassembler, DecodesOperands)
{
    auto chunk = compileForm("(def x 258)");
    auto inst = decode(chunk, 3);
    EXPECT_EQ(Opcode::StoreGlobal, inst.opcode_);
    EXPECT_EQ(1, inst.operand_);
    EXPECT_EQ(3u, inst.size_);
    EXPECT_EQ(1u, decode(chunk, 6).size_);
}

TEST(Disassembler, ListsNestedFunctions)
{
    auto chunk = compileForm("(defn f (a) (+ a 1))");
    std::stringstream out;
    disassemble(chunk, "top", out);
    const auto text = out.str();
    EXPECT_NE(std::string::npos, text.find("== top =="));
    EXPECT_NE(std::string::npos, text.find("STOREGLOBAL"));
    EXPECT_NE(std::string::npos, text.find("== fn<f> =="));
    EXPECT_NE(std::string::npos, text.find("LOADLOCAL"));
    EXPECT_NE(std::string::npos, text.find("\"f\""));
}
