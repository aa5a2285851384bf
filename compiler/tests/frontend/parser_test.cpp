#include "letc/compile.hpp"
#include "letc/lexer/source.hpp"
#include "letc/parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace letc;
using namespace letc::parser;

class ParserTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;
    diag::DiagnosticSink sink_;

    auto parse_source(const std::string& code) -> Program {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        auto tokens = letc::lex(*source_);
        Parser parser(std::move(tokens), sink_);
        return parser.parse();
    }

    // The only top-level let-block of `program`
    auto only_block(const Program& program) -> const LetBlockNode& {
        const LetBlockNode* found = nullptr;
        for (const auto& node : program.nodes) {
            if (is_let_block(node)) {
                EXPECT_EQ(found, nullptr) << "more than one top-level let-block";
                found = &as_let_block(node);
            }
        }
        EXPECT_NE(found, nullptr) << "no top-level let-block";
        return *found;
    }

    auto codes() const -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& d : sink_.diagnostics()) {
            out.push_back(d.code);
        }
        return out;
    }
};

// ============================================================================
// Plain Input
// ============================================================================

TEST_F(ParserTest, NoLetBlocks) {
    auto program = parse_source("var a = 1;\nfunction f() { return [a]; }\n");
    EXPECT_EQ(count_let_blocks(program), 0u);
    ASSERT_EQ(program.nodes.size(), 1u);
    EXPECT_FALSE(is_let_block(program.nodes[0]));
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, EmptyInput) {
    auto program = parse_source("");
    EXPECT_TRUE(program.nodes.empty());
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, LetDeclarationIsNotALetBlock) {
    auto program = parse_source("let i = 0;\nfor (let j of xs) {}\n");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, MemberNamedLetIsNotALetBlock) {
    auto program = parse_source("obj.let (a) { b(); }\nobj?.let(a) {}\nobj. let (c) {}");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, LetInsideLiteralsIsIgnored) {
    auto program = parse_source("s = 'let (a) {'; // let (b) {\n/* let (c) { */ t = `let (d) {`;");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_TRUE(sink_.empty());
}

// ============================================================================
// Headers
// ============================================================================

TEST_F(ParserTest, SingleDeclaration) {
    auto program = parse_source("let (x = 1) { f(x) }");
    const auto& block = only_block(program);

    ASSERT_EQ(block.declarations.size(), 1u);
    const auto& decl = block.declarations[0];
    EXPECT_EQ(decl.name.lexeme, "x");
    ASSERT_TRUE(decl.has_initializer());
    EXPECT_EQ(lexer::join_lexemes(*decl.initializer), " 1");
    EXPECT_EQ(lexer::join_lexemes(decl.tokens), "x = 1");

    EXPECT_EQ(lexer::join_lexemes(block.header), "let (x = 1) {");
    ASSERT_TRUE(block.is_terminated());
    EXPECT_EQ(block.closing->lexeme, "}");
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, DeclarationsWithoutInitializers) {
    auto program = parse_source("let(a,b){}");
    const auto& block = only_block(program);

    ASSERT_EQ(block.declarations.size(), 2u);
    EXPECT_EQ(block.declarations[0].name.lexeme, "a");
    EXPECT_EQ(block.declarations[1].name.lexeme, "b");
    EXPECT_FALSE(block.declarations[0].has_initializer());
    EXPECT_FALSE(block.declarations[1].has_initializer());
    EXPECT_TRUE(block.body.empty());
}

TEST_F(ParserTest, DeclarationOrderIsPreserved) {
    auto program = parse_source("let (c = 3, a, b = 2) {}");
    const auto& block = only_block(program);

    ASSERT_EQ(block.declarations.size(), 3u);
    EXPECT_EQ(block.declarations[0].name.lexeme, "c");
    EXPECT_EQ(block.declarations[1].name.lexeme, "a");
    EXPECT_EQ(block.declarations[2].name.lexeme, "b");
}

TEST_F(ParserTest, TrailingComma) {
    auto program = parse_source("let (a, b,) {}");
    EXPECT_EQ(only_block(program).declarations.size(), 2u);
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, InitializerWithNestedCommas) {
    auto program = parse_source("let (a = f(1, 2), b = [3, 4], c = {x: 1, y: 2}) {}");
    const auto& block = only_block(program);

    ASSERT_EQ(block.declarations.size(), 3u);
    EXPECT_EQ(lexer::join_lexemes(*block.declarations[0].initializer), " f(1, 2)");
    EXPECT_EQ(lexer::join_lexemes(*block.declarations[1].initializer), " [3, 4]");
    EXPECT_EQ(lexer::join_lexemes(*block.declarations[2].initializer), " {x: 1, y: 2}");
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, InitializerWithOperators) {
    auto program = parse_source("let (a = b == c, d = (e) => e >= 1) {}");
    const auto& block = only_block(program);

    ASSERT_EQ(block.declarations.size(), 2u);
    EXPECT_EQ(lexer::join_lexemes(*block.declarations[0].initializer), " b == c");
    EXPECT_EQ(lexer::join_lexemes(*block.declarations[1].initializer), " (e) => e >= 1");
}

TEST_F(ParserTest, InitializerWithLiterals) {
    auto program = parse_source("let (a = \")\", b = /,/g) {}");
    const auto& block = only_block(program);

    ASSERT_EQ(block.declarations.size(), 2u);
    EXPECT_EQ(lexer::join_lexemes(*block.declarations[0].initializer), " \")\"");
    EXPECT_EQ(lexer::join_lexemes(*block.declarations[1].initializer), " /,/g");
}

TEST_F(ParserTest, CommentsAndLineBreaksInHeader) {
    auto program = parse_source("let /* h */ (\n  /* c */ a /* d */ = 1, // e\n  b\n)\n{}");
    const auto& block = only_block(program);

    ASSERT_EQ(block.declarations.size(), 2u);
    EXPECT_EQ(block.declarations[0].name.lexeme, "a");
    EXPECT_EQ(block.declarations[1].name.lexeme, "b");
    EXPECT_TRUE(sink_.empty());
}

// ============================================================================
// Bodies
// ============================================================================

TEST_F(ParserTest, BodyKeepsBrackets) {
    auto program = parse_source("let (a) { if (a) { g({k: [1]}); } }");
    const auto& block = only_block(program);

    ASSERT_EQ(block.body.size(), 1u);
    EXPECT_EQ(raw_text(block.body[0]), " if (a) { g({k: [1]}); } ");
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, BracesInLiteralsDoNotCloseBody) {
    auto program = parse_source("let (a) { s = '}'; r = /}/; // }\n }");
    const auto& block = only_block(program);

    EXPECT_TRUE(block.is_terminated());
    EXPECT_EQ(block.closing->span.start.offset, 34u);
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, NestedLetBlocks) {
    auto program = parse_source("let (x = 1) { let (y = 2) { f(x, y) } }");
    const auto& outer = only_block(program);

    EXPECT_EQ(count_let_blocks(program), 2u);
    EXPECT_EQ(max_nesting_depth(program), 2u);

    size_t inner_count = 0;
    for (const auto& node : outer.body) {
        if (is_let_block(node)) {
            ++inner_count;
            EXPECT_EQ(as_let_block(node).declarations[0].name.lexeme, "y");
        }
    }
    EXPECT_EQ(inner_count, 1u);
}

TEST_F(ParserTest, LetBlockInsideFunction) {
    auto program = parse_source("function f() { return g(function () { let (a) { h(a) } }); }");
    EXPECT_EQ(count_let_blocks(program), 1u);
    EXPECT_EQ(max_nesting_depth(program), 1u);
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, SiblingLetBlocks) {
    auto program = parse_source("let (a) { a } let (b) { b }");
    EXPECT_EQ(count_let_blocks(program), 2u);
    EXPECT_EQ(max_nesting_depth(program), 1u);
}

TEST_F(ParserTest, DeepNesting) {
    std::string code;
    for (int i = 0; i < 200; ++i) {
        code += "let (v" + std::to_string(i) + ") {";
    }
    code += "x";
    for (int i = 0; i < 200; ++i) {
        code += "}";
    }

    auto program = parse_source(code);
    EXPECT_EQ(count_let_blocks(program), 200u);
    EXPECT_EQ(max_nesting_depth(program), 200u);
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, UnbalancedCloserAtTopLevelIsPlain) {
    auto program = parse_source("}) let (a) { a }");
    EXPECT_EQ(count_let_blocks(program), 1u);
    EXPECT_TRUE(sink_.empty());
}

TEST_F(ParserTest, SpanCoversLetToClosingBrace) {
    auto program = parse_source("x;\nlet (a) {\n  a\n}\n");
    const auto& block = only_block(program);

    EXPECT_EQ(block.span.start.line, 2u);
    EXPECT_EQ(block.span.start.column, 1u);
    EXPECT_EQ(block.span.end.line, 4u);
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_F(ParserTest, EmptyHeader) {
    auto program = parse_source("let () {}");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P001"}));
    EXPECT_EQ(sink_.diagnostics()[0].message, "let header declares no names");
}

TEST_F(ParserTest, NonIdentifierName) {
    auto program = parse_source("let (1) {}");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P001"}));
    EXPECT_NE(sink_.diagnostics()[0].message.find("'1'"), std::string::npos);
}

TEST_F(ParserTest, KeywordLetIsNotAName) {
    (void)parse_source("let (let) {}");
    EXPECT_EQ(codes(), (std::vector<std::string>{"P001"}));
}

TEST_F(ParserTest, EmptyInitializer) {
    auto program = parse_source("let (a = ) {}");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P002"}));
    EXPECT_EQ(sink_.diagnostics()[0].message, "expected an initializer after '=' for 'a'");
}

TEST_F(ParserTest, JunkAfterName) {
    auto program = parse_source("let (a b) {}");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P002"}));
    EXPECT_NE(sink_.diagnostics()[0].message.find("found 'b'"), std::string::npos);
}

TEST_F(ParserTest, MissingBrace) {
    auto program = parse_source("let (a) f(a);");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P003"}));
    EXPECT_EQ(sink_.diagnostics()[0].message, "let header not followed by '{', found 'f'");
}

TEST_F(ParserTest, MissingBraceAtEndOfInput) {
    (void)parse_source("let (a)");
    EXPECT_EQ(codes(), (std::vector<std::string>{"P003"}));
    EXPECT_NE(sink_.diagnostics()[0].message.find("end of input"), std::string::npos);
}

TEST_F(ParserTest, UnterminatedHeader) {
    auto program = parse_source("let (a = f(1");
    EXPECT_EQ(count_let_blocks(program), 0u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P004"}));
    EXPECT_EQ(sink_.diagnostics()[0].span.start.offset, 0u);
}

TEST_F(ParserTest, UnterminatedHeaderAfterName) {
    (void)parse_source("let (a");
    EXPECT_EQ(codes(), (std::vector<std::string>{"P004"}));
}

TEST_F(ParserTest, UnbalancedCloserInInitializer) {
    (void)parse_source("let (a = b]) {}");
    EXPECT_EQ(codes(), (std::vector<std::string>{"P004"}));
    EXPECT_EQ(sink_.diagnostics()[0].message, "unbalanced ']' in let header");
}

TEST_F(ParserTest, FailedHeaderKeepsScanning) {
    auto program = parse_source("let (1) {} let (b) { b }");
    EXPECT_EQ(count_let_blocks(program), 1u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P001"}));
}

TEST_F(ParserTest, UnterminatedBody) {
    auto program = parse_source("let (a) {\n  f(a");
    const auto& block = only_block(program);

    EXPECT_FALSE(block.is_terminated());
    EXPECT_EQ(codes(), (std::vector<std::string>{"P005"}));
    EXPECT_EQ(sink_.diagnostics()[0].message,
              "unterminated let-block: no '}' for the block opened at line 1");
}

TEST_F(ParserTest, UnterminatedNestedBodies) {
    auto program = parse_source("let (a) { let (b) {");
    EXPECT_EQ(count_let_blocks(program), 2u);
    EXPECT_EQ(codes(), (std::vector<std::string>{"P005", "P005"}));
}

TEST_F(ParserTest, MismatchedCloserInBody) {
    auto program = parse_source("let (a) { f(] }");
    const auto& block = only_block(program);

    EXPECT_TRUE(block.is_terminated());
    EXPECT_EQ(codes(), (std::vector<std::string>{"P006", "P006"}));
    EXPECT_EQ(sink_.diagnostics()[0].message, "mismatched ']' in let-block body");
    EXPECT_EQ(sink_.diagnostics()[1].message, "let-block closed while '(' is still open");
}

TEST_F(ParserTest, CloserMatchingDeeperOpener) {
    auto program = parse_source("let (a) { [ ( ] }");
    EXPECT_TRUE(only_block(program).is_terminated());
    EXPECT_EQ(codes(), (std::vector<std::string>{"P006"}));
    EXPECT_EQ(sink_.diagnostics()[0].message,
              "mismatched ']' in let-block body: '(' is still open");
}

TEST_F(ParserTest, ParserAddsMissingEof) {
    source_ = std::make_unique<lexer::Source>(lexer::Source::from_string("let (a) { a }"));
    auto tokens = letc::lex(*source_);
    tokens.pop_back();

    Parser parser(std::move(tokens), sink_);
    auto program = parser.parse();
    EXPECT_EQ(count_let_blocks(program), 1u);
    EXPECT_TRUE(sink_.empty());
}

// ============================================================================
// Reconstruction
// ============================================================================

TEST_F(ParserTest, RawTextReproducesInput) {
    const std::vector<std::string> inputs = {
        "let (x = 1, y) {\n  f(x, y);\n}\n",
        "a; let (x) { let (y = [1, 2]) { g() } } b;",
        "let () {} let (a b) {} let (c) d",
        "let (a) { f(] }",
        "let (a) { unterminated(",
        "obj.let(a) { }",
    };

    for (const auto& input : inputs) {
        auto program = parse_source(input);
        EXPECT_EQ(raw_text(program), input);
    }
}

TEST(ParserHelpersTest, MatchingOpener) {
    EXPECT_EQ(matching_opener(")"), '(');
    EXPECT_EQ(matching_opener("]"), '[');
    EXPECT_EQ(matching_opener("}"), '{');
    EXPECT_EQ(matching_opener("("), 0);
    EXPECT_EQ(matching_opener("=>"), 0);
}

TEST(ParserHelpersTest, DescribeToken) {
    lexer::Token eof{.kind = lexer::TokenKind::Eof, .span = {}, .lexeme = {}};
    lexer::Token newline{.kind = lexer::TokenKind::Newline, .span = {}, .lexeme = "\n"};
    lexer::Token brace{.kind = lexer::TokenKind::Punct, .span = {}, .lexeme = "{"};

    EXPECT_EQ(describe_token(eof), "end of input");
    EXPECT_EQ(describe_token(newline), "line break");
    EXPECT_EQ(describe_token(brace), "'{'");
}
