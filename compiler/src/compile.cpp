//! # Compilation Pipeline
//!
//! Wires the classifier, lexer, parser and generator together.

#include "letc/compile.hpp"

#include "letc/codegen/generator.hpp"
#include "letc/lexer/lexer.hpp"
#include "letc/log/log.hpp"
#include "letc/parser/parser.hpp"

namespace letc {

auto default_classifier() -> const literal::LiteralClassifier& {
    static const literal::JsLiteralClassifier classifier;
    return classifier;
}

auto lex(const lexer::Source& source, diag::DiagnosticSink& sink,
         const literal::LiteralClassifier& classifier) -> std::vector<lexer::Token> {
    lexer::Lexer lexer(source, classifier, sink);
    return lexer.tokenize();
}

auto lex(const lexer::Source& source) -> std::vector<lexer::Token> {
    diag::DiagnosticSink sink;
    return lex(source, sink);
}

auto parse(std::vector<lexer::Token> tokens, diag::DiagnosticSink& sink) -> parser::Program {
    parser::Parser parser(std::move(tokens), sink);
    return parser.parse();
}

auto parse(std::vector<lexer::Token> tokens) -> parser::Program {
    diag::DiagnosticSink sink;
    return parse(std::move(tokens), sink);
}

auto generate(const parser::Program& program, const CompileOptions& options) -> std::string {
    codegen::Generator generator(options);
    return generator.generate(program);
}

auto compile(std::string_view source, const CompileOptions& options, diag::DiagnosticSink& sink,
             const literal::LiteralClassifier& classifier, std::string name) -> std::string {
    auto unit = lexer::Source::from_string(std::string(source), std::move(name));
    size_t first = sink.size();

    auto program = parse(lex(unit, sink, classifier), sink);
    auto output = generate(program, options);

    LETC_LOG_DEBUG("driver", "compiled " << unit.filename() << ": " << source.size() << " -> "
                                         << output.size() << " bytes, "
                                         << (sink.size() - first) << " diagnostic(s)");
    return output;
}

auto compile(std::string_view source, const CompileOptions& options, diag::DiagnosticSink& sink,
             std::string name) -> std::string {
    return compile(source, options, sink, default_classifier(), std::move(name));
}

auto compile(std::string_view source, const CompileOptions& options) -> std::string {
    diag::DiagnosticSink sink;
    return compile(source, options, sink);
}

auto compile_with_diagnostics(std::string_view source, const CompileOptions& options,
                              std::string name) -> CompileResult {
    diag::DiagnosticSink sink;
    auto output = compile(source, options, sink, std::move(name));
    return CompileResult{.output = std::move(output), .diagnostics = sink.diagnostics()};
}

} // namespace letc
