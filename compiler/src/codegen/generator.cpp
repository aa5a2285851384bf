//! # Generator Core
//!
//! Tree walk, plain-run emission and the native strategy.
//!
//! The walk keeps an explicit stack of open bodies, one frame per let-block
//! being emitted, so output depth does not grow the call stack.

#include "letc/codegen/generator.hpp"
#include "letc/log/log.hpp"

namespace letc::codegen {

using lexer::Token;
using lexer::TokenKind;

namespace {

struct TokenRange {
    size_t begin;
    size_t end;
};

// [begin, end) without blank tokens at either edge
auto non_blank_range(const std::vector<Token>& tokens) -> TokenRange {
    size_t begin = 0;
    size_t end = tokens.size();
    while (begin < end && tokens[begin].is_blank()) {
        ++begin;
    }
    while (end > begin && tokens[end - 1].is_blank()) {
        --end;
    }
    return {begin, end};
}

} // anonymous namespace

Generator::Generator(CompileOptions options) : options_(options) {}

auto Generator::generate(const parser::Program& program) -> std::string {
    output_.clear();
    block_count_ = 0;
    frames_.clear();
    frames_.push_back(Frame{.nodes = &program.nodes,
                            .next = 0,
                            .trim_edges = false,
                            .closing = {},
                            .close_count = 0});

    while (!frames_.empty()) {
        Frame& frame = frames_.back();
        if (frame.next == frame.nodes->size()) {
            for (size_t i = 0; i < frame.close_count; ++i) {
                emit(frame.closing);
            }
            frames_.pop_back();
            continue;
        }

        const size_t index = frame.next++;
        const auto& node = (*frame.nodes)[index];
        if (parser::is_let_block(node)) {
            open_let_block(parser::as_let_block(node));
        } else if (frame.trim_edges) {
            gen_body_plain(frame, index, parser::as_plain(node));
        } else {
            const auto& tokens = parser::as_plain(node).tokens;
            emit_tokens(tokens, 0, tokens.size());
        }
    }

    LETC_LOG_DEBUG("codegen", "generated " << output_.size() << " bytes, rewrote "
                                           << block_count_ << " let-block(s) as "
                                           << (options_.target_es3 ? "ES3" : "native"));
    return std::move(output_);
}

void Generator::emit(std::string_view text) {
    output_ += text;
}

void Generator::emit_tokens(const std::vector<Token>& tokens, size_t begin, size_t end) {
    for (size_t i = begin; i < end; ++i) {
        output_ += tokens[i].lexeme;
    }
}

void Generator::gen_body_plain(const Frame& frame, size_t index, const parser::PlainNode& node) {
    const auto& tokens = node.tokens;
    size_t begin = 0;
    size_t end = tokens.size();

    if (index == 0) {
        while (begin < end && tokens[begin].is_blank()) {
            ++begin;
        }
    }
    if (index + 1 != frame.nodes->size()) {
        emit_tokens(tokens, begin, end);
        return;
    }

    while (end > begin && tokens[end - 1].is_blank()) {
        --end;
    }
    emit_tokens(tokens, begin, end);
    if (end > begin && tokens[end - 1].is(TokenKind::LineComment)) {
        emit("\n");
    }
}

void Generator::open_let_block(const parser::LetBlockNode& block) {
    if (block.declarations.empty()) {
        emit_tokens(block.header, 0, block.header.size());
        frames_.push_back(Frame{.nodes = &block.body,
                                .next = 0,
                                .trim_edges = false,
                                .closing = block.closing ? block.closing->lexeme : std::string_view("}"),
                                .close_count = 1});
        return;
    }

    ++block_count_;
    if (options_.target_es3) {
        open_es3(block);
    } else {
        open_native(block);
    }
    frames_.push_back(Frame{.nodes = &block.body,
                            .next = 0,
                            .trim_edges = true,
                            .closing = "}",
                            .close_count = options_.target_es3 ? block.declarations.size() : 1});
}

void Generator::open_native(const parser::LetBlockNode& block) {
    emit("{ let ");
    for (size_t i = 0; i < block.declarations.size(); ++i) {
        if (i > 0) {
            emit(", ");
        }
        emit(trimmed_text(block.declarations[i].tokens));
    }
    emit(";");
}

auto trimmed_text(const std::vector<Token>& tokens) -> std::string {
    auto [begin, end] = non_blank_range(tokens);

    std::string text;
    for (size_t i = begin; i < end; ++i) {
        text += tokens[i].lexeme;
    }
    if (end > begin && tokens[end - 1].is(TokenKind::LineComment)) {
        text += '\n';
    }
    return text;
}

} // namespace letc::codegen
