//! # AST Helpers
//!
//! Source reconstruction and tree statistics. All walks keep their own stack
//! of pending node sequences, so nesting depth does not grow the call stack.

#include "letc/parser/ast.hpp"

#include <algorithm>
#include <utility>

namespace letc::parser {

namespace {

void append_raw(std::string& out, const std::vector<lexer::Token>& tokens) {
    for (const auto& token : tokens) {
        out += token.lexeme;
    }
}

/// A node sequence being walked, and the block that owns it (null at the top).
struct WalkFrame {
    const std::vector<Node>* nodes;
    const LetBlockNode* owner;
    size_t next;
};

void append_raw(std::string& out, const std::vector<Node>& nodes) {
    std::vector<WalkFrame> stack;
    stack.push_back(WalkFrame{.nodes = &nodes, .owner = nullptr, .next = 0});

    while (!stack.empty()) {
        auto& frame = stack.back();
        if (frame.next == frame.nodes->size()) {
            if (frame.owner && frame.owner->closing) {
                out += frame.owner->closing->lexeme;
            }
            stack.pop_back();
            continue;
        }

        const Node& node = (*frame.nodes)[frame.next++];
        if (!is_let_block(node)) {
            append_raw(out, as_plain(node).tokens);
            continue;
        }

        const auto& block = as_let_block(node);
        append_raw(out, block.header);
        stack.push_back(WalkFrame{.nodes = &block.body, .owner = &block, .next = 0});
    }
}

/// Calls `visit(block, depth)` for every let-block under `nodes`, outermost
/// first; top-level blocks have depth 1.
template <typename Visit> void for_each_block(const std::vector<Node>& nodes, Visit visit) {
    std::vector<std::pair<const std::vector<Node>*, size_t>> pending;
    pending.emplace_back(&nodes, 0);

    while (!pending.empty()) {
        auto [current, depth] = pending.back();
        pending.pop_back();
        for (const auto& node : *current) {
            if (is_let_block(node)) {
                const auto& block = as_let_block(node);
                visit(block, depth + 1);
                pending.emplace_back(&block.body, depth + 1);
            }
        }
    }
}

} // anonymous namespace

LetBlockNode::~LetBlockNode() {
    std::vector<Box<LetBlockNode>> detached;

    auto detach_children = [&detached](std::vector<Node>& nodes) {
        for (auto& node : nodes) {
            if (auto* child = std::get_if<Box<LetBlockNode>>(&node); child && *child) {
                detached.push_back(std::move(*child));
            }
        }
    };

    detach_children(body);
    while (!detached.empty()) {
        Box<LetBlockNode> block = std::move(detached.back());
        detached.pop_back();
        detach_children(block->body);
    }
}

auto raw_text(const Node& node) -> std::string {
    std::string out;
    if (!is_let_block(node)) {
        append_raw(out, as_plain(node).tokens);
        return out;
    }

    const auto& block = as_let_block(node);
    append_raw(out, block.header);
    append_raw(out, block.body);
    if (block.closing) {
        out += block.closing->lexeme;
    }
    return out;
}

auto raw_text(const Program& program) -> std::string {
    std::string out;
    append_raw(out, program.nodes);
    return out;
}

auto count_let_blocks(const std::vector<Node>& nodes) -> size_t {
    size_t count = 0;
    for_each_block(nodes, [&count](const LetBlockNode&, size_t) { ++count; });
    return count;
}

auto count_let_blocks(const Program& program) -> size_t {
    return count_let_blocks(program.nodes);
}

auto max_nesting_depth(const Program& program) -> size_t {
    size_t deepest = 0;
    for_each_block(program.nodes,
                   [&deepest](const LetBlockNode&, size_t depth) { deepest = std::max(deepest, depth); });
    return deepest;
}

} // namespace letc::parser
