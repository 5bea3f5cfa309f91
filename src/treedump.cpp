#include <stdio.h>
#include <vector>
#include <utility>
#include "treedump.hpp"

std::string escape_label(const IByteSequence& seq, SLabel label) {
    std::string str;
    str.reserve(label.size());

    for(seqoff_t off = label.begin; off < label.end; off++) {
        uint8_t sym = seq[off];
        if(sym == '"' || sym == '\\') {
            str.push_back('\\');
            str.push_back((char) sym);
        } else if(sym < 0x20 || sym >= 0x7f) {
            char buf[8];
            snprintf(buf, sizeof(buf), "\\x%02x", sym);
            str.append(buf);
        } else str.push_back((char) sym);
    }

    return str;
}

void dump_suffix_tree(const ISuffixTree& tree, std::ostream& stream) {
    const IByteSequence& seq = tree.sequence();

    //Depth-first traversal with an explicit stack, as the tree can be as deep as the sequence is long
    std::vector<std::pair<CNodeRef, size_t>> stack;
    stack.push_back(std::make_pair(CNodeRef::inner(ISuffixTree::ROOT_NODE), (size_t) 0));

    std::vector<CNodeRef> children;
    while(!stack.empty()) {
        CNodeRef ref = stack.back().first;
        size_t depth = stack.back().second;
        stack.pop_back();

        stream << std::string(depth * 2, ' ');

        if(ref.is_leaf()) {
            stream << '"' << escape_label(seq, tree.resolve_label(ref)) << "\" (leaf)\n";
            continue;
        }

        nodeidx_t idx = ref.inner_index();
        if(idx == ISuffixTree::ROOT_NODE) stream << "(root)\n";
        else {
            CNodeRef suf = tree.node_suffix(idx);
            stream << '"' << escape_label(seq, tree.node_label(idx)) << "\" (inner " << idx << ", suffix=" << (suf.is_inner() ? suf.inner_index() : 0) << ")\n";
        }

        //Push children in reverse, so that they are popped in ascending symbol order
        children.clear();
        tree.enum_children(idx, [&](uint8_t sym, CNodeRef child) { children.push_back(child); });
        for(size_t i = children.size(); i > 0; i--) stack.push_back(std::make_pair(children[i-1], depth + 1));
    }
}
