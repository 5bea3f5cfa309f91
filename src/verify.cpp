#include <limits>
#include <tier0/dbg.h>
#include <tier0/valve_minmax_off.h>
#include "verify.hpp"
#include "sufarr.hpp"

static const size_t NO_DEPTH = std::numeric_limits<size_t>::max();

SVerifyStats CTreeVerifier::verify(bool expect_terminated) const {
    SVerifyStats stats;

    check_sentinels();
    walk_tree(stats);
    check_suffix_links();

    SUFTREE_CHECK(stats.num_leaves == m_Tree.num_leaves(), "Tree reports " << m_Tree.num_leaves() << " leaves, but " << stats.num_leaves << " are reachable");

    if(expect_terminated) {
        size_t seq_size = m_Tree.sequence().size();
        SUFTREE_CHECK(stats.num_leaves == seq_size, "Terminated sequence of " << seq_size << " bytes has " << stats.num_leaves << " leaves");
        check_leaf_order();
    }

    DevMsg("Verified suffix tree [%zu inner nodes, %zu leaves, max depth %zu]\n", stats.num_inner, stats.num_leaves, stats.max_depth);
    return stats;
}

void CTreeVerifier::check_sentinels() const {
    SUFTREE_CHECK(m_Tree.num_nodes() >= 2, "Tree is missing its sentinel nodes");

    //Every edge of the top node has to lead to the root
    SUFTREE_CHECK(m_Tree.num_children(ISuffixTree::TOP_NODE) == 256, "Top node has " << m_Tree.num_children(ISuffixTree::TOP_NODE) << " children instead of 256");
    for(int sym = 0; sym < 256; sym++) {
        SUFTREE_CHECK(m_Tree.child(ISuffixTree::TOP_NODE, (uint8_t) sym) == CNodeRef::inner(ISuffixTree::ROOT_NODE), "Top node edge " << sym << " doesn't lead to the root");
    }

    SUFTREE_CHECK(m_Tree.node_label(ISuffixTree::ROOT_NODE).size() == 1, "Root label isn't a single placeholder symbol");
    SUFTREE_CHECK(m_Tree.node_suffix(ISuffixTree::ROOT_NODE) == CNodeRef::inner(ISuffixTree::TOP_NODE), "Root suffix link doesn't lead to the top node");
}

void CTreeVerifier::walk_tree(SVerifyStats& stats) const {
    const IByteSequence& seq = m_Tree.sequence();
    const size_t seq_size = seq.size(), num_nodes = m_Tree.num_nodes();

    m_NodeDepths.assign(num_nodes, NO_DEPTH);
    m_NodeWitnesses.assign(num_nodes, NO_DEPTH);
    m_LeafSuffixes.clear();

    std::vector<bool> seen_suffixes(seq_size, false);

    struct SStackEntry {
        CNodeRef ref;
        uint8_t sym;
        size_t depth, path_size;
    };

    std::vector<SStackEntry> stack;
    std::vector<SLabel> path;
    std::vector<nodeidx_t> pending_witnesses;
    std::vector<std::pair<uint8_t, CNodeRef>> children;

    stack.push_back({ CNodeRef::inner(ISuffixTree::ROOT_NODE), 0, 0, 0 });
    while(!stack.empty()) {
        SStackEntry ent = stack.back();
        stack.pop_back();
        path.resize(ent.path_size);

        size_t depth = ent.depth;
        if(!(ent.ref.is_inner() && ent.ref.inner_index() == ISuffixTree::ROOT_NODE)) {
            //Check the incoming edge
            SLabel label = m_Tree.resolve_label(ent.ref);
            SUFTREE_CHECK(label.begin < label.end && label.end <= seq_size, "Edge label [" << label.begin << ", " << label.end << ") is empty or out of range");
            SUFTREE_CHECK(seq[label.begin] == ent.sym, "Edge keyed by " << (int) ent.sym << " starts with symbol " << (int) seq[label.begin]);

            path.push_back(label);
            depth += label.size();
        }
        if(depth > stats.max_depth) stats.max_depth = depth;

        if(ent.ref.is_leaf()) {
            //The path down to the leaf has to spell its suffix
            SUFTREE_CHECK(depth <= seq_size, "Path to leaf at offset " << ent.ref.leaf_offset() << " is longer than the sequence");
            size_t suf = seq_size - depth;
            SUFTREE_CHECK(!seen_suffixes[suf], "Suffix " << suf << " is represented by more than one leaf");
            seen_suffixes[suf] = true;

            size_t off = suf;
            for(const SLabel& lab : path) {
                SUFTREE_CHECK(seq.compare(seq, lab.begin, off, lab.size()) == 0, "Path to the leaf of suffix " << suf << " doesn't spell the suffix");
                off += lab.size();
            }

            m_LeafSuffixes.push_back(suf);
            stats.num_leaves++;

            //The first leaf after an inner node lies in its subtree
            for(nodeidx_t idx : pending_witnesses) m_NodeWitnesses[idx] = suf;
            pending_witnesses.clear();
            continue;
        }

        nodeidx_t idx = ent.ref.inner_index();
        SUFTREE_CHECK(idx != ISuffixTree::TOP_NODE && idx < num_nodes, "Edge leads to invalid node " << idx);
        SUFTREE_CHECK(m_NodeDepths[idx] == NO_DEPTH, "Node " << idx << " has more than one incoming edge");
        m_NodeDepths[idx] = depth;
        pending_witnesses.push_back(idx);
        if(idx != ISuffixTree::ROOT_NODE) stats.num_inner++;

        children.clear();
        m_Tree.enum_children(idx, [&](uint8_t sym, CNodeRef child) { children.push_back(std::make_pair(sym, child)); });
        SUFTREE_CHECK(idx == ISuffixTree::ROOT_NODE || children.size() >= 2, "Inner node " << idx << " has " << children.size() << " children");

        for(size_t i = children.size(); i > 0; i--) stack.push_back({ children[i-1].second, children[i-1].first, depth, path.size() });
    }

    //Every allocated node has to hang in the tree
    SUFTREE_CHECK(stats.num_inner + 2 == num_nodes, "Only " << stats.num_inner << " of " << (num_nodes - 2) << " inner nodes are reachable from the root");
}

void CTreeVerifier::check_suffix_links() const {
    const IByteSequence& seq = m_Tree.sequence();

    for(nodeidx_t idx = ISuffixTree::ROOT_NODE + 1; idx < m_Tree.num_nodes(); idx++) {
        CNodeRef suf = m_Tree.node_suffix(idx);
        SUFTREE_CHECK(suf.is_inner(), "Suffix link of node " << idx << " doesn't lead to an inner node");

        //A node spelling cX links to the node spelling X, so every link brings us one symbol closer to the root
        nodeidx_t suf_idx = suf.inner_index();
        SUFTREE_CHECK(suf_idx != ISuffixTree::TOP_NODE && suf_idx < m_Tree.num_nodes(), "Suffix link of node " << idx << " leads to invalid node " << suf_idx);

        size_t depth = m_NodeDepths[idx], suf_depth = m_NodeDepths[suf_idx];
        SUFTREE_CHECK(suf_depth + 1 == depth, "Suffix link of node " << idx << " [depth " << depth << "] leads to node " << suf_idx << " [depth " << suf_depth << "]");
        SUFTREE_CHECK(seq.compare(seq, m_NodeWitnesses[idx] + 1, m_NodeWitnesses[suf_idx], suf_depth) == 0, "Node " << suf_idx << " doesn't spell the suffix of node " << idx);
    }
}

void CTreeVerifier::check_leaf_order() const {
    //Depth-first traversal in ascending symbol order visits the leaves in lexicographic suffix order
    CSuffixArray sufarr(m_Tree.sequence());
    SUFTREE_CHECK(sufarr.size() == m_LeafSuffixes.size(), "Suffix array has " << sufarr.size() << " entries, but the tree has " << m_LeafSuffixes.size() << " leaves");

    for(size_t i = 0; i < m_LeafSuffixes.size(); i++) {
        SUFTREE_CHECK(sufarr[i] == m_LeafSuffixes[i], "Leaf " << i << " in lexicographic order is suffix " << m_LeafSuffixes[i] << ", expected suffix " << sufarr[i]);
    }
}

bool has_unique_terminator(const IByteSequence& seq) {
    size_t size = seq.size();
    if(size == 0) return false;

    uint8_t term = seq[size-1];
    for(size_t i = 0; i < size-1; i++) {
        if(seq[i] == term) return false;
    }
    return true;
}
