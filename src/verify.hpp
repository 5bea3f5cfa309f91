#ifndef H_SUFTREE_VERIFY
#define H_SUFTREE_VERIFY

#include <vector>
#include "suftree.hpp"

struct SVerifyStats {
    size_t num_inner, num_leaves;
    size_t max_depth;

    SVerifyStats() : num_inner(0), num_leaves(0), max_depth(0) {}
};

//Checks the structural invariants of a finished tree, throwing a CTreeConsistencyError on the first violation
//Path labels are compared byte by byte, so verification takes quadratic time in the worst case
class CTreeVerifier {
    public:
        CTreeVerifier(const ISuffixTree& tree) : m_Tree(tree) {}

        //expect_terminated: the sequence ends with a unique symbol, so every suffix has to be an explicit leaf
        SVerifyStats verify(bool expect_terminated) const;

        //Suffix offsets of all leaves, in lexicographic order of their suffixes
        const std::vector<size_t>& leaf_suffixes() const { return m_LeafSuffixes; }

    private:
        void check_sentinels() const;
        void walk_tree(SVerifyStats& stats) const;
        void check_suffix_links() const;
        void check_leaf_order() const;

        const ISuffixTree& m_Tree;

        mutable std::vector<size_t> m_NodeDepths, m_NodeWitnesses;
        mutable std::vector<size_t> m_LeafSuffixes;
};

//Checks if the last symbol of the sequence occurs nowhere else in it
bool has_unique_terminator(const IByteSequence& seq);

#endif
