#include <assert.h>
#include <chrono>
#include <sstream>
#include <tier0/dbg.h>
#include <tier0/valve_minmax_off.h>
#include "suftree.hpp"

const nodeidx_t ISuffixTree::TOP_NODE;
const nodeidx_t ISuffixTree::ROOT_NODE;

template<typename ChildTable> CBasicSuffixTree<ChildTable>::CBasicSuffixTree(std::shared_ptr<const IByteSequence> seq) : m_Sequence(std::move(seq)), m_NumLeaves(0) {
    if(!m_Sequence) throw std::invalid_argument("Can't build a suffix tree without a sequence");

    //Build the tree
    using namespace std::chrono;
    auto t1 = high_resolution_clock::now();
    build_tree();
    auto t2 = high_resolution_clock::now();

    DevMsg("Constructed suffix tree for %zu byte sequence [%zu nodes, %zu leaves, %zu kB], took %dms\n", m_Sequence->size(), m_Nodes.size(), m_NumLeaves,
        get_mem_usage() / 1024, (int) duration_cast<milliseconds>(t2 - t1).count()
    );
}

template<typename ChildTable> const typename CBasicSuffixTree<ChildTable>::node_type& CBasicSuffixTree<ChildTable>::checked_node(nodeidx_t idx) const {
    if(idx >= m_Nodes.size()) {
        std::stringstream sstream;
        sstream << "Node index " << idx << " is out of range [" << m_Nodes.size() << " nodes]";
        throw std::out_of_range(sstream.str());
    }
    return m_Nodes[idx];
}

//Ukkonen's algorithm
template<typename ChildTable> void CBasicSuffixTree<ChildTable>::build_tree() {
    //Reject sequences we can't address before touching the arena
    seqoff_t seq_size = to_seqoff(m_Sequence->size());

    //Create the sentinel nodes
    //Every edge of the top node leads to the root with a label of length 1, so following the root's suffix link drops exactly one symbol
    m_Nodes.allocate(node_type(0, 0, CNodeRef::none(), CNodeRef::inner(ROOT_NODE)));
    m_Nodes.allocate(node_type(0, 1, CNodeRef::inner(TOP_NODE)));

    //Iterative expansion
    SCursor cur(ROOT_NODE, 0);
    for(seqoff_t new_end = 0; new_end < seq_size; new_end++) cur = extend(cur, new_end);
}

template<typename ChildTable> inline void CBasicSuffixTree<ChildTable>::canonicalize(SCursor& cur, seqoff_t new_end) const {
    const IByteSequence& seq = *m_Sequence;

    while(cur.pos < new_end) {
        //Leaves absorb the entire rest of the sequence, and missing edges mean a mismatch, so only descend into inner nodes
        CNodeRef child = m_Nodes[cur.node].children.get(seq[cur.pos]);
        if(!child.is_inner()) break;

        nodeidx_t child_idx = child.inner_index();
        assert(child_idx != TOP_NODE);

        //Stop if the match ends inside the child's label
        seqoff_t lab_size = m_Nodes[child_idx].label_size();
        if(lab_size > new_end - cur.pos) break;

        cur.node = child_idx;
        cur.pos += lab_size;
    }
}

template<typename ChildTable> SCursor CBasicSuffixTree<ChildTable>::extend(SCursor cur, seqoff_t new_end) {
    const IByteSequence& seq = *m_Sequence;
    uint8_t new_sym = seq[new_end];

    //Node inserted into during the previous extension, waiting for its suffix link
    CNodeRef prev_insert = CNodeRef::none();
    bool prev_is_split = false;

    while(true) {
        canonicalize(cur, new_end);

        nodeidx_t insert_idx;
        if(cur.pos == new_end) {
            //Check if the active node already has an edge for the new symbol
            if(!m_Nodes[cur.node].children.get(new_sym).is_none()) {
                //The active node spells the suffix of the previous insertion point
                if(!prev_insert.is_none()) m_Nodes[prev_insert.inner_index()].suffix = CNodeRef::inner(cur.node);
                break;
            }

            //Insert right below the active node
            insert_idx = cur.node;
            prev_is_split = false;
        } else {
            //We're in the middle of an edge label
            uint8_t edge_sym = seq[cur.pos];
            CNodeRef edge_ref = m_Nodes[cur.node].children.get(edge_sym);
            SUFTREE_CHECK(!edge_ref.is_none(), "active edge '" << (int) edge_sym << "' of node " << cur.node << " doesn't exist");

            seqoff_t edge_begin = edge_ref.is_leaf() ? edge_ref.leaf_offset() : m_Nodes[edge_ref.inner_index()].begin;
            seqoff_t split_pos = edge_begin + (new_end - cur.pos);
            uint8_t split_sym = seq[split_pos];

            //Check if the edge already continues with the new symbol
            if(split_sym == new_sym) {
                //A freshly split node is always followed by a node or another split, never by a match mid-edge
                SUFTREE_CHECK(!prev_is_split, "split node " << prev_insert.inner_index() << " was left without a suffix link");
                break;
            }

            //Split the edge
            //Allocate first, so a full arena leaves the tree untouched
            insert_idx = m_Nodes.allocate(node_type(edge_begin, split_pos, CNodeRef::inner(ROOT_NODE)));
            node_type& split_node = m_Nodes[insert_idx];

            if(edge_ref.is_leaf()) {
                split_node.children.set(split_sym, CNodeRef::leaf(split_pos));
            } else {
                node_type& edge_node = m_Nodes[edge_ref.inner_index()];
                SUFTREE_CHECK(edge_node.begin < split_pos && split_pos < edge_node.end, "split position " << split_pos << " isn't inside the label of node " << edge_ref.inner_index());

                edge_node.begin = split_pos;
                split_node.children.set(split_sym, edge_ref);
            }
            m_Nodes[cur.node].children.set(edge_sym, CNodeRef::inner(insert_idx));
            prev_is_split = true;
        }

        //Set suffix link
        if(!prev_insert.is_none()) m_Nodes[prev_insert.inner_index()].suffix = CNodeRef::inner(insert_idx);
        prev_insert = CNodeRef::inner(insert_idx);

        //Add the new leaf
        node_type& insert_node = m_Nodes[insert_idx];
        assert(insert_node.children.get(new_sym).is_none());
        insert_node.children.set(new_sym, CNodeRef::leaf(new_end));
        m_NumLeaves++;

        //Continue with the next shorter suffix
        CNodeRef suf_link = m_Nodes[cur.node].suffix;
        SUFTREE_CHECK(suf_link.is_inner(), "suffix link of node " << cur.node << " doesn't lead to an inner node");
        cur.node = suf_link.inner_index();
    }

    return cur;
}

template class CBasicSuffixTree<CDenseChildTable>;
template class CBasicSuffixTree<CSparseChildTable>;
