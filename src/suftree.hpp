#ifndef H_SUFTREE_SUFTREE
#define H_SUFTREE_SUFTREE

#include <memory>
#include <functional>
#include <sstream>
#include <stdexcept>
#include "byteseq.hpp"
#include "noderef.hpp"
#include "childtab.hpp"
#include "nodearena.hpp"

class CTreeConsistencyError : public std::logic_error {
    public:
        explicit CTreeConsistencyError(const std::string& msg) : std::logic_error(msg) {}
};

//Always-on invariant check, throwing a CTreeConsistencyError with a streamed message
#define SUFTREE_CHECK(cond, msg) do { \
    if(!(cond)) { \
        std::stringstream sstream; \
        sstream << "Suffix tree consistency violation: " << msg; \
        throw CTreeConsistencyError(sstream.str()); \
    } \
} while(0)

struct SLabel {
    seqoff_t begin, end;

    SLabel() : begin(0), end(0) {}
    SLabel(seqoff_t begin, seqoff_t end) : begin(begin), end(end) {}

    inline seqoff_t size() const { return end - begin; }
};

//Read-only view of a finished suffix tree
class ISuffixTree {
    public:
        static const nodeidx_t TOP_NODE = 0, ROOT_NODE = 1;

        virtual ~ISuffixTree() {}

        virtual const IByteSequence& sequence() const = 0;

        virtual size_t num_nodes() const = 0;
        virtual size_t num_leaves() const = 0;
        virtual size_t get_mem_usage() const = 0;

        virtual SLabel node_label(nodeidx_t idx) const = 0;
        virtual CNodeRef node_suffix(nodeidx_t idx) const = 0;

        virtual CNodeRef child(nodeidx_t idx, uint8_t sym) const = 0;
        virtual int num_children(nodeidx_t idx) const = 0;
        virtual void enum_children(nodeidx_t idx, const std::function<void(uint8_t, CNodeRef)>& cb) const = 0;

        //Leaves store only the start of their label, which implicitly runs up to the end of the sequence
        SLabel resolve_label(CNodeRef ref) const {
            if(ref.is_leaf()) return SLabel(ref.leaf_offset(), (seqoff_t) sequence().size());
            return node_label(ref.inner_index());
        }
};

//Active point of the construction
//The unconsumed tail seq[pos, new_end) still has to be matched starting at node
struct SCursor {
    nodeidx_t node;
    seqoff_t pos;

    SCursor(nodeidx_t node, seqoff_t pos) : node(node), pos(pos) {}
};

template<typename ChildTable> class CBasicSuffixTree : public ISuffixTree {
    public:
        typedef CNodeArena<ChildTable> arena_type;
        typedef typename arena_type::node_type node_type;

        CBasicSuffixTree(std::shared_ptr<const IByteSequence> seq);
        CBasicSuffixTree(CBasicSuffixTree&& tree) = default;
        CBasicSuffixTree(const CBasicSuffixTree& tree) = delete;

        virtual const IByteSequence& sequence() const override { return *m_Sequence; }
        inline const std::shared_ptr<const IByteSequence>& sequence_handle() const { return m_Sequence; }

        virtual size_t num_nodes() const override { return m_Nodes.size(); }
        virtual size_t num_leaves() const override { return m_NumLeaves; }
        virtual size_t get_mem_usage() const override { return m_Nodes.get_mem_usage(); }

        virtual SLabel node_label(nodeidx_t idx) const override {
            const node_type& node = checked_node(idx);
            return SLabel(node.begin, node.end);
        }
        virtual CNodeRef node_suffix(nodeidx_t idx) const override { return checked_node(idx).suffix; }

        virtual CNodeRef child(nodeidx_t idx, uint8_t sym) const override { return checked_node(idx).children.get(sym); }
        virtual int num_children(nodeidx_t idx) const override { return checked_node(idx).children.num_children(); }
        virtual void enum_children(nodeidx_t idx, const std::function<void(uint8_t, CNodeRef)>& cb) const override { checked_node(idx).children.for_each(cb); }

        inline const arena_type& nodes() const { return m_Nodes; }

    private:
        //Tree construction
        void build_tree();
        void canonicalize(SCursor& cur, seqoff_t new_end) const;
        SCursor extend(SCursor cur, seqoff_t new_end);

        const node_type& checked_node(nodeidx_t idx) const;

        std::shared_ptr<const IByteSequence> m_Sequence;
        arena_type m_Nodes;
        size_t m_NumLeaves;
};

typedef CBasicSuffixTree<CDenseChildTable> CSuffixTree;
typedef CBasicSuffixTree<CSparseChildTable> CSparseSuffixTree;

extern template class CBasicSuffixTree<CDenseChildTable>;
extern template class CBasicSuffixTree<CSparseChildTable>;

#endif
