#ifndef H_SUFTREE_NODEARENA
#define H_SUFTREE_NODEARENA

#include <vector>
#include <sstream>
#include "noderef.hpp"
#include "childtab.hpp"

template<typename ChildTable> struct SInnerNode {
    seqoff_t begin, end;
    CNodeRef suffix;
    ChildTable children;

    SInnerNode(seqoff_t begin, seqoff_t end, CNodeRef suffix) : begin(begin), end(end), suffix(suffix) {}
    SInnerNode(seqoff_t begin, seqoff_t end, CNodeRef suffix, CNodeRef child_fill) : begin(begin), end(end), suffix(suffix), children(child_fill) {}

    inline seqoff_t label_size() const { return end - begin; }
};

//Append-only node storage
//Nodes live in pages which are never reallocated, so node references stay valid while the arena grows
template<typename ChildTable> class CNodeArena {
    public:
        typedef SInnerNode<ChildTable> node_type;

        static const size_t NODE_PAGE_SIZE = 256;

        //Every index below max_nodes has to be encodable as a node reference
        static const size_t MAX_NODES = (size_t) CNodeRef::MAX_VALUE + 1;

        explicit CNodeArena(size_t max_nodes = MAX_NODES) : m_MaxNodes(max_nodes < MAX_NODES ? max_nodes : MAX_NODES), m_NumNodes(0) {}
        CNodeArena(CNodeArena&& arena) = default;
        CNodeArena(const CNodeArena& arena) = delete;

        nodeidx_t allocate(node_type&& node) {
            if(m_NumNodes >= m_MaxNodes) {
                std::stringstream sstream;
                sstream << "Node arena is full [" << m_NumNodes << " nodes], can't allocate another node";
                throw std::length_error(sstream.str());
            }

            //Start a new page if the current one is full
            if(m_NumNodes % NODE_PAGE_SIZE == 0) {
                m_Pages.emplace_back();
                m_Pages.back().reserve(NODE_PAGE_SIZE);
            }

            m_Pages.back().push_back(std::move(node));
            return (nodeidx_t) m_NumNodes++;
        }

        inline size_t size() const { return m_NumNodes; }
        inline size_t max_size() const { return m_MaxNodes; }

        inline node_type& get(nodeidx_t idx) { return m_Pages[idx / NODE_PAGE_SIZE][idx % NODE_PAGE_SIZE]; }
        inline const node_type& get(nodeidx_t idx) const { return m_Pages[idx / NODE_PAGE_SIZE][idx % NODE_PAGE_SIZE]; }

        inline node_type& operator [](nodeidx_t idx) { return get(idx); }
        inline const node_type& operator [](nodeidx_t idx) const { return get(idx); }

        size_t get_mem_usage() const {
            size_t usage = m_Pages.capacity() * sizeof(std::vector<node_type>);
            for(const std::vector<node_type>& page : m_Pages) {
                usage += page.capacity() * sizeof(node_type);
                for(const node_type& node : page) usage += node.children.mem_usage() - sizeof(ChildTable);
            }
            return usage;
        }

    private:
        std::vector<std::vector<node_type>> m_Pages;
        size_t m_MaxNodes, m_NumNodes;
};

template<typename ChildTable> const size_t CNodeArena<ChildTable>::NODE_PAGE_SIZE;
template<typename ChildTable> const size_t CNodeArena<ChildTable>::MAX_NODES;

#endif
