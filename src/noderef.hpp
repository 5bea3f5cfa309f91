#ifndef H_SUFTREE_NODEREF
#define H_SUFTREE_NODEREF

#include <stdint.h>
#include <stddef.h>
#include <stdexcept>

typedef uint32_t seqoff_t;
typedef uint32_t nodeidx_t;

//Packed reference to a tree edge target
//Layout: bit 0 is the kind tag (1 = leaf, 0 = inner), bits 31..1 hold the offset / node index
//The all-ones pattern is reserved for "none", which caps both offsets and indices at MAX_VALUE
class CNodeRef {
    public:
        static const uint32_t MAX_VALUE = 0x7ffffffe;

        CNodeRef() : m_Raw(RAW_NONE) {}

        static inline CNodeRef none() { return CNodeRef(); }
        static CNodeRef leaf(size_t off);
        static CNodeRef inner(size_t idx);

        inline bool is_none() const { return m_Raw == RAW_NONE; }
        inline bool is_leaf() const { return (m_Raw & 1) && m_Raw != RAW_NONE; }
        inline bool is_inner() const { return !(m_Raw & 1); }

        seqoff_t leaf_offset() const {
            if(!is_leaf()) throw std::logic_error("CNodeRef doesn't reference a leaf");
            return (seqoff_t) (m_Raw >> 1);
        }

        nodeidx_t inner_index() const {
            if(!is_inner()) throw std::logic_error("CNodeRef doesn't reference an inner node");
            return (nodeidx_t) (m_Raw >> 1);
        }

        inline uint32_t raw() const { return m_Raw; }

        inline bool operator ==(const CNodeRef& o) const { return m_Raw == o.m_Raw; }
        inline bool operator !=(const CNodeRef& o) const { return m_Raw != o.m_Raw; }

    private:
        static const uint32_t RAW_NONE = 0xffffffff;

        explicit CNodeRef(uint32_t raw) : m_Raw(raw) {}

        uint32_t m_Raw;
};

//Checked conversion of a payload offset / length
seqoff_t to_seqoff(size_t off);

#endif
