#ifndef H_SUFTREE_CHILDTAB
#define H_SUFTREE_CHILDTAB

#include <vector>
#include "noderef.hpp"

//Child tables map a symbol to the edge leaving a node with that first label symbol
//All tables expose the same interface so the tree can be instantiated with either of them

class CDenseChildTable {
    public:
        static const int NUM_SYMBOLS = 256;

        CDenseChildTable() : m_NumChildren(0) {}
        explicit CDenseChildTable(CNodeRef fill) : m_NumChildren(fill.is_none() ? 0 : NUM_SYMBOLS) {
            for(int i = 0; i < NUM_SYMBOLS; i++) m_Slots[i] = fill;
        }

        inline CNodeRef get(uint8_t sym) const { return m_Slots[sym]; }

        inline void set(uint8_t sym, CNodeRef ref) {
            if(m_Slots[sym].is_none() && !ref.is_none()) m_NumChildren++;
            else if(!m_Slots[sym].is_none() && ref.is_none()) m_NumChildren--;
            m_Slots[sym] = ref;
        }

        inline int num_children() const { return m_NumChildren; }

        template<typename Func> void for_each(Func func) const {
            for(int i = 0; i < NUM_SYMBOLS; i++) {
                if(!m_Slots[i].is_none()) func((uint8_t) i, m_Slots[i]);
            }
        }

        inline size_t mem_usage() const { return sizeof(*this); }

    private:
        CNodeRef m_Slots[NUM_SYMBOLS];
        int m_NumChildren;
};

class CSparseChildTable {
    public:
        static const int NUM_SYMBOLS = 256;

        CSparseChildTable() {}
        explicit CSparseChildTable(CNodeRef fill) {
            if(fill.is_none()) return;
            m_Slots.reserve(NUM_SYMBOLS);
            for(int i = 0; i < NUM_SYMBOLS; i++) m_Slots.push_back(SSlot((uint8_t) i, fill));
        }

        CNodeRef get(uint8_t sym) const {
            size_t idx;
            if(!find_slot(sym, &idx)) return CNodeRef::none();
            return m_Slots[idx].ref;
        }

        void set(uint8_t sym, CNodeRef ref) {
            size_t idx;
            if(find_slot(sym, &idx)) {
                if(ref.is_none()) m_Slots.erase(m_Slots.begin() + idx);
                else m_Slots[idx].ref = ref;
            } else if(!ref.is_none()) {
                m_Slots.insert(m_Slots.begin() + idx, SSlot(sym, ref));
            }
        }

        inline int num_children() const { return (int) m_Slots.size(); }

        template<typename Func> void for_each(Func func) const {
            for(const SSlot& slot : m_Slots) func(slot.symbol, slot.ref);
        }

        inline size_t mem_usage() const { return sizeof(*this) + m_Slots.capacity() * sizeof(SSlot); }

    private:
        struct SSlot {
            uint8_t symbol;
            CNodeRef ref;

            SSlot(uint8_t symbol, CNodeRef ref) : symbol(symbol), ref(ref) {}
        };

        //Binary search over the sorted slots
        //On a miss, idx receives the insertion position which keeps the slots sorted
        bool find_slot(uint8_t sym, size_t *idx) const {
            size_t s = 0, e = m_Slots.size();
            while(s < e) {
                size_t m = s + (e-s) / 2;
                if(m_Slots[m].symbol < sym) s = m+1;
                else e = m;
            }

            *idx = s;
            return s < m_Slots.size() && m_Slots[s].symbol == sym;
        }

        std::vector<SSlot> m_Slots;
};

#endif
