#ifndef H_SUFTREE_SUFARR
#define H_SUFTREE_SUFARR

#include <memory>
#include "byteseq.hpp"

//Lexicographically sorted suffix offsets, built by prefix doubling
class CSuffixArray {
    public:
        CSuffixArray(const IByteSequence& seq);
        CSuffixArray(CSuffixArray&& arr) = default;
        CSuffixArray(const CSuffixArray& arr) = delete;

        inline size_t size() const { return m_Size; }
        inline size_t get_mem_usage() const { return m_Size * sizeof(size_t); }

        inline size_t operator [](size_t idx) const { return m_SufOffsets[idx]; }

    private:
        void build();

        void sort_suffixes(size_t num_names, size_t name_size);
        void bucket_by_names(size_t num_names);
        inline bool same_name(size_t suf_a, size_t suf_b, size_t name_size) const;

        const IByteSequence& m_Sequence;
        size_t m_Size;

        std::unique_ptr<size_t[]> m_SufOffsets;
        std::unique_ptr<size_t[]> m_LexNames, m_TmpBuildArr, m_BucketIdxs;
};

#endif
