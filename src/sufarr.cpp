#include <assert.h>
#include <tier0/dbg.h>
#include <tier0/valve_minmax_off.h>
#include <chrono>
#include <algorithm>
#include "sufarr.hpp"

CSuffixArray::CSuffixArray(const IByteSequence& seq) : m_Sequence(seq), m_Size(seq.size()) {
    //Build the array
    using namespace std::chrono;
    auto t1 = high_resolution_clock::now();
    build();
    auto t2 = high_resolution_clock::now();

    DevMsg("Constructed suffix array for %zu byte sequence [%zu kB], took %dms\n", m_Size, get_mem_usage() / 1024, (int) duration_cast<milliseconds>(t2 - t1).count());
}

void CSuffixArray::build() {
    const size_t seq_sz = m_Size;
    m_SufOffsets = std::unique_ptr<size_t[]>(new size_t[std::max(seq_sz, (size_t) 1)]);
    if(seq_sz == 0) return;

    //Allocate arrays
    m_LexNames = std::unique_ptr<size_t[]>(new size_t[seq_sz]);
    m_TmpBuildArr = std::unique_ptr<size_t[]>(new size_t[seq_sz]);
    m_BucketIdxs = std::unique_ptr<size_t[]>(new size_t[std::max((size_t) 256, seq_sz)]);

    //Initialize suffixes, naming them by their first symbol
    size_t num_names = 256;
    for(size_t i = 0; i < seq_sz; i++) {
        m_TmpBuildArr[i] = i;
        m_LexNames[i] = m_Sequence[i];
    }
    bucket_by_names(num_names);

    //Build loop
    //Each iteration sorts by the names of the first 2*name_size symbols and assigns new names accordingly
    for(size_t name_size = 1;; name_size *= 2) {
        sort_suffixes(num_names, name_size);

        //Assign suffixes new lexicographic names
        num_names = 1;
        for(size_t i = 0; i < seq_sz; i++) {
            size_t suf = m_SufOffsets[i];
            if(i > 0 && !same_name(m_SufOffsets[i-1], suf, name_size)) num_names++;
            m_TmpBuildArr[suf] = num_names-1;
        }

        //Swap name arrays
        m_LexNames.swap(m_TmpBuildArr);

        //Check if we assigned each suffix an unique name
        if(num_names == seq_sz || name_size >= seq_sz) break;
    }

    //Free arrays
    m_LexNames.reset();
    m_TmpBuildArr.reset();
    m_BucketIdxs.reset();
}

void CSuffixArray::sort_suffixes(size_t num_names, size_t name_size) {
    const size_t seq_sz = m_Size;
    assert(num_names <= std::max((size_t) 256, seq_sz));

    //<<< Bucket sort - pass 1 >>>
    //Sort by secondary lexicographic names
    //Suffixes without a secondary name are shorter than everything sharing their primary name, so they go in front, shortest first
    size_t num_short = std::min(name_size, seq_sz);
    for(size_t i = 0; i < num_short; i++) m_TmpBuildArr[i] = seq_sz - i - 1;

    //The remaining suffixes are ordered by the names of the suffixes name_size symbols further in, which are already sorted
    size_t tmp_idx = num_short;
    for(size_t i = 0; i < seq_sz; i++) {
        size_t suf = m_SufOffsets[i];
        if(suf >= name_size) m_TmpBuildArr[tmp_idx++] = suf - name_size;
    }
    assert(tmp_idx == seq_sz);

    //<<< Bucket sort - pass 2 >>>
    //Sort by primary lexicographic names, keeping order of previous pass
    bucket_by_names(num_names);
}

void CSuffixArray::bucket_by_names(size_t num_names) {
    const size_t seq_sz = m_Size;

    //Stable counting sort of the temporary buffer into the suffix array
    std::fill_n(m_BucketIdxs.get(), num_names, 0);
    for(size_t i = 0; i < seq_sz; i++) m_BucketIdxs[m_LexNames[i]]++;

    size_t bucket_idx = 0;
    for(size_t i = 0; i < num_names; i++) {
        size_t name_cnt = m_BucketIdxs[i];
        m_BucketIdxs[i] = bucket_idx;
        bucket_idx += name_cnt;
    }
    assert(bucket_idx == seq_sz);

    for(size_t i = 0; i < seq_sz; i++) {
        size_t suf = m_TmpBuildArr[i];
        m_SufOffsets[m_BucketIdxs[m_LexNames[suf]]++] = suf;
    }
}

inline bool CSuffixArray::same_name(size_t suf_a, size_t suf_b, size_t name_size) const {
    //Compare lexicographic names at the start of the suffixes
    if(m_LexNames[suf_a] != m_LexNames[suf_b]) return false;

    //Compare lexicographic names at the current name size
    suf_a += name_size;
    suf_b += name_size;
    if(suf_a >= m_Size || suf_b >= m_Size) return suf_a >= m_Size && suf_b >= m_Size && suf_a == suf_b;
    return m_LexNames[suf_a] == m_LexNames[suf_b];
}
