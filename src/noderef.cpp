#include <sstream>
#include "noderef.hpp"

CNodeRef CNodeRef::leaf(size_t off) {
    if(off > MAX_VALUE) {
        std::stringstream sstream;
        sstream << "Leaf offset " << off << " exceeds the maximum encodable value " << MAX_VALUE;
        throw std::out_of_range(sstream.str());
    }
    return CNodeRef((uint32_t) (off << 1) | 1);
}

CNodeRef CNodeRef::inner(size_t idx) {
    if(idx > MAX_VALUE) {
        std::stringstream sstream;
        sstream << "Inner node index " << idx << " exceeds the maximum encodable value " << MAX_VALUE;
        throw std::out_of_range(sstream.str());
    }
    return CNodeRef((uint32_t) (idx << 1));
}

seqoff_t to_seqoff(size_t off) {
    if(off > CNodeRef::MAX_VALUE) {
        std::stringstream sstream;
        sstream << "Sequence offset " << off << " exceeds the maximum addressable offset " << CNodeRef::MAX_VALUE;
        throw std::length_error(sstream.str());
    }
    return (seqoff_t) off;
}

const uint32_t CNodeRef::MAX_VALUE;
const uint32_t CNodeRef::RAW_NONE;
