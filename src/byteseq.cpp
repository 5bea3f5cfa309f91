#include <ctype.h>
#include <algorithm>
#include <sstream>
#include "byteseq.hpp"

int CSequentialByteSequence::compare(const uint8_t *buf, size_t off, size_t size) const {
    while(size > 0) {
        const SSeqEntry& seq_ent = get_sequence(off);

        size_t sz = std::min(seq_ent.seq->size() - (off - seq_ent.off), size);
        int r = seq_ent.seq->compare(buf, off - seq_ent.off, sz);
        if(r != 0) return r;

        buf += sz;
        off += sz;
        size -= sz;
    }
    return 0;
}

void CSequentialByteSequence::get_data(uint8_t *buf, size_t off, size_t size) const {
    while(size > 0) {
        const SSeqEntry& seq_ent = get_sequence(off);

        size_t sz = std::min(seq_ent.seq->size() - (off - seq_ent.off), size);
        seq_ent.seq->get_data(buf, off - seq_ent.off, sz);

        buf += sz;
        off += sz;
        size -= sz;
    }
}

const CSequentialByteSequence::SSeqEntry& CSequentialByteSequence::get_sequence(size_t off) const {
    if(off >= m_Size) {
        std::stringstream sstream;
        sstream << "Offset " << off << " is out of range of the sequential sequence [" << m_Size << " bytes]";
        throw std::out_of_range(sstream.str());
    }

    //Find the last entry starting at or before the offset
    //Empty sequences share their offset with their successor, so keep searching to the right
    size_t s = 0, e = m_Sequences.size();
    while(s < e-1) {
        size_t m = s + (e-s) / 2;
        if(off < m_Sequences[m].off) e = m;
        else s = m;
    }
    return m_Sequences[s];
}

static int hex_digit(char chr) {
    if('0' <= chr && chr <= '9') return chr - '0';
    if('a' <= chr && chr <= 'f') return chr - 'a' + 0xa;
    if('A' <= chr && chr <= 'F') return chr - 'A' + 0xa;
    return -1;
}

CHexSequence::CHexSequence(const char *hexstr) {
    //Determine sequence size
    size_t num_digits = 0;
    for(const char *p = hexstr; *p; p++) {
        if(isspace((unsigned char) *p)) continue;

        if(hex_digit(*p) < 0) {
            std::stringstream sstream;
            sstream << "Invalid hex character '" << *p << "' at position " << (p - hexstr);
            throw std::invalid_argument(sstream.str());
        }
        num_digits++;
    }
    if(num_digits % 2 != 0) throw std::invalid_argument("Hex string has an odd number of digits");

    //Create sequence data
    m_Data.reserve(num_digits / 2);

    int hi_nibble = -1;
    for(const char *p = hexstr; *p; p++) {
        if(isspace((unsigned char) *p)) continue;

        if(hi_nibble < 0) hi_nibble = hex_digit(*p);
        else {
            m_Data.push_back((uint8_t) ((hi_nibble << 4) | hex_digit(*p)));
            hi_nibble = -1;
        }
    }
}
