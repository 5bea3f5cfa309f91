#undef NDEBUG
#include <assert.h>
#include <stdio.h>
#include <stdexcept>
#include "byteseq.hpp"

static void test_hex_sequence() {
    printf("test_hex_sequence...");

    CHexSequence seq("de ad\tBE ef\n00");
    assert(seq.size() == 5);
    assert(seq[0] == 0xde && seq[1] == 0xad && seq[2] == 0xbe && seq[3] == 0xef && seq[4] == 0x00);

    CHexSequence copy(seq);
    assert(copy.size() == 5);
    assert(copy.compare(seq, 0, 0, 5) == 0);

    //Assigned sequences own their own bytes
    CHexSequence assigned("01");
    assigned = seq;
    assert(assigned.size() == 5);
    assert(assigned.buffer() != seq.buffer());
    assert(assigned.compare(seq, 0, 0, 5) == 0);

    CHexSequence empty("");
    assert(empty.size() == 0);

    printf(" OK\n");
}

static void test_hex_errors() {
    printf("test_hex_errors...");

    bool thrown = false;
    try { CHexSequence seq("12 3g"); } catch(const std::invalid_argument&) { thrown = true; }
    assert(thrown);

    thrown = false;
    try { CHexSequence seq("123"); } catch(const std::invalid_argument&) { thrown = true; }
    assert(thrown);

    printf(" OK\n");
}

static void test_sequential_sequence() {
    printf("test_sequential_sequence...");

    CSequentialByteSequence seq;
    seq.emplace_sequence<CVectorSequence>(std::vector<uint8_t>{ 'b', 'a', 'n' });
    seq.emplace_sequence<CVectorSequence>();
    seq.emplace_sequence<CStringSequence>("ana");
    seq.emplace_sequence<CFillSequence>(1, '$');

    assert(seq.size() == 7);
    assert(seq.buffer() == nullptr);
    assert(seq.substr(0, 7) == "banana$");
    assert(seq[2] == 'n' && seq[3] == 'a' && seq[6] == '$');

    //Comparisons spanning sub-sequence boundaries
    CStringSequence str("banana$");
    assert(seq.compare((const uint8_t*) "nana", 2, 4) == 0);
    assert(seq.compare(str, 0, 0, 7) == 0);
    assert(seq.compare(str, 1, 3, 3) == 0);
    assert(seq.compare(seq, 1, 3, 3) == 0);
    assert(str.compare(seq, 1, 3, 3) == 0);
    assert(seq.compare((const uint8_t*) "nanb", 2, 4) < 0);

    bool thrown = false;
    try { seq[7]; } catch(const std::out_of_range&) { thrown = true; }
    assert(thrown);

    printf(" OK\n");
}

static void test_compare() {
    printf("test_compare...");

    CStringSequence a("abcd");
    CVectorSequence b({ 'x', 'b', 'c', 'e' });
    assert(a.compare(b, 1, 1, 2) == 0);
    assert(a.compare(b, 1, 1, 3) < 0);
    assert(b.compare(a, 1, 1, 3) > 0);

    uint8_t raw[] = { 'c', 'd' };
    CBufferSequence buf(raw, 2);
    assert(a.compare(buf, 2, 0, 2) == 0);
    assert(buf.substr(0, 2) == "cd");

    printf(" OK\n");
}

int main() {
    test_hex_sequence();
    test_hex_errors();
    test_sequential_sequence();
    test_compare();

    printf("\nAll tests passed.\n");
    return 0;
}
