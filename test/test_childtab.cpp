#undef NDEBUG
#include <assert.h>
#include <stdio.h>
#include <vector>
#include "childtab.hpp"

template<typename ChildTable> static void test_empty(const char *name) {
    printf("test_empty<%s>...", name);

    ChildTable tab;
    assert(tab.num_children() == 0);
    for(int sym = 0; sym < 256; sym++) assert(tab.get((uint8_t) sym).is_none());

    int calls = 0;
    tab.for_each([&](uint8_t sym, CNodeRef ref) { calls++; });
    assert(calls == 0);

    printf(" OK\n");
}

template<typename ChildTable> static void test_set_get(const char *name) {
    printf("test_set_get<%s>...", name);

    ChildTable tab;
    tab.set('z', CNodeRef::leaf(1));
    tab.set('a', CNodeRef::inner(2));
    tab.set('m', CNodeRef::leaf(3));
    assert(tab.num_children() == 3);
    assert(tab.get('a') == CNodeRef::inner(2));
    assert(tab.get('m') == CNodeRef::leaf(3));
    assert(tab.get('z') == CNodeRef::leaf(1));
    assert(tab.get('b').is_none());

    //Overwriting keeps the count
    tab.set('m', CNodeRef::inner(7));
    assert(tab.num_children() == 3);
    assert(tab.get('m') == CNodeRef::inner(7));

    //Clearing a slot
    tab.set('a', CNodeRef::none());
    assert(tab.num_children() == 2);
    assert(tab.get('a').is_none());

    printf(" OK\n");
}

template<typename ChildTable> static void test_order(const char *name) {
    printf("test_order<%s>...", name);

    ChildTable tab;
    const uint8_t syms[] = { 0xff, 'q', 0x00, '$', 'b', 0x80 };
    for(uint8_t sym : syms) tab.set(sym, CNodeRef::leaf(sym));

    std::vector<uint8_t> seen;
    tab.for_each([&](uint8_t sym, CNodeRef ref) {
        assert(ref == CNodeRef::leaf(sym));
        seen.push_back(sym);
    });

    std::vector<uint8_t> expected = { 0x00, '$', 'b', 'q', 0x80, 0xff };
    assert(seen == expected);

    printf(" OK\n");
}

template<typename ChildTable> static void test_fill(const char *name) {
    printf("test_fill<%s>...", name);

    ChildTable tab(CNodeRef::inner(1));
    assert(tab.num_children() == 256);
    for(int sym = 0; sym < 256; sym++) assert(tab.get((uint8_t) sym) == CNodeRef::inner(1));

    ChildTable empty(CNodeRef::none());
    assert(empty.num_children() == 0);

    printf(" OK\n");
}

static void test_mem_usage() {
    printf("test_mem_usage...");

    CSparseChildTable sparse;
    size_t empty_usage = sparse.mem_usage();
    sparse.set('a', CNodeRef::leaf(0));
    assert(sparse.mem_usage() > empty_usage);

    CDenseChildTable dense;
    assert(dense.mem_usage() >= 256 * sizeof(CNodeRef));
    assert(dense.mem_usage() > sparse.mem_usage());

    printf(" OK\n");
}

int main() {
    test_empty<CDenseChildTable>("dense");
    test_empty<CSparseChildTable>("sparse");
    test_set_get<CDenseChildTable>("dense");
    test_set_get<CSparseChildTable>("sparse");
    test_order<CDenseChildTable>("dense");
    test_order<CSparseChildTable>("sparse");
    test_fill<CDenseChildTable>("dense");
    test_fill<CSparseChildTable>("sparse");
    test_mem_usage();

    printf("\nAll tests passed.\n");
    return 0;
}
