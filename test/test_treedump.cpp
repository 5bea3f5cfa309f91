#undef NDEBUG
#include <assert.h>
#include <stdio.h>
#include <string>
#include <sstream>
#include "suftree.hpp"
#include "treedump.hpp"

static std::shared_ptr<const IByteSequence> make_seq(const std::string& str) {
    return std::make_shared<CVectorSequence>(std::vector<uint8_t>(str.begin(), str.end()));
}

static std::string dump(const ISuffixTree& tree) {
    std::stringstream sstream;
    dump_suffix_tree(tree, sstream);
    return sstream.str();
}

static void test_empty() {
    printf("test_empty...");

    CSuffixTree tree(make_seq(""));
    assert(dump(tree) == "(root)\n");

    printf(" OK\n");
}

static void test_split() {
    printf("test_split...");

    CSuffixTree tree(make_seq("aab"));
    assert(dump(tree) ==
        "(root)\n"
        "  \"a\" (inner 2, suffix=1)\n"
        "    \"ab\" (leaf)\n"
        "    \"b\" (leaf)\n"
        "  \"b\" (leaf)\n"
    );

    printf(" OK\n");
}

static void test_banana() {
    printf("test_banana...");

    const char *expected =
        "(root)\n"
        "  \"$\" (leaf)\n"
        "  \"a\" (inner 4, suffix=1)\n"
        "    \"$\" (leaf)\n"
        "    \"na\" (inner 2, suffix=3)\n"
        "      \"$\" (leaf)\n"
        "      \"na$\" (leaf)\n"
        "  \"banana$\" (leaf)\n"
        "  \"na\" (inner 3, suffix=4)\n"
        "    \"$\" (leaf)\n"
        "    \"na$\" (leaf)\n";

    CSuffixTree tree(make_seq("banana$"));
    assert(dump(tree) == expected);

    CSparseSuffixTree sparse(make_seq("banana$"));
    assert(dump(sparse) == expected);

    printf(" OK\n");
}

static void test_escaping() {
    printf("test_escaping...");

    CVectorSequence seq({ 'a', '"', '\\', 0x01, 0xff, ' ' });
    assert(escape_label(seq, SLabel(0, 6)) == "a\\\"\\\\\\x01\\xff ");
    assert(escape_label(seq, SLabel(3, 3)) == "");

    CSuffixTree tree(std::make_shared<CVectorSequence>(std::vector<uint8_t>{ 0x00, 0x0a }));
    assert(dump(tree) ==
        "(root)\n"
        "  \"\\x00\\x0a\" (leaf)\n"
        "  \"\\x0a\" (leaf)\n"
    );

    printf(" OK\n");
}

static void test_deep_tree() {
    printf("test_deep_tree...");

    //A long run nests one inner node per symbol
    std::string str(2000, 'a');
    str.push_back('$');
    CSparseSuffixTree tree(make_seq(str));

    std::string out = dump(tree);
    size_t num_lines = 0;
    for(char chr : out) if(chr == '\n') num_lines++;
    assert(num_lines == 1 + (tree.num_nodes() - 2) + tree.num_leaves());

    printf(" OK\n");
}

int main() {
    test_empty();
    test_split();
    test_banana();
    test_escaping();
    test_deep_tree();

    printf("\nAll tests passed.\n");
    return 0;
}
