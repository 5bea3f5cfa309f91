#undef NDEBUG
#include <assert.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <vector>
#include <algorithm>
#include "sufarr.hpp"

static std::vector<size_t> naive_suffix_array(const std::string& str) {
    std::vector<size_t> sufs(str.size());
    for(size_t i = 0; i < str.size(); i++) sufs[i] = i;
    std::sort(sufs.begin(), sufs.end(), [&](size_t a, size_t b) { return str.compare(a, std::string::npos, str, b, std::string::npos) < 0; });
    return sufs;
}

static std::vector<size_t> to_vector(const CSuffixArray& arr) {
    std::vector<size_t> sufs;
    for(size_t i = 0; i < arr.size(); i++) sufs.push_back(arr[i]);
    return sufs;
}

static void test_banana() {
    printf("test_banana...");

    CStringSequence seq("banana$");
    CSuffixArray arr(seq);
    std::vector<size_t> expected = { 6, 5, 3, 1, 0, 4, 2 };
    assert(to_vector(arr) == expected);

    printf(" OK\n");
}

static void test_unterminated() {
    printf("test_unterminated...");

    //Proper prefixes sort in front of their extensions
    CStringSequence seq("mississippi");
    CSuffixArray arr(seq);
    std::vector<size_t> expected = { 10, 7, 4, 1, 0, 9, 8, 6, 3, 5, 2 };
    assert(to_vector(arr) == expected);

    CStringSequence run("aaaaa");
    CSuffixArray run_arr(run);
    std::vector<size_t> run_expected = { 4, 3, 2, 1, 0 };
    assert(to_vector(run_arr) == run_expected);

    printf(" OK\n");
}

static void test_trivial() {
    printf("test_trivial...");

    CStringSequence empty("");
    CSuffixArray empty_arr(empty);
    assert(empty_arr.size() == 0);

    CStringSequence single("x");
    CSuffixArray single_arr(single);
    assert(single_arr.size() == 1);
    assert(single_arr[0] == 0);

    printf(" OK\n");
}

static void test_random() {
    printf("test_random...");

    srand(1234);
    for(int round = 0; round < 200; round++) {
        size_t len = (size_t) (rand() % 300);
        int alphabet = 1 + rand() % 4;

        std::string str;
        for(size_t i = 0; i < len; i++) str.push_back((char) ('a' + rand() % alphabet));

        CStringSequence seq(str.c_str(), str.size());
        CSuffixArray arr(seq);
        assert(to_vector(arr) == naive_suffix_array(str));
    }

    //Full byte range, including zero bytes
    std::vector<uint8_t> bytes;
    for(int i = 0; i < 2000; i++) bytes.push_back((uint8_t) (rand() % 256));
    CVectorSequence seq(bytes);
    CSuffixArray arr(seq);
    std::string str(bytes.begin(), bytes.end());
    assert(to_vector(arr) == naive_suffix_array(str));

    printf(" OK\n");
}

int main() {
    test_banana();
    test_unterminated();
    test_trivial();
    test_random();

    printf("\nAll tests passed.\n");
    return 0;
}
