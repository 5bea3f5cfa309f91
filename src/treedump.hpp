#ifndef H_SUFTREE_TREEDUMP
#define H_SUFTREE_TREEDUMP

#include <ostream>
#include <string>
#include "suftree.hpp"

//Escapes a raw label so that it can be printed in between double quotes
std::string escape_label(const IByteSequence& seq, SLabel label);

//Writes one line per node, children indented below their parent in ascending symbol order
void dump_suffix_tree(const ISuffixTree& tree, std::ostream& stream);

#endif
