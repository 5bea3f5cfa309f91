#include <tier0/dbg.h>
#include <tier0/icommandline.h>
#include <tier0/valve_minmax_off.h>

#include <memory>
#include <string>
#include <sstream>
#include <stdexcept>
#include "byteseq.hpp"
#include "suftree.hpp"
#include "treedump.hpp"
#include "verify.hpp"

static const char *DEFAULT_PAYLOAD = "bananas$";

static std::shared_ptr<const IByteSequence> create_payload() {
    std::shared_ptr<CSequentialByteSequence> seq = std::make_shared<CSequentialByteSequence>();

    const char *hexstr = CommandLine()->ParmValue("-hex", (const char*) nullptr);
    if(hexstr) seq->emplace_sequence<CHexSequence>(hexstr);
    else {
        std::string str = CommandLine()->ParmValue("-payload", DEFAULT_PAYLOAD);
        seq->emplace_sequence<CVectorSequence>(std::vector<uint8_t>(str.begin(), str.end()));
    }

    if(CommandLine()->FindParm("-terminate")) seq->emplace_sequence<CFillSequence>(1, 0);

    return seq;
}

int main(int argc, char **argv) {
    CommandLine()->CreateCmdLine(argc, argv);

    try {
        std::shared_ptr<const IByteSequence> seq = create_payload();

        //Build the tree
        std::unique_ptr<ISuffixTree> tree;
        if(CommandLine()->FindParm("-sparse")) tree.reset(new CSparseSuffixTree(seq));
        else tree.reset(new CSuffixTree(seq));

        //Dump it line by line, as the spew buffer is limited
        if(!CommandLine()->FindParm("-nodump")) {
            std::stringstream sstream;
            dump_suffix_tree(*tree, sstream);

            std::string line;
            while(std::getline(sstream, line)) Msg("%s\n", line.c_str());
        }

        if(CommandLine()->FindParm("-verify")) {
            bool terminated = has_unique_terminator(*seq);
            SVerifyStats stats = CTreeVerifier(*tree).verify(terminated);
            Msg("Verified suffix tree of %zu byte payload: %zu inner nodes, %zu leaves, max depth %zu%s\n", seq->size(), stats.num_inner, stats.num_leaves, stats.max_depth,
                terminated ? "" : " (no unique terminator, suffix order not checked)"
            );
        }
    } catch(const std::exception& e) {
        Warning("Exception while building suffix tree: %s\n", e.what());
        return 1;
    }

    return 0;
}
