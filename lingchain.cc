#include <iostream>
#include <string>
#include <vector>

#include "chain.h"
#include "dict.h"

// Prints the longest chains of dictionary words starting at <word>, each one
// character shorter than the word before it:
//
//   starting => stating => statin => satin => sati => sat => at => a
int main(int argc, char *argv[])
{
    if (argc != 3) {
        std::cerr << "usage: " << argv[0] << " <file> <word>" << std::endl;
        return 1;
    }
    std::string word(argv[2]);

    Dict dict;
    if (!load_dict(argv[1], dict))
        return 1;

    if (!dict.count(word)) {
        std::cout << "Input word is not in the dictionary. Continuing with substrings."
                  << std::endl;
    }

    for (const Chain &chain : search(word, dict)) {
        std::cout << format_chain(chain) << std::endl;
    }

    return 0;
}
