#ifndef LINGCHAIN_CHAIN_H
#define LINGCHAIN_CHAIN_H

#include <cstddef>
#include <string>
#include <vector>

#include "dict.h"

using Chain = std::vector<std::string>;

const std::size_t no_parent = static_cast<std::size_t>(-1);

struct ChainNode {
    ChainNode(const std::string &value, std::size_t parent)
        : value(value), parent(parent)
    { }

    std::string value;
    std::size_t parent; // index of the node this one was derived from
};

// every node reached during one search, children point back to parents by index
using ChainTree = std::vector<ChainNode>;

// indexes into a ChainTree, all values one generation deep
using Frontier = std::vector<std::size_t>;

// Appends to 'tree' the children of every node in 'frontier': each
// dictionary word obtained by deleting one character. Words are utf-8, a
// multibyte character is deleted whole. A parent gets one
// child per distinct word, the same word under different parents is kept
// once per parent. Returns the indexes of the new nodes.
Frontier expand(ChainTree &tree, const Frontier &frontier, const Dict &dict);

// words from the root down to 'leaf'
Chain reconstruct(const ChainTree &tree, std::size_t leaf);

// chains for all 'leaves', sorted and without duplicates
std::vector<Chain> reconstruct_all(const ChainTree &tree, const Frontier &leaves);

// All longest chains starting at 'input', where each word is the previous
// one with a single character deleted and is in 'dict'. 'input' itself does
// not need to be a dictionary word. If no deletion of 'input' is in 'dict'
// the result is the single chain [input].
std::vector<Chain> search(const std::string &input, const Dict &dict);

std::string format_chain(const Chain &chain, const std::string &sep = " => ");

#endif
