#include "chain.h"

#include <algorithm>
#include <set>
#include <utility>

// utf-8 continuation bytes are 10xxxxxx
static inline bool is_continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// index of the character following the one starting at 'pos'
static inline std::size_t next_char(const std::string &s, std::size_t pos)
{
    ++pos;
    while (pos < s.size() && is_continuation(s[pos]))
        ++pos;
    return pos;
}

// 's' without the bytes [pos, end)
static inline std::string delete_at(const std::string &s, std::size_t pos, std::size_t end)
{
    std::string shorter(s.begin(), s.begin() + pos);
    shorter.insert(shorter.end(), s.begin() + end, s.end());
    return shorter;
}

Frontier expand(ChainTree &tree, const Frontier &frontier, const Dict &dict)
{
    Frontier next;
    for (std::size_t idx : frontier) {
        // copy, emplace_back below may reallocate the tree
        const std::string current = tree[idx].value;

        // "book" yields "bok" twice, keep it once
        std::set<std::string> children;
        for (std::size_t pos = 0, end; pos < current.size(); pos = end) {
            end = next_char(current, pos);
            std::string shorter = delete_at(current, pos, end);
            if (dict.count(shorter))
                children.insert(std::move(shorter));
        }

        for (const std::string &child : children) {
            next.push_back(tree.size());
            tree.emplace_back(child, idx);
        }
    }
    return next;
}

Chain reconstruct(const ChainTree &tree, std::size_t leaf)
{
    Chain chain;
    for (std::size_t idx = leaf; idx != no_parent; idx = tree[idx].parent) {
        chain.push_back(tree[idx].value);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

std::vector<Chain> reconstruct_all(const ChainTree &tree, const Frontier &leaves)
{
    std::vector<Chain> chains;
    chains.reserve(leaves.size());
    for (std::size_t leaf : leaves) {
        chains.push_back(reconstruct(tree, leaf));
    }
    std::sort(chains.begin(), chains.end());
    chains.erase(std::unique(chains.begin(), chains.end()), chains.end());
    return chains;
}

std::vector<Chain> search(const std::string &input, const Dict &dict)
{
    ChainTree tree;
    tree.emplace_back(input, no_parent);
    Frontier frontier(1, 0);

    // every generation is one character shorter than the previous one, so
    // this stops after at most as many expansions as 'input' has characters
    for (;;) {
        Frontier next = expand(tree, frontier, dict);
        if (next.empty())
            break;
        frontier.swap(next);
    }

    // nodes of generations that died out earlier are not in 'frontier'
    return reconstruct_all(tree, frontier);
}

std::string format_chain(const Chain &chain, const std::string &sep)
{
    std::string out;
    for (auto i = chain.begin(); i != chain.end(); ++i) {
        if (i != chain.begin())
            out += sep;
        out += *i;
    }
    return out;
}
