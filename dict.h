#ifndef LINGCHAIN_DICT_H
#define LINGCHAIN_DICT_H

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_set>

using Dict = std::unordered_set<std::string>;

// Adds one word per line of 'in' to 'dict', blank lines are skipped.
// Returns the number of lines added.
std::size_t read_dict(std::istream &in, Dict &dict);

// Returns false after printing the cause on stderr if 'path' cannot be
// opened or read.
bool load_dict(const std::string &path, Dict &dict);

#endif
