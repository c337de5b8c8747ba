#include "dict.h"

#include <fstream>
#include <iostream>

#include <stdio.h>

std::size_t read_dict(std::istream &in, Dict &dict)
{
    std::size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        // files written on windows
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        dict.insert(line);
        ++n;
    }
    return n;
}

bool load_dict(const std::string &path, Dict &dict)
{
    std::ifstream in(path);
    if (!in) {
        perror(path.c_str());
        return false;
    }

    read_dict(in, dict);
    if (in.bad()) {
        std::cerr << path << ": read error" << std::endl;
        return false;
    }
    return true;
}
