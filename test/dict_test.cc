#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

#include "dict.h"

static void test_read_dict()
{
    std::istringstream in("a\r\nat\n\nsat\nat\n");
    Dict dict;
    std::size_t n = read_dict(in, dict);
    assert(n == 4);
    assert(dict.size() == 3);
    assert(dict.count("a"));
    assert(dict.count("at"));
    assert(dict.count("sat"));
    assert(!dict.count(""));
    assert(!dict.count("a\r"));
    std::cout << "read_dict passed." << std::endl;
}

static void test_load_dict()
{
    const char *path = "dict_test_words.txt";
    {
        std::ofstream out(path);
        out << "starting\nstating\nstatin\n";
    }

    Dict dict;
    assert(load_dict(path, dict));
    assert(dict.size() == 3);
    assert(dict.count("statin"));
    std::remove(path);

    Dict missing;
    assert(!load_dict("no/such/dictionary.txt", missing));
    assert(missing.empty());

    // a directory opens but cannot be read
    Dict unreadable;
    assert(!load_dict(".", unreadable));
    std::cout << "load_dict passed." << std::endl;
}

int main()
{
    test_read_dict();
    test_load_dict();
    return 0;
}
