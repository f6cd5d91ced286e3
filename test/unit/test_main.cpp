//
// Copyright (c) 2026 The boost_cors authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "test_suite.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <iostream>

// Runs every registered suite, or only those
// whose name starts with argv[1].
int
main(int argc, char** argv)
{
    spdlog::set_level(spdlog::level::warn);
    for(auto* s : test_suite::suites())
    {
        if( argc > 1 && std::strncmp(
                s->name, argv[1], std::strlen(argv[1])) != 0)
            continue;
        std::cout << s->name << std::endl;
        s->run();
    }
    return boost::report_errors();
}
