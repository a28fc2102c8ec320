/*

main.cpp
--------

Reads an email message from stdin and writes it rewritten to stdout.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iostream>
#include "cli.hpp"


int main(int argc, char* argv[])
{
    return rendmail::cli::run(argc, argv, std::cin, std::cout);
}
