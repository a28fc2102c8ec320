/*

header_folder.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <rendmail/codec/codec.hpp>
#include <rendmail/detail/regex.hpp>


namespace rendmail
{


/**
Folding a header line into physical lines, see RFC 5322 section 2.2.3.

The line is split into tokens made of leading spaces or tabs and the following run of other characters. Tokens are packed greedily
while a line stays within the recommended length, so a continuation line starts with the whitespace of its first token.

@param unfolded Logical header line, like `Subject: text`.
@param term     Line terminator appended to every physical line.
@return         Physical lines, none if the line is empty or whitespace only.
**/
[[nodiscard]] inline std::vector<std::string> fold_header_field(const std::string& unfolded, std::string_view term)
{
    static const detail::regex TOKEN_REGEX{R"([ \t]*[^ \t]+)"};
    constexpr auto LINE_LENGTH = static_cast<std::string::size_type>(codec::line_len_policy_t::RECOMMENDED);

    std::vector<std::string> folded;
    for (detail::sregex_iterator it(unfolded.begin(), unfolded.end(), TOKEN_REGEX), end; it != end; ++it)
    {
        std::string token = it->str();
        if (folded.empty())
            folded.push_back(token);
        else if (folded.back().length() + token.length() <= LINE_LENGTH)
            folded.back() += token;
        else
        {
            folded.back() += term;
            folded.push_back(token);
        }
    }
    if (!folded.empty())
        folded.back() += term;
    return folded;
}


} // namespace rendmail
