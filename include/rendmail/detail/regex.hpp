#pragma once

#include <string>
#include <rendmail/config.hpp>

#if RENDMAIL_USE_STD_REGEX
#include <regex>
#else
#include <boost/regex.hpp>
#endif

namespace rendmail::detail
{
#if RENDMAIL_USE_STD_REGEX
using regex = std::regex;
using smatch = std::smatch;
using sregex_iterator = std::sregex_iterator;

inline bool regex_match(const std::string& input, smatch& matches, const regex& pattern)
{
    return std::regex_match(input, matches, pattern);
}
#else
using regex = boost::regex;
using smatch = boost::smatch;
using sregex_iterator = boost::sregex_iterator;

inline bool regex_match(const std::string& input, smatch& matches, const regex& pattern)
{
    return boost::regex_match(input, matches, pattern);
}
#endif
} // namespace rendmail::detail
