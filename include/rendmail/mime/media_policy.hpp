/*

media_policy.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Deciding which body parts are deleted, by matching their media type against shell style globs.

*/


#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <rendmail/detail/ascii.hpp>
#include <rendmail/detail/result.hpp>


namespace rendmail
{

namespace detail
{

    /**
    Parsing one character class element, a plain or escaped character. The index is left after the element.
    **/
    [[nodiscard]] inline bool glob_class_char(std::string_view pattern, std::size_t& i, char& ch) noexcept
    {
        if (i >= pattern.size() || pattern[i] == '-' || pattern[i] == ']')
            return false;
        if (pattern[i] == '\\')
        {
            i++;
            if (i >= pattern.size())
                return false;
        }
        ch = pattern[i++];
        return true;
    }

    /**
    Matching a character against the class starting after `[`. The index is left after the closing `]`.

    @return False for a malformed class.
    **/
    [[nodiscard]] inline bool glob_class(std::string_view pattern, std::size_t& i, char ch, bool& matched) noexcept
    {
        bool negated = false;
        if (i < pattern.size() && pattern[i] == '^')
        {
            negated = true;
            i++;
        }

        bool in_class = false;
        std::size_t ranges = 0;
        while (true)
        {
            if (i < pattern.size() && pattern[i] == ']' && ranges > 0)
            {
                i++;
                break;
            }
            char lo;
            if (!glob_class_char(pattern, i, lo))
                return false;
            char hi = lo;
            if (i < pattern.size() && pattern[i] == '-')
            {
                i++;
                if (!glob_class_char(pattern, i, hi))
                    return false;
            }
            if (lo <= ch && ch <= hi)
                in_class = true;
            ranges++;
        }
        matched = in_class != negated;
        return true;
    }

    [[nodiscard]] inline bool glob_match_from(std::string_view pattern, std::size_t i, std::string_view name, std::size_t j)
    {
        while (i < pattern.size())
        {
            char pc = pattern[i];
            if (pc == '*')
            {
                while (i < pattern.size() && pattern[i] == '*')
                    i++;
                if (i == pattern.size())
                    return name.find('/', j) == std::string_view::npos;
                for (std::size_t k = j; k <= name.size(); k++)
                {
                    if (glob_match_from(pattern, i, name, k))
                        return true;
                    if (k < name.size() && name[k] == '/')
                        break;
                }
                return false;
            }

            if (j >= name.size())
                return false;

            if (pc == '?')
            {
                if (name[j] == '/')
                    return false;
                i++;
            }
            else if (pc == '[')
            {
                i++;
                bool matched = false;
                if (!glob_class(pattern, i, name[j], matched) || !matched)
                    return false;
            }
            else
            {
                if (pc == '\\')
                    i++;
                if (pattern[i] != name[j])
                    return false;
                i++;
            }
            j++;
        }
        return j == name.size();
    }

} // namespace detail


/**
Checking the syntax of a glob.

`*` matches any run of characters except `/`, `?` matches one character except `/`, `[...]` is a character class with an optional leading `^`
for negation and `a-z` ranges, and `\` escapes the next character.

@param pattern Glob to check.
@return        Error `invalid_glob` for an unterminated or empty class, a bad range or a trailing backslash.
**/
[[nodiscard]] inline result_void validate_glob(std::string_view pattern)
{
    for (std::size_t i = 0; i < pattern.size();)
    {
        if (pattern[i] == '\\')
        {
            if (i + 1 >= pattern.size())
                return fail(error_code::invalid_glob, "syntax error in pattern " + detail::quote(pattern));
            i += 2;
        }
        else if (pattern[i] == '[')
        {
            i++;
            bool matched;
            if (!detail::glob_class(pattern, i, 'a', matched))
                return fail(error_code::invalid_glob, "syntax error in pattern " + detail::quote(pattern));
        }
        else
            i++;
    }
    return ok();
}


/**
Matching a name against a glob, case sensitively and in full.

@param pattern Glob.
@param name    Name to match.
@return        Whether the name matches, or error `invalid_glob`.
**/
[[nodiscard]] inline result<bool> glob_match(std::string_view pattern, std::string_view name)
{
    RENDMAIL_TRY_VOID(validate_glob(pattern));
    return detail::glob_match_from(pattern, 0, name, 0);
}


/**
Deciding whether a body part of the given media type is deleted.

Only the first delete glob matching the media type is considered: the part is kept if any keep glob matches as well, deleted otherwise.
Hence the result depends on the order of the delete globs.

@param media_type Lower cased media type of the part.
@param delete_globs Globs selecting the parts to delete.
@param keep_globs Globs overriding the deletion.
@return           True if the part is deleted, or error `invalid_glob` for a malformed glob on the evaluated path.
**/
[[nodiscard]] inline result<bool> should_delete(std::string_view media_type, const std::vector<std::string>& delete_globs,
    const std::vector<std::string>& keep_globs)
{
    for (const auto& del : delete_globs)
    {
        bool del_match = RENDMAIL_TRY(glob_match(del, media_type));
        if (!del_match)
            continue;

        for (const auto& keep : keep_globs)
        {
            bool keep_match = RENDMAIL_TRY(glob_match(keep, media_type));
            if (keep_match)
                return false;
        }
        return true;
    }
    return false;
}


} // namespace rendmail
