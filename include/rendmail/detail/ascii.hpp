#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <cstdio>

namespace rendmail
{
namespace detail
{
    [[nodiscard]] constexpr char ascii_tolower(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
    }

    [[nodiscard]] constexpr char ascii_toupper(char c) noexcept
    {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - ('a' - 'A')) : c;
    }

    [[nodiscard]] inline bool iequals_ascii(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
            return false;

        for (std::size_t i = 0; i < a.size(); ++i)
        {
            if (ascii_tolower(a[i]) != ascii_tolower(b[i]))
                return false;
        }
        return true;
    }

    [[nodiscard]] inline std::string to_lower_copy(std::string_view sv)
    {
        std::string s(sv);
        for (auto& ch : s)
            ch = ascii_tolower(ch);
        return s;
    }

    [[nodiscard]] constexpr bool is_wsp(char c) noexcept
    {
        return c == ' ' || c == '\t';
    }

    [[nodiscard]] inline std::string_view trim_view(std::string_view sv) noexcept
    {
        auto is_space = [](unsigned char c) noexcept { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
            sv.remove_prefix(1);
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
            sv.remove_suffix(1);
        return sv;
    }

    [[nodiscard]] inline std::string_view trim_left_wsp(std::string_view sv) noexcept
    {
        while (!sv.empty() && is_wsp(sv.front()))
            sv.remove_prefix(1);
        return sv;
    }

    // Strips one trailing "\n" or "\r\n". A lone "\r" is kept.
    [[nodiscard]] inline std::string_view trim_crlf(std::string_view ln) noexcept
    {
        if (!ln.empty() && ln.back() == '\n')
        {
            ln.remove_suffix(1);
            if (!ln.empty() && ln.back() == '\r')
                ln.remove_suffix(1);
        }
        return ln;
    }

    // RFC 2045: tspecials := "(" / ")" / "<" / ">" / "@" / "," / ";" / ":" / "\" / <"> / "/" / "[" / "]" / "?" / "="
    [[nodiscard]] constexpr bool is_tspecial(char c) noexcept
    {
        return std::string_view("()<>@,;:\\\"/[]?=").find(c) != std::string_view::npos;
    }

    // RFC 2045: token := 1*<any (US-ASCII) CHAR except SPACE, CTLs, or tspecials>
    [[nodiscard]] constexpr bool is_token_char(char c) noexcept
    {
        unsigned char u = static_cast<unsigned char>(c);
        return u > 32 && u < 127 && !is_tspecial(c);
    }

    [[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
    {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] constexpr bool is_ascii_digit(char c) noexcept
    {
        return (c >= '0' && c <= '9');
    }

    [[nodiscard]] constexpr bool is_ascii_alnum(char c) noexcept
    {
        return is_ascii_alpha(c) || is_ascii_digit(c);
    }

    // RFC 7230 tchar, the characters allowed in a header field name for canonicalization.
    inline constexpr std::string_view TCHAR_PUNCT = "!#$%&'*+-.^_`|~";

    [[nodiscard]] constexpr bool is_header_name_char(char c) noexcept
    {
        return is_ascii_alnum(c) || (TCHAR_PUNCT.find(c) != std::string_view::npos);
    }

    /**
    Canonical form of a header field name: the first letter and any letter following a hyphen are upper case, the rest is lower case.
    A name containing a space or another character not allowed in a field name is returned unchanged.
    **/
    [[nodiscard]] inline std::string canonical_header_key(std::string_view name)
    {
        for (char ch : name)
            if (!is_header_name_char(ch))
                return std::string(name);

        std::string key(name);
        bool upper = true;
        for (auto& ch : key)
        {
            ch = upper ? ascii_toupper(ch) : ascii_tolower(ch);
            upper = ch == '-';
        }
        return key;
    }

    // Double-quoted rendering with escaped control bytes, for diagnostics.
    [[nodiscard]] inline std::string quote(std::string_view s)
    {
        std::string q = "\"";
        for (char ch : s)
        {
            unsigned char u = static_cast<unsigned char>(ch);
            if (ch == '"' || ch == '\\')
            {
                q += '\\';
                q += ch;
            }
            else if (ch == '\r')
                q += "\\r";
            else if (ch == '\n')
                q += "\\n";
            else if (ch == '\t')
                q += "\\t";
            else if (u < 32 || u == 127)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", u);
                q += buf;
            }
            else
                q += ch;
        }
        q += '"';
        return q;
    }

} // namespace detail
} // namespace rendmail
