/*

content_type.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <rendmail/codec/codec.hpp>
#include <rendmail/codec/percent.hpp>
#include <rendmail/detail/ascii.hpp>
#include <rendmail/detail/result.hpp>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Media type and parameters of a `Content-Type` header field.
**/
struct RENDMAIL_EXPORT content_type_t
{
    using params_t = std::map<std::string, std::string>;

    inline static const std::string ATTR_BOUNDARY{"boundary"};

    inline static const std::string ATTR_CHARSET{"charset"};

    inline static const std::string MULTIPART_PREFIX{"multipart/"};

    /**
    Lower cased `type/subtype`.
    **/
    std::string media_type;

    /**
    Parameters keyed by lower cased name.
    **/
    params_t params;

    /**
    Value of the given parameter, empty if absent.
    **/
    std::string param(const std::string& name) const
    {
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    }

    bool is_multipart() const
    {
        return media_type.starts_with(MULTIPART_PREFIX);
    }

    bool operator==(const content_type_t&) const = default;

    /**
    Content type assumed when the field is absent or cannot be parsed, see RFC 2045 section 5.2.
    **/
    static const content_type_t& default_type()
    {
        static const content_type_t DEFAULT{"text/plain", {{ATTR_CHARSET, "us-ascii"}}};
        return DEFAULT;
    }
};


namespace detail
{

    [[nodiscard]] inline std::string_view trim_left_space(std::string_view sv) noexcept
    {
        while (!sv.empty() && (is_wsp(sv.front()) || sv.front() == '\r' || sv.front() == '\n' || sv.front() == '\v' || sv.front() == '\f'))
            sv.remove_prefix(1);
        return sv;
    }

    // Leading run of token characters, and the rest.
    [[nodiscard]] inline std::pair<std::string_view, std::string_view> consume_token(std::string_view sv) noexcept
    {
        std::string_view::size_type n = 0;
        while (n < sv.size() && is_token_char(sv[n]))
            n++;
        return {sv.substr(0, n), sv.substr(n)};
    }

    /**
    Value of a parameter, either a token or a quoted string.

    The rest is returned untouched if no value could be consumed.
    **/
    [[nodiscard]] inline std::pair<std::string, std::string_view> consume_value(std::string_view sv)
    {
        if (sv.empty())
            return {std::string(), sv};
        if (sv.front() != '"')
        {
            auto [token, rest] = consume_token(sv);
            return {std::string(token), rest};
        }

        std::string value;
        for (std::string_view::size_type i = 1; i < sv.size(); i++)
        {
            char ch = sv[i];
            if (ch == '"')
                return {value, sv.substr(i + 1)};
            if (ch == '\\' && i + 1 < sv.size() && is_tspecial(sv[i + 1]))
            {
                value += sv[++i];
                continue;
            }
            if (ch == '\r' || ch == '\n')
                return {std::string(), sv};
            value += ch;
        }
        // Missing closing quote.
        return {std::string(), sv};
    }

    struct media_param
    {
        std::string name;
        std::string value;
        std::string_view rest;
    };

    /**
    One `; name=value` parameter. An empty name means nothing could be consumed.
    **/
    [[nodiscard]] inline media_param consume_media_param(std::string_view sv)
    {
        std::string_view rest = trim_left_space(sv);
        if (!rest.starts_with(';'))
            return {"", "", sv};
        rest = trim_left_space(rest.substr(1));

        auto [name, after_name] = consume_token(rest);
        if (name.empty())
            return {"", "", sv};
        rest = trim_left_space(after_name);
        if (!rest.starts_with('='))
            return {"", "", sv};
        rest = trim_left_space(rest.substr(1));

        auto [value, after_value] = consume_value(rest);
        if (value.empty() && after_value.data() == rest.data())
            return {"", "", sv};
        return {to_lower_copy(name), std::move(value), after_value};
    }

    // `type` or `type/subtype`, both tokens.
    [[nodiscard]] inline result_void check_media_type(std::string_view media_type)
    {
        auto [type, rest] = consume_token(media_type);
        if (type.empty())
            return fail(error_code::invalid_content_type, "no media type");
        if (rest.empty())
            return ok();
        if (!rest.starts_with('/'))
            return fail(error_code::invalid_content_type, "expected slash after first token");
        auto [subtype, tail] = consume_token(rest.substr(1));
        if (subtype.empty())
            return fail(error_code::invalid_content_type, "expected token after slash");
        if (!tail.empty())
            return fail(error_code::invalid_content_type, "unexpected content after media subtype");
        return ok();
    }

    /**
    Decoding of an RFC 2231 extended value `charset'language'%XX...`. Only US-ASCII and UTF-8 are accepted.
    **/
    [[nodiscard]] inline std::optional<std::string> decode_rfc2231_value(std::string_view value)
    {
        auto first = value.find('\'');
        if (first == std::string_view::npos)
            return std::nullopt;
        auto second = value.find('\'', first + 1);
        if (second == std::string_view::npos)
            return std::nullopt;

        std::string charset = to_lower_copy(value.substr(0, first));
        if (charset != "us-ascii" && charset != "utf-8")
            return std::nullopt;
        try
        {
            return percent().decode(value.substr(second + 1));
        }
        catch (const codec_error&)
        {
            return std::nullopt;
        }
    }

} // namespace detail


/**
Parsing a `Content-Type` header field value, see RFC 2045 section 5.1 and RFC 2231 section 3-4.

Parameter continuations `name*0`, `name*1`, ... are joined and extended values `name*` are percent decoded.

@param value Header field value.
@return      Media type and parameters, or an `invalid_content_type` error.
**/
[[nodiscard]] inline result<content_type_t> parse_content_type(std::string_view value)
{
    std::string_view base = value.substr(0, value.find(';'));
    content_type_t ct;
    ct.media_type = detail::to_lower_copy(detail::trim_view(base));
    RENDMAIL_TRY_VOID(detail::check_media_type(ct.media_type));

    // Keyed by the name before the star, then by the full parameter name.
    std::map<std::string, content_type_t::params_t> continuations;
    std::string_view rest = value.substr(base.size());
    while (!rest.empty())
    {
        rest = detail::trim_left_space(rest);
        if (rest.empty())
            break;

        detail::media_param param = detail::consume_media_param(rest);
        if (param.name.empty())
        {
            if (detail::trim_view(param.rest) == ";")
                break;
            return fail<content_type_t>(error_code::invalid_content_type, "invalid media parameter");
        }

        content_type_t::params_t* pmap = &ct.params;
        auto star = param.name.find('*');
        if (star != std::string::npos)
            pmap = &continuations[param.name.substr(0, star)];

        auto existing = pmap->find(param.name);
        if (existing != pmap->end() && existing->second != param.value)
            return fail<content_type_t>(error_code::invalid_content_type, "duplicate parameter name");
        (*pmap)[param.name] = std::move(param.value);
        rest = param.rest;
    }

    for (const auto& [name, pieces] : continuations)
    {
        auto single = pieces.find(name + "*");
        if (single != pieces.end())
        {
            if (auto decoded = detail::decode_rfc2231_value(single->second))
                ct.params[name] = *decoded;
            continue;
        }

        std::string joined;
        bool valid = false;
        for (int n = 0; ; n++)
        {
            std::string simple = name + "*" + std::to_string(n);
            auto piece = pieces.find(simple);
            if (piece != pieces.end())
            {
                valid = true;
                joined += piece->second;
                continue;
            }
            piece = pieces.find(simple + "*");
            if (piece == pieces.end())
                break;
            valid = true;
            if (n == 0)
            {
                if (auto decoded = detail::decode_rfc2231_value(piece->second))
                    joined += *decoded;
            }
            else
            {
                try
                {
                    joined += percent().decode(piece->second);
                }
                catch (const codec_error&)
                {
                    // An undecodable piece contributes nothing.
                }
            }
        }
        if (valid)
            ct.params[name] = std::move(joined);
    }

    return ct;
}


} // namespace rendmail
