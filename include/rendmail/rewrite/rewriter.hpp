/*

rewriter.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <rendmail/codec/codec.hpp>
#include <rendmail/detail/ascii.hpp>
#include <rendmail/detail/log.hpp>
#include <rendmail/detail/output_sink.hpp>
#include <rendmail/detail/result.hpp>
#include <rendmail/export.hpp>
#include <rendmail/io/line_reader.hpp>
#include <rendmail/mime/content_type.hpp>
#include <rendmail/mime/header_folder.hpp>
#include <rendmail/mime/media_policy.hpp>
#include <rendmail/mime/transliterate.hpp>
#include <rendmail/rewrite/options.hpp>


namespace rendmail
{


/**
Splitting an unfolded header field into its canonical name and its value.

@param unfolded Unfolded header field.
@return         Name in canonical form and value without the leading whitespace, or error `malformed_header_field` if there is no colon.
**/
[[nodiscard]] inline result<std::pair<std::string, std::string>> parse_header_field(std::string_view unfolded)
{
    auto colon = unfolded.find(':');
    if (colon == std::string_view::npos)
        return fail<std::pair<std::string, std::string>>(error_code::malformed_header_field,
            "malformed header field " + detail::quote(unfolded) + ": missing colon");

    return std::make_pair(detail::canonical_header_key(unfolded.substr(0, colon)),
        std::string(detail::trim_left_wsp(unfolded.substr(colon + 1))));
}


/**
Copying a message from an input stream to an output while deleting body parts and decoding the subject as configured.

Every byte not deliberately changed is copied as it is, line terminators, folding and malformed parts included.

Parsing goes recursively over the message parts. Each part goes through these states:
```
digraph message_part
{
    rankdir=LR;
    node [shape = box];
    header -> header [label = "field"];
    header -> preamble [label = "blank line, multipart"];
    header -> body [label = "blank line"];
    preamble -> part [label = "delimiter"];
    preamble -> body [label = "close delimiter"];
    part -> part [label = "delimiter"];
    part -> body [label = "close delimiter"];
    body -> done [label = "enclosing delimiter or end of input"];
}
```
**/
class RENDMAIL_EXPORT message_rewriter
{
public:

    inline static const std::string CONTENT_TYPE_HEADER{"Content-Type"};

    inline static const std::string SUBJECT_HEADER{"Subject"};

    inline static const std::string DECODED_SUBJECT_HEADER{"X-Rendmail-Subject"};

    inline static const std::string HEADER_SEPARATOR_STR{": "};

    inline static const std::string BOUNDARY_DELIMITER{"--"};

    /**
    @param in   Message to read.
    @param out  Destination of the rewritten message.
    @param opts Rewriting settings, which must outlive the rewriter.
    **/
    message_rewriter(std::istream& in, detail::output_sink& out, const rewrite_options& opts)
        : reader_(in), out_(out), opts_(opts)
    {
    }

    message_rewriter(const message_rewriter&) = delete;

    message_rewriter(message_rewriter&&) = delete;

    ~message_rewriter() = default;

    void operator=(const message_rewriter&) = delete;

    void operator=(message_rewriter&&) = delete;

    /**
    Rewriting the whole message.

    Unless in the strict mode, a malformed message is copied as far as it could be interpreted and the rest of the input follows unchanged.

    @return Transport or configuration error, or the message format error in the strict mode.
    **/
    [[nodiscard]] result_void rewrite()
    {
        result<bool> res = copy_message_part("", 0);
        if (res)
            return ok();

        if (res.error().is_message_error() && !opts_.strict)
        {
            if (opts_.verbose)
                RENDMAIL_WARN("Ignoring error: " + res.error().message());
            return reader_.copy_rest(out_);
        }
        return fail(std::move(res).error());
    }

private:

    /**
    What the header of a part tells about its body.
    **/
    struct header_data
    {
        content_type_t content_type = content_type_t::default_type();
        bool delete_part = false;
    };

    /**
    Copying a part, its header and its body. A multipart body is descended into.

    @param delim Delimiter ending the part, empty for the whole message.
    @param depth Number of enclosing multipart bodies.
    @return      Whether the part was followed by a close delimiter or the end of the input.
    **/
    result<bool> copy_message_part(const std::string& delim, unsigned int depth)
    {
        header_data hdata = RENDMAIL_TRY(copy_header());

        if (hdata.content_type.is_multipart() && !hdata.delete_part)
        {
            // See RFC 2046 section 5.1.1. The length of the boundary is not checked since overlong ones are seen in practice.
            std::string boundary = hdata.content_type.param(content_type_t::ATTR_BOUNDARY);
            if (boundary.empty())
                return fail<bool>(error_code::invalid_boundary, "invalid boundary " + detail::quote(boundary));
            if (depth >= opts_.max_nesting_depth)
                return fail<bool>(error_code::nesting_too_deep, "multipart nesting deeper than " +
                    std::to_string(opts_.max_nesting_depth));
            std::string sub_delim = BOUNDARY_DELIMITER + boundary;

            bool end = RENDMAIL_TRY(copy_body(sub_delim, false));
            while (!end)
                end = RENDMAIL_TRY(copy_message_part(sub_delim, depth + 1));
        }

        return copy_body(delim, hdata.delete_part);
    }

    /**
    Copying the header of a part up to and including the blank line.

    The first `Content-Type` field decides the media type. If the part is to be deleted, a placeholder field and a blank line are written
    right away, so the original fields end up in the body of an external body part.
    **/
    result<header_data> copy_header()
    {
        header_data data;
        std::string term;
        bool got_content_type = false;

        while (true)
        {
            std::optional<folded_line> fl = RENDMAIL_TRY(reader_.read_folded_line());
            if (!fl)
                return fail<header_data>(error_code::missing_body, "missing body");

            if (term.empty())
                term = fl->lines.front().ends_with(codec::END_OF_LINE) ? codec::END_OF_LINE : codec::LF_END_OF_LINE;

            if (fl->unfolded.empty())
            {
                RENDMAIL_TRY_VOID(write(fl->lines.front()));
                return data;
            }

            std::vector<std::string> new_lines;
            std::optional<error> msg_err;
            auto field = parse_header_field(fl->unfolded);
            if (!field)
                msg_err = std::move(field).error();
            else if (field->first == CONTENT_TYPE_HEADER && !got_content_type)
            {
                got_content_type = true;
                auto ct = parse_content_type(field->second);
                if (ct)
                    data.content_type = std::move(*ct);
                else
                {
                    if (opts_.verbose)
                        RENDMAIL_INFO("Ignoring invalid Content-Type " + detail::quote(field->second) + ": " + ct.error().message());
                    data.content_type = content_type_t::default_type();
                }

                data.delete_part = RENDMAIL_TRY(should_delete(data.content_type.media_type, opts_.delete_media_types,
                    opts_.keep_media_types));
                if (data.delete_part)
                {
                    if (opts_.verbose)
                        RENDMAIL_INFO("Deleting " + data.content_type.media_type);
                    RENDMAIL_TRY_VOID(write(CONTENT_TYPE_HEADER + HEADER_SEPARATOR_STR +
                        "message/external-body; access-type=x-rendmail-deleted;" + term +
                        "\texpiration=\"" + format_rfc1123z(opts_.now, opts_.utc_offset) + "\"" + term + term));
                }
            }
            else if (field->first == SUBJECT_HEADER && opts_.decode_subject)
            {
                std::optional<std::string> dec = decode_header_value(field->second);
                if (dec && !dec->empty() && *dec != field->second)
                    new_lines = fold_header_field(DECODED_SUBJECT_HEADER + HEADER_SEPARATOR_STR + *dec, term);
            }

            for (const auto& line : fl->lines)
                RENDMAIL_TRY_VOID(write(line));
            for (const auto& line : new_lines)
                RENDMAIL_TRY_VOID(write(line));

            // Reported only now, so that the malformed field is still copied.
            if (msg_err)
                return fail<header_data>(std::move(*msg_err));
        }
    }

    /**
    Copying lines up to and including the one starting with the delimiter.

    @param delim       Delimiter, empty to copy up to the end of the input.
    @param delete_part Dropping the lines before the delimiter instead of copying them.
    @return            Whether the delimiter is a close delimiter, or the input ended with an empty delimiter.
    **/
    result<bool> copy_body(const std::string& delim, bool delete_part)
    {
        while (true)
        {
            std::optional<std::string> line = RENDMAIL_TRY(reader_.read_line());
            if (!line)
            {
                if (!delim.empty())
                    return fail<bool>(error_code::missing_delimiter, "EOF while looking for delimiter " + detail::quote(delim));
                return true;
            }

            bool is_delim = !delim.empty() && line->starts_with(delim);
            if (!delete_part || is_delim)
                RENDMAIL_TRY_VOID(write(*line));
            if (is_delim)
                return std::string_view(*line).substr(delim.length()).starts_with(BOUNDARY_DELIMITER);
        }
    }

    result_void write(std::string_view chunk)
    {
        if (!out_.write(chunk))
            return fail(error_code::output_failed, "writing output failed");
        return ok();
    }

    line_reader reader_;

    detail::output_sink& out_;

    const rewrite_options& opts_;
};


/**
Rewriting a message, see `message_rewriter`.

@param in   Message to read.
@param out  Sink of the rewritten message.
@param opts Rewriting settings.
@return     Configuration error for a malformed glob, transport error, or message format error in the strict mode.
**/
[[nodiscard]] inline result_void rewrite_message(std::istream& in, detail::output_sink& out, const rewrite_options& opts)
{
    RENDMAIL_TRY_VOID(opts.validate());
    message_rewriter rewriter(in, out, opts);
    return rewriter.rewrite();
}


/**
Rewriting a message to an output stream.
**/
[[nodiscard]] inline result_void rewrite_message(std::istream& in, std::ostream& out, const rewrite_options& opts)
{
    detail::ostream_sink sink(out);
    RENDMAIL_TRY_VOID(rewrite_message(in, sink, opts));
    out.flush();
    if (!out)
        return fail(error_code::output_failed, "flushing output failed");
    return ok();
}


} // namespace rendmail
