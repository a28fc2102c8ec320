/*

line_reader.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <rendmail/detail/ascii.hpp>
#include <rendmail/detail/output_sink.hpp>
#include <rendmail/detail/result.hpp>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Header line as read from the input, see RFC 5322 section 2.2.3.
**/
struct RENDMAIL_EXPORT folded_line
{
    /**
    Original physical lines, each with its terminator if it had one.
    **/
    std::vector<std::string> lines;

    /**
    Concatenation of the lines without their terminators. The folding whitespace is kept.
    **/
    std::string unfolded;
};


/**
Reading a message line by line without losing any byte of it.

The reader never consumes more than the line it returns; deciding whether a header line continues takes a single character of lookahead.
**/
class RENDMAIL_EXPORT line_reader
{
public:

    explicit line_reader(std::istream& in) : in_(in)
    {
    }

    line_reader(const line_reader&) = delete;

    line_reader(line_reader&&) = delete;

    ~line_reader() = default;

    void operator=(const line_reader&) = delete;

    void operator=(line_reader&&) = delete;

    /**
    Reading a physical line.

    @return Line including its terminator, the unterminated remainder at the end of the input, or empty at the end of the input.
    **/
    [[nodiscard]] result<std::optional<std::string>> read_line()
    {
        std::string line;
        std::getline(in_, line);
        if (in_.bad())
            return fail<std::optional<std::string>>(error_code::input_failed, "reading line failed");
        if (in_.eof())
        {
            if (line.empty())
                return std::optional<std::string>();
            return std::optional<std::string>(std::move(line));
        }
        if (in_.fail())
            return fail<std::optional<std::string>>(error_code::input_failed, "line too long");
        line += '\n';
        return std::optional<std::string>(std::move(line));
    }

    /**
    Reading a logical header line: a physical line followed by any lines starting with a space or a tab.

    @return Folded line, or empty at the end of the input.
    **/
    [[nodiscard]] result<std::optional<folded_line>> read_folded_line()
    {
        std::optional<std::string> first = RENDMAIL_TRY(read_line());
        if (!first)
            return std::optional<folded_line>();

        folded_line fl;
        fl.unfolded = std::string(detail::trim_crlf(*first));
        fl.lines.push_back(std::move(*first));
        if (fl.unfolded.empty())
            return std::optional<folded_line>(std::move(fl));

        while (true)
        {
            std::istream::int_type next = in_.peek();
            if (in_.bad())
                return fail<std::optional<folded_line>>(error_code::input_failed, "peeking line failed");
            if (std::istream::traits_type::eq_int_type(next, std::istream::traits_type::eof()))
                break;
            char ch = std::istream::traits_type::to_char_type(next);
            if (!detail::is_wsp(ch))
                break;

            std::optional<std::string> cont = RENDMAIL_TRY(read_line());
            if (!cont)
                break;
            fl.unfolded += detail::trim_crlf(*cont);
            fl.lines.push_back(std::move(*cont));
        }
        return std::optional<folded_line>(std::move(fl));
    }

    /**
    Writing every unread byte of the input to the sink, unchanged.
    **/
    [[nodiscard]] result_void copy_rest(detail::output_sink& out)
    {
        char buf[BUFFER_SIZE];
        while (in_)
        {
            in_.read(buf, BUFFER_SIZE);
            std::streamsize count = in_.gcount();
            if (in_.bad())
                return fail(error_code::input_failed, "reading input failed");
            if (count > 0 && !out.write(std::string_view(buf, static_cast<std::size_t>(count))))
                return fail(error_code::output_failed, "writing output failed");
        }
        return ok();
    }

private:

    static constexpr std::streamsize BUFFER_SIZE = 8192;

    std::istream& in_;
};


} // namespace rendmail
