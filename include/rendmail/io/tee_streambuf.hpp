/*

tee_streambuf.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <exception>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>
#include <rendmail/detail/output_sink.hpp>
#include <rendmail/detail/result.hpp>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Input stream buffer copying everything read from the source to a sink.

The sink sees exactly the bytes handed to the reader, in order. A failure of the sink does not disturb reading; it is reported by `status()`.
**/
class RENDMAIL_EXPORT tee_streambuf : public std::streambuf
{
public:

    tee_streambuf(std::streambuf& source, detail::output_sink& sink, std::size_t buffer_size = DEFAULT_BUFFER_SIZE)
        : source_(source), sink_(sink), buffer_(buffer_size > 0 ? buffer_size : DEFAULT_BUFFER_SIZE)
    {
        setg(buffer_.data(), buffer_.data(), buffer_.data());
    }

    tee_streambuf(const tee_streambuf&) = delete;

    tee_streambuf(tee_streambuf&&) = delete;

    ~tee_streambuf() override = default;

    void operator=(const tee_streambuf&) = delete;

    void operator=(tee_streambuf&&) = delete;

    /**
    Reading the rest of the source through the tee, so that the sink receives the complete input.

    @return Error `input_failed` if the source failed.
    **/
    [[nodiscard]] result_void drain()
    {
        setg(eback(), egptr(), egptr());
        while (true)
        {
            int_type ch;
            try
            {
                ch = underflow();
            }
            catch (const std::exception& exc)
            {
                return fail(error_code::input_failed, std::string("draining input failed: ") + exc.what());
            }
            if (traits_type::eq_int_type(ch, traits_type::eof()))
                break;
            setg(eback(), egptr(), egptr());
        }
        return ok();
    }

    /**
    @return Error `backup_failed` if the sink rejected a chunk.
    **/
    [[nodiscard]] result_void status() const
    {
        if (failed_)
            return fail(error_code::backup_failed, "writing copy of input failed");
        return ok();
    }

    bool failed() const
    {
        return failed_;
    }

protected:

    int_type underflow() override
    {
        if (gptr() < egptr())
            return traits_type::to_int_type(*gptr());

        std::streamsize count = source_.sgetn(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        if (count <= 0)
            return traits_type::eof();

        if (!failed_ && !sink_.write(std::string_view(buffer_.data(), static_cast<std::size_t>(count))))
            failed_ = true;
        setg(buffer_.data(), buffer_.data(), buffer_.data() + count);
        return traits_type::to_int_type(*gptr());
    }

private:

    static constexpr std::size_t DEFAULT_BUFFER_SIZE = 8192;

    std::streambuf& source_;

    detail::output_sink& sink_;

    std::vector<char> buffer_;

    bool failed_ = false;
};


} // namespace rendmail
