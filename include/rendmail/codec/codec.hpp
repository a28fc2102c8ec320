/*

codec.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <stdexcept>
#include <rendmail/export.hpp>


namespace rendmail
{


/**
Base class for decoders, contains various constants and miscellaneous functions for decoding purposes.
**/
class RENDMAIL_EXPORT codec
{
public:

    /**
    Checking if a character is a hexadecimal digit of either case.

    @param digit Character to check.
    @return      True if hex digit, false if not.
    **/
    static constexpr bool is_hex_digit(char digit)
    {
        return (digit >= ZERO_CHAR && digit <= NINE_CHAR) || (digit >= 'A' && digit <= 'F') || (digit >= 'a' && digit <= 'f');
    }

    /**
    Calculating value of the given hex digit.
    **/
    static constexpr int hex_digit_to_int(char digit)
    {
        if (digit >= ZERO_CHAR && digit <= NINE_CHAR)
            return digit - ZERO_CHAR;
        if (digit >= 'a' && digit <= 'f')
            return digit - 'a' + 10;
        return digit - A_CHAR + 10;
    }

    /**
    Checking if a character is eight bit.

    @param ch Character to check.
    @return   True if eight bit, false if seven bit.
    **/
    static constexpr bool is_8bit_char(char ch)
    {
        return static_cast<unsigned char>(ch) > 127;
    }

    /**
    Carriage return character.
    **/
    static constexpr char CR_CHAR = '\r';

    /**
    Line feed character.
    **/
    static constexpr char LF_CHAR = '\n';

    static constexpr char PLUS_CHAR = '+';

    static constexpr char SLASH_CHAR = '/';

    static constexpr char EQUAL_CHAR = '=';

    static constexpr char SPACE_CHAR = ' ';

    static constexpr char QUESTION_MARK_CHAR = '?';

    static constexpr char UNDERSCORE_CHAR = '_';

    static constexpr char ZERO_CHAR = '0';

    static constexpr char NINE_CHAR = '9';

    static constexpr char A_CHAR = 'A';

    /**
    Percent character, the escape of RFC 2231 extended parameter values.
    **/
    static constexpr char PERCENT_HEX_FLAG = '%';

    /**
    Carriage return plus line feed string.
    **/
    inline static const std::string END_OF_LINE{"\r\n"};

    /**
    Line feed only terminator, as found in messages stored on Unix systems.
    **/
    inline static const std::string LF_END_OF_LINE{"\n"};

    /**
    Line length policy.
    **/
    enum class line_len_policy_t : std::string::size_type {RECOMMENDED = 78, MANDATORY = 998};

    codec() = default;

    codec(const codec&) = delete;

    codec(codec&&) = delete;

    /**
    Default destructor.
    **/
    virtual ~codec() = default;

    void operator=(const codec&) = delete;

    void operator=(codec&&) = delete;
};


/**
Error thrown by codecs.
**/
class codec_error : public std::runtime_error
{
public:

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const std::string& msg) : std::runtime_error(msg)
    {
    }

    /**
    Calling parent constructor.

    @param msg Error message.
    **/
    explicit codec_error(const char* msg) : std::runtime_error(msg)
    {
    }
};


} // namespace rendmail
