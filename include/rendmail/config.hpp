/*

config.hpp
----------

Global build configuration for rendmail.

Define RENDMAIL_USE_STD_REGEX to use std::regex instead of Boost.Regex.
Define RENDMAIL_DEFAULT_MAX_NESTING_DEPTH to change the default multipart nesting limit.

*/

#pragma once

#if !defined(RENDMAIL_USE_STD_REGEX)
#define RENDMAIL_USE_STD_REGEX 0
#endif

#if !defined(RENDMAIL_DEFAULT_MAX_NESTING_DEPTH)
#define RENDMAIL_DEFAULT_MAX_NESTING_DEPTH 64
#endif
