#pragma once

#include <rendmail/export.hpp>
#include <rendmail/config.hpp>

#include <rendmail/codec/base64.hpp>
#include <rendmail/codec/charset.hpp>
#include <rendmail/codec/codec.hpp>
#include <rendmail/codec/percent.hpp>
#include <rendmail/codec/q_codec.hpp>

#include <rendmail/mime/content_type.hpp>
#include <rendmail/mime/header_folder.hpp>
#include <rendmail/mime/media_policy.hpp>
#include <rendmail/mime/transliterate.hpp>

#include <rendmail/io/line_reader.hpp>
#include <rendmail/io/tee_streambuf.hpp>

#include <rendmail/rewrite/options.hpp>
#include <rendmail/rewrite/rewriter.hpp>

// Utilities
#include <rendmail/detail/log.hpp>
#include <rendmail/detail/result.hpp>
