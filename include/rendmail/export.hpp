#pragma once

#if defined(RENDMAIL_STATIC_DEFINE)
#  ifndef RENDMAIL_EXPORT
#    define RENDMAIL_EXPORT
#  endif
#  ifndef RENDMAIL_NO_EXPORT
#    define RENDMAIL_NO_EXPORT
#  endif
#else
#  ifndef RENDMAIL_EXPORT
#    if defined(__GNUC__) && __GNUC__ >= 4
#      define RENDMAIL_EXPORT __attribute__((visibility("default")))
#      define RENDMAIL_NO_EXPORT __attribute__((visibility("hidden")))
#    else
#      define RENDMAIL_EXPORT
#      define RENDMAIL_NO_EXPORT
#    endif
#  endif
#endif
