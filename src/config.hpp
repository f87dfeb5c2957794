#pragma once

#if defined(SK_USE_BOOST_STRING_VIEW)
#   include <boost/version.hpp>
#   if BOOST_VERSION > 106000
#   include <boost/utility/string_view.hpp>
    namespace skirmish {
        using string_view = boost::string_view;
    }
#   else
#   include <boost/utility/string_ref.hpp>
    namespace skirmish {
        using string_view = boost::string_ref;
    }
#   endif
#elif defined(SK_USE_STD_STRING_VIEW)
#   include <string_view>
    namespace skirmish {
        using string_view = std::string_view;
    }
#else
#   error Please define a string_view implementation to use.
#endif

#if defined(__clang__)
#   if __has_cpp_attribute(fallthrough)
#       define SK_ATTRIBUTE_FALLTHROUGH [[fallthrough]]
#   elif __has_cpp_attribute(clang::fallthrough)
#       define SK_ATTRIBUTE_FALLTHROUGH [[clang::fallthrough]]
#   else
#       define SK_ATTRIBUTE_FALLTHROUGH
#   endif
#elif defined(__GNUC__) && (__GNUC__ >= 7)
#   define SK_ATTRIBUTE_FALLTHROUGH [[gnu::fallthrough]]
#else
#   define SK_ATTRIBUTE_FALLTHROUGH
#endif

#ifndef _MSC_VER
#   define SK_PRINTF_ATTRIBUTE(fmt, first) \
        __attribute__ ((__format__(__printf__, fmt, first)))
#else
#   define SK_PRINTF_ATTRIBUTE(fmt, first)
#endif
