#ifndef MODFETCH_API_HPP
#define MODFETCH_API_HPP


#ifdef MODFETCH_STATIC
// As a static library: no symbol import/export.
#  define MODFETCH_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef MODFETCH_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define MODFETCH_API __declspec(dllexport)
#    else
#         define MODFETCH_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define MODFETCH_API __declspec(dllimport)
#    else
#         define MODFETCH_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
