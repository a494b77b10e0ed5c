#pragma once

#if defined _WIN32 || defined __CYGWIN__
#ifdef rstore_EXPORTS
#ifdef __GNUC__
#define RSTORE_EXPORT __attribute__ ((dllexport))
#else
#define RSTORE_EXPORT __declspec(dllexport)
#define RSTORE_DLL_WARNING_DISABLE_4251
#endif
#else
#ifdef __GNUC__
#define RSTORE_EXPORT __attribute__ ((dllimport))
#else
#define RSTORE_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define RSTORE_EXPORT __attribute__ ((visibility ("default")))
#else
#define RSTORE_EXPORT
#endif
#endif

#ifdef RSTORE_DLL_WARNING_DISABLE_4251
#pragma warning( disable : 4251 )
#pragma warning( disable : 4275 )
#endif
