#ifndef LANSHARE_API_LANSHAREAPIDEFS_H_
#define LANSHARE_API_LANSHAREAPIDEFS_H_

#if defined(__GNUC__)
#define LANSHARE_API_EXPORT __attribute__((visibility("default")))
#define LANSHARE_API_IMPORT
#else  // Unsupported compiler
#define LANSHARE_API_EXPORT
#define LANSHARE_API_IMPORT
#endif  // defined(__GNUC__)

#ifdef LANSHARE_BUILD_SHARED_LIB
#define LANSHARE_API LANSHARE_API_EXPORT
#else
#define LANSHARE_API LANSHARE_API_IMPORT
#endif  // LANSHARE_BUILD_SHARED_LIB

#endif  // LANSHARE_API_LANSHAREAPIDEFS_H_
