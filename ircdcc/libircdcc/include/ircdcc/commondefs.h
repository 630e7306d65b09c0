#ifndef LIBIRCDCC_COMMONDEFS_H_
#define LIBIRCDCC_COMMONDEFS_H_

#if defined(__GNUC__)
#define IRCDCC_API_EXPORT __attribute__((visibility("default")))
#define IRCDCC_API_IMPORT
#else  // Unsupported compiler
#define IRCDCC_API_EXPORT
#define IRCDCC_API_IMPORT
#endif

#ifdef IRCDCC_BUILD_SHARED_LIB
#define IRCDCC_API IRCDCC_API_EXPORT
#else
#define IRCDCC_API IRCDCC_API_IMPORT
#endif  // IRCDCC_BUILD_SHARED_LIB

#endif  // LIBIRCDCC_COMMONDEFS_H_
