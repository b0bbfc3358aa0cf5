#pragma once

// Marks a type whose objects may be read through byte storage they alias.
#if defined(__GNUC__) || defined(__clang__)
#define OCTA_MAY_ALIAS __attribute__((__may_alias__))
#else
#define OCTA_MAY_ALIAS
#endif

#ifndef OCTA_BASE_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(OCTA_BASE_SHARED_BUILD)
#define OCTA_BASE_API __declspec(dllexport)
#elif defined(OCTA_BASE_SHARED)
#define OCTA_BASE_API __declspec(dllimport)
#else
#define OCTA_BASE_API
#endif
#define OCTA_BASE_LOCAL
#else
#if defined(OCTA_BASE_SHARED_BUILD) || defined(OCTA_BASE_SHARED)
#define OCTA_BASE_API __attribute__((visibility("default")))
#else
#define OCTA_BASE_API
#endif
#define OCTA_BASE_LOCAL __attribute__((visibility("hidden")))
#endif
#endif
#ifndef OCTA_BASE_LOCAL
#define OCTA_BASE_LOCAL
#endif
