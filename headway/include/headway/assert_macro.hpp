#pragma once

// Assertions are compiled in only when HDW_HAVE_ASSERTIONS is defined,
// which the build sets from the HDW_WITH_ASSERTIONS option.

#ifdef HDW_HAVE_ASSERTIONS

#ifdef __GNUC__
#define HDW_PP_FUNCTION_NAME __PRETTY_FUNCTION__
#else
#define HDW_PP_FUNCTION_NAME __func__
#endif

#define HDW_ASSERT(condition) \
do { \
    if (!(condition)) { \
        ::hdw::global_failed_assertion_handler(#condition, __FILE__, __LINE__, HDW_PP_FUNCTION_NAME); \
    } \
} while (false)

#else

#define HDW_ASSERT(condition) ((void)0)

#endif // def HDW_HAVE_ASSERTIONS
