#pragma once

#include <cstdio>

#ifdef CSKIT_ENABLE_DEBUG_LOG
#define CSKIT_DBG_LOG(...) std::fprintf(stderr, __VA_ARGS__)
#define CSKIT_DBG_CODE(code) \
    do {                     \
        code;                \
    } while (0)
#else
#define CSKIT_DBG_LOG(...) \
    do {                   \
    } while (0)
#define CSKIT_DBG_CODE(code) \
    do {                     \
    } while (0)
#endif
