#pragma once

#ifdef __GNUC__
#define LOSP_LIKELY(COND) __builtin_expect(COND, true)
#define LOSP_UNLIKELY(COND) __builtin_expect(COND, false)
#else
#define LOSP_LIKELY(COND) COND
#define LOSP_UNLIKELY(COND) COND
#endif
