#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include "time-types.h"

static inline fractional_t frac(long num, unsigned long den)
{
    fractional_t f = num;
    f /= den;
    return f;
}

#endif
