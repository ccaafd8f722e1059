#ifndef TIME_TYPES_H
#define TIME_TYPES_H

/* include string.h for gmpxx.h */
#include <string.h>
#include <gmpxx.h>

typedef mpz_class integral_t;
typedef mpq_class fractional_t;

/* all times are in clock cycles of the programmable logic */
typedef unsigned long cycles_t;

/* marks a delay that cannot be bounded (e.g., at 100% background bus load) */
const cycles_t UNBOUNDED = (cycles_t) -1;

/* Converts an arbitrary-precision time to cycles. Values that do not fit
 * saturate to UNBOUNDED, which is larger than any deadline. */
static inline cycles_t to_cycles(const integral_t &t)
{
    if (t.fits_ulong_p() && t.get_ui() != UNBOUNDED)
        return t.get_ui();
    else
        return UNBOUNDED;
}

#endif
