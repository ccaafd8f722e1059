#ifndef PLATFORM_H
#define PLATFORM_H

#include <vector>
#include <limits.h>

#include "time-types.h"

/* Default AXI timing parameters, in clock cycles. */

// accelerators (bus masters)
#define BURST_DEF     16
#define PHI_ACCEL_DEF 6

// interconnects
#define D_INT_ADDR    10
#define D_INT_DATA    10
#define D_INT_BRESP   10
#define T_HOLD_ADDR   1
#define T_HOLD_DATA   1
#define T_HOLD_BRESP  1
#define PHI_INT_DEF   1

// processing system side of the shared bus
#define D_PS_READ     25
#define D_PS_WRITE    25

// nominal duration of one transaction, used to size workloads
#define T_TRANS       150

// 100 MHz
#define CLK_RATE      (100UL * 1000UL * 1000UL)

#define NO_INTERCONNECT UINT_MAX

static inline cycles_t ms_to_cycles(unsigned long ms)
{
    return ms * (CLK_RATE / 1000);
}

class Interconnect
{
  private:
    unsigned int id;
    unsigned int phi;   /* grants per round at the shared bus */
    cycles_t d_addr;
    cycles_t d_data;
    cycles_t d_bresp;
    cycles_t t_hold_addr;
    cycles_t t_hold_data;
    cycles_t t_hold_bresp;

  public:
    Interconnect(unsigned int id,
                 unsigned int phi = PHI_INT_DEF,
                 cycles_t d_addr = D_INT_ADDR,
                 cycles_t d_data = D_INT_DATA,
                 cycles_t d_bresp = D_INT_BRESP,
                 cycles_t t_hold_addr = T_HOLD_ADDR,
                 cycles_t t_hold_data = T_HOLD_DATA,
                 cycles_t t_hold_bresp = T_HOLD_BRESP)
        : id(id), phi(phi),
          d_addr(d_addr), d_data(d_data), d_bresp(d_bresp),
          t_hold_addr(t_hold_addr), t_hold_data(t_hold_data),
          t_hold_bresp(t_hold_bresp)
    {}

    unsigned int get_id() const { return id; }
    unsigned int get_phi() const { return phi; }
    cycles_t get_d_addr() const { return d_addr; }
    cycles_t get_d_data() const { return d_data; }
    cycles_t get_d_bresp() const { return d_bresp; }
    cycles_t get_t_hold_addr() const { return t_hold_addr; }
    cycles_t get_t_hold_data() const { return t_hold_data; }
    cycles_t get_t_hold_bresp() const { return t_hold_bresp; }
};

class Accelerator
{
  private:
    unsigned int id;
    unsigned int interconnect;
    unsigned int phi;   /* grants per round at its interconnect */
    unsigned int burst_size;

  public:
    Accelerator(unsigned int id,
                unsigned int interconnect,
                unsigned int phi = PHI_ACCEL_DEF,
                unsigned int burst_size = BURST_DEF)
        : id(id), interconnect(interconnect),
          phi(phi), burst_size(burst_size)
    {}

    unsigned int get_id() const { return id; }
    unsigned int get_interconnect() const { return interconnect; }
    unsigned int get_phi() const { return phi; }
    unsigned int get_burst_size() const { return burst_size; }

    bool is_attached() const { return interconnect != NO_INTERCONNECT; }
};

typedef std::vector<Interconnect> Interconnects;
typedef std::vector<Accelerator> Accelerators;

/* Parallel interconnects, each one port of the shared bus, with the
 * accelerators attached to them. Accelerator and interconnect ids are
 * their indices. */
class Platform
{
  private:
    Interconnects interconnects;
    Accelerators accelerators;
    cycles_t d_ps_read;
    cycles_t d_ps_write;

  public:
    Platform(cycles_t d_ps_read = D_PS_READ,
             cycles_t d_ps_write = D_PS_WRITE)
        : d_ps_read(d_ps_read), d_ps_write(d_ps_write)
    {}

    unsigned int add_interconnect(unsigned int phi = PHI_INT_DEF);
    void add_interconnect(const Interconnect &inter);

    unsigned int add_accelerator(unsigned int interconnect,
                                 unsigned int phi = PHI_ACCEL_DEF,
                                 unsigned int burst_size = BURST_DEF);

    const Interconnects& get_interconnects() const { return interconnects; }
    const Accelerators& get_accelerators() const { return accelerators; }

    unsigned int get_interconnect_count() const { return interconnects.size(); }
    unsigned int get_accelerator_count() const { return accelerators.size(); }

    const Interconnect& get_interconnect(unsigned int idx) const
    {
        return interconnects[idx];
    }

    const Accelerator& get_accelerator(unsigned int idx) const
    {
        return accelerators[idx];
    }

    cycles_t get_d_ps_read() const { return d_ps_read; }
    cycles_t get_d_ps_write() const { return d_ps_write; }

    unsigned int count_accelerators_on(unsigned int interconnect) const;

    // contention-free latency of a single read/write burst issued by 'accel'
    cycles_t read_latency(unsigned int accel) const;
    cycles_t write_latency(unsigned int accel) const;

    // throws ConfigurationError
    void validate() const;
};

#endif
