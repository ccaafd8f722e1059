#include <sstream>
#include <iostream>

#include "platform.h"
#include "config_error.h"
#include "iter-helper.h"

unsigned int Platform::add_interconnect(unsigned int phi)
{
    unsigned int id = interconnects.size();
    interconnects.push_back(Interconnect(id, phi));
    return id;
}

void Platform::add_interconnect(const Interconnect &inter)
{
    interconnects.push_back(inter);
}

unsigned int Platform::add_accelerator(unsigned int interconnect,
                                       unsigned int phi,
                                       unsigned int burst_size)
{
    unsigned int id = accelerators.size();
    accelerators.push_back(Accelerator(id, interconnect, phi, burst_size));
    return id;
}

unsigned int Platform::count_accelerators_on(unsigned int interconnect) const
{
    unsigned int count = 0;
    foreach_accelerator_on(*this, interconnect, it)
        count++;
    return count;
}

cycles_t Platform::read_latency(unsigned int accel) const
{
    const Accelerator &acc = accelerators[accel];
    const Interconnect &inter = interconnects[acc.get_interconnect()];

    return inter.get_t_hold_addr() + inter.get_d_addr()
        + d_ps_read
        + inter.get_d_data()
        + acc.get_burst_size();
}

cycles_t Platform::write_latency(unsigned int accel) const
{
    const Accelerator &acc = accelerators[accel];
    const Interconnect &inter = interconnects[acc.get_interconnect()];

    return inter.get_t_hold_addr() + inter.get_d_addr()
        + acc.get_burst_size() * inter.get_t_hold_data()
        + d_ps_write
        + inter.get_d_data() + inter.get_d_bresp();
}

void Platform::validate() const
{
    unsigned int i;

    enumerate(interconnects, it, i)
    {
        if (it->get_id() != i)
        {
            std::ostringstream msg;
            msg << "interconnect at position " << i
                << " has id " << it->get_id();
            throw ConfigurationError(msg.str());
        }
        if (it->get_phi() == 0)
        {
            std::ostringstream msg;
            msg << "interconnect " << i << " has a zero grant budget";
            throw ConfigurationError(msg.str());
        }
    }

    enumerate(accelerators, it, i)
    {
        if (!it->is_attached()
            || it->get_interconnect() >= interconnects.size())
        {
            std::ostringstream msg;
            msg << "accelerator " << i << " is not mapped to any interconnect";
            throw ConfigurationError(msg.str());
        }
        if (it->get_phi() == 0)
        {
            std::ostringstream msg;
            msg << "accelerator " << i << " has a zero grant budget";
            throw ConfigurationError(msg.str());
        }
    }
}

std::ostream& operator<<(std::ostream &os, const Platform &p)
{
    os << "Platform(interconnects=" << p.get_interconnect_count()
       << ", accelerators=<";
    foreach(p.get_accelerators(), it)
    {
        if (it != p.get_accelerators().begin())
            os << " ";
        os << it->get_id() << "@" << it->get_interconnect();
    }
    os << ">)";
    return os;
}
