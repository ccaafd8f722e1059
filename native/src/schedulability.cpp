#include <sstream>

#include "schedulability.h"
#include "config_error.h"

void check_bus_load(const fractional_t &bus_load)
{
    if (bus_load < 0 || bus_load > 1)
    {
        std::ostringstream msg;
        msg << "bus load " << bus_load << " is outside of [0, 1]";
        throw ConfigurationError(msg.str());
    }
}
