#ifndef CONFIG_ERROR_H
#define CONFIG_ERROR_H

#include <stdexcept>
#include <string>

/* Raised for malformed task sets, platforms, and sweep parameters before any
 * analysis runs. An unschedulable task set is never reported this way. */
class ConfigurationError : public std::invalid_argument
{
  public:
    explicit ConfigurationError(const std::string &what)
        : std::invalid_argument(what)
    {}
};

#endif
