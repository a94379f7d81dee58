#include <log/log.hpp>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setup(LoggerOptions const& options)
    {
        Detail::logger.setup(options);
    }
}
