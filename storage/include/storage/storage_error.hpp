#pragma once

#include <stdexcept>
#include <string>

namespace Storage
{
    /**
     * @brief Thrown by a StorageClient when the remote did not answer in time.
     * Any other failure is reported as some other std::exception.
     */
    class TimeoutError : public std::runtime_error
    {
      public:
        explicit TimeoutError(std::string const& what)
            : std::runtime_error{what}
        {}
    };
}
