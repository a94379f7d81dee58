#pragma once

#include <chrono>

namespace Ftp
{
    struct RetryPolicy
    {
        static constexpr int defaultMaxAttempts = 3;
        static constexpr std::chrono::milliseconds defaultBackoff{5000};

        int maxAttempts = defaultMaxAttempts;
        // Fixed pause between two reconnect attempts.
        std::chrono::milliseconds backoff = defaultBackoff;
    };

    struct RetryState
    {
        int attempts = 0;
        int maxAttempts = RetryPolicy::defaultMaxAttempts;

        bool exhausted() const
        {
            return attempts >= maxAttempts;
        }

        void reset()
        {
            attempts = 0;
        }
    };
}
