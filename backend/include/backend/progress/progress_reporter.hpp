#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace Progress
{
    constexpr int completeRate = 1000;

    struct Sample
    {
        std::string line{};
        int ratePerMille{0};
    };

    /**
     * @brief floor(1000 * done / total). A total of 0 counts as complete, done is clamped to total.
     */
    int ratePerMille(std::uint64_t totalBytes, std::uint64_t doneBytes);

    /**
     * @brief Turns a byte count sample into a progress line and a per mille rate.
     *
     * @param name The file the sample belongs to.
     * @param totalBytes Size of the whole transfer.
     * @param doneBytes Bytes transferred so far.
     */
    Sample compute(std::string_view name, std::uint64_t totalBytes, std::uint64_t doneBytes);
}
