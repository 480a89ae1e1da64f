#include <backend/progress/progress_reporter.hpp>
#include <utility/format_bytes.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Progress
{
    namespace
    {
        std::size_t barLength(std::string_view name)
        {
            if (name.size() >= 20)
                return 20;
            if (name.size() >= 10)
                return 30;
            return 40;
        }
    }

    int ratePerMille(std::uint64_t totalBytes, std::uint64_t doneBytes)
    {
        if (totalBytes == 0)
            return completeRate;
        doneBytes = std::min(doneBytes, totalBytes);
        if (doneBytes == totalBytes)
            return completeRate;

        // done * 1000 would overflow
        if (doneBytes > std::numeric_limits<std::uint64_t>::max() / completeRate)
            return static_cast<int>(doneBytes / (totalBytes / completeRate + 1));
        return static_cast<int>((doneBytes * completeRate) / totalBytes);
    }

    Sample compute(std::string_view name, std::uint64_t totalBytes, std::uint64_t doneBytes)
    {
        doneBytes = std::min(doneBytes, totalBytes);
        const double fraction =
            totalBytes == 0 ? 1.0 : static_cast<double>(doneBytes) / static_cast<double>(totalBytes);

        const auto length = barLength(name);
        const auto filled = std::min(length, static_cast<std::size_t>(std::lround(fraction * length)));
        const std::string bar = std::string(filled, '#') + std::string(length - filled, '-');

        const auto magnitude = Utility::transferOrderOfMagnitude(totalBytes);
        auto line = fmt::format(
            "{:>5.1f}% [{}] {:.1f}/{:.1f}{} | {} ",
            fraction * 100.0,
            bar,
            Utility::scaleBytes(doneBytes, magnitude),
            Utility::scaleBytes(totalBytes, magnitude),
            Utility::unitSuffix(magnitude),
            name);

        const auto rate = ratePerMille(totalBytes, doneBytes);
        if (rate == completeRate)
            line += "| Done!";
        return Sample{.line = std::move(line), .ratePerMille = rate};
    }
}
