#include <shared_data/job_error.hpp>

#include <fmt/format.h>

namespace SharedData
{
    std::string JobError::toString() const
    {
        const auto enumString = boost::describe::enum_to_string(type, "INVALID_ENUM_VALUE");
        if (code.has_value())
        {
            const auto codeString = boost::describe::enum_to_string(*code, "INVALID_ENUM_VALUE");
            if (!message.empty())
                return fmt::format("{} ({}): {}.", enumString, codeString, message);
            return fmt::format("{} ({}).", enumString, codeString);
        }
        if (!message.empty())
            return fmt::format("{}: {}.", enumString, message);
        return enumString;
    }

    JobError timeoutError(std::string message)
    {
        return JobError{.type = JobErrorType::Timeout, .code = std::nullopt, .message = std::move(message)};
    }
    JobError declinedError(Storage::StatusCode code)
    {
        return JobError{.type = JobErrorType::Declined, .code = code, .message = Storage::describeStatus(code)};
    }
    JobError notFoundError(std::string message)
    {
        return JobError{.type = JobErrorType::NotFound, .code = std::nullopt, .message = std::move(message)};
    }
    JobError unexpectedError(std::string message)
    {
        return JobError{.type = JobErrorType::Unexpected, .code = std::nullopt, .message = std::move(message)};
    }
}
