#pragma once

#include <shared_data/shared_data.hpp>
#include <shared_data/storage_types.hpp>
#include <storage/status_code.hpp>
#include <utility/describe.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(
        JobErrorType,
        Timeout, // The remote did not answer in time.
        Declined, // The remote answered with a non success status code.
        NotFound, // A local file or directory does not exist.
        Unexpected);

    inline void to_json(nlohmann::json& j, JobErrorType const& type)
    {
        j = Utility::enumToString<JobErrorType>(type);
    }
    inline void from_json(nlohmann::json const& j, JobErrorType& type)
    {
        type = Utility::enumFromString<JobErrorType>(j.template get<std::string>());
    }

    struct JobError
    {
        JobErrorType type;
        std::optional<Storage::StatusCode> code = std::nullopt;
        std::string message{};

        std::string toString() const;
    };
    BOOST_DESCRIBE_STRUCT(JobError, (), (type, code, message))

    JobError timeoutError(std::string message);
    JobError declinedError(Storage::StatusCode code);
    JobError notFoundError(std::string message);
    JobError unexpectedError(std::string message);
}
