#pragma once

#include <utility/describe.hpp>

#include <string>

namespace Storage
{
    /// Result codes returned by every backend call.
    BOOST_DEFINE_ENUM_CLASS(
        StatusCode,
        Success,
        Failed,
        IdError,
        PasswordError,
        LackPassword,
        ZipError,
        MkdirError,
        UrlInvalid,
        FileCancelled,
        PathError,
        NetworkError,
        CaptchaError,
        Aborted);

    /**
     * @brief Human readable reason for a status code, used in user facing messages.
     */
    std::string describeStatus(StatusCode code);
}
