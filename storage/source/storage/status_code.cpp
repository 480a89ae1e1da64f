#include <storage/status_code.hpp>

namespace Storage
{
    std::string describeStatus(StatusCode code)
    {
        using enum StatusCode;
        switch (code)
        {
            case Success:
                return "Success";
            case UrlInvalid:
                return "The share link is invalid";
            case LackPassword:
                return "An extraction code is required";
            case PasswordError:
                return "The extraction code is wrong";
            case FileCancelled:
                return "The share link has expired";
            case ZipError:
                return "Unpacking failed";
            case NetworkError:
                return "Network connection failed";
            case MkdirError:
                return "Could not create the folder";
            case IdError:
                return "Unknown file or folder id";
            case PathError:
                return "Invalid path";
            case CaptchaError:
                return "Captcha verification failed";
            case Aborted:
                return "The transfer was aborted";
            case Failed:
            default:
                return "Unknown error";
        }
    }
}
