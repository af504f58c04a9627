#include "messages.hpp"

namespace lanshare::protocol
{
const char *to_string(StatusCode status)
{
    switch (status)
    {
        case StatusCode::OK: return "ok";
        case StatusCode::NOT_FOUND: return "not found";
        case StatusCode::INVALID_STATE: return "invalid state";
        case StatusCode::UNREACHABLE: return "unreachable";
        case StatusCode::IO_FAILURE: return "i/o failure";
        case StatusCode::BAD_REQUEST: return "bad request";
        default: return "unknown";
    }
}

unsigned to_http_status(StatusCode status)
{
    switch (status)
    {
        case StatusCode::OK: return 200;
        case StatusCode::NOT_FOUND: return 404;
        case StatusCode::INVALID_STATE: return 409;
        case StatusCode::UNREACHABLE: return 502;
        case StatusCode::BAD_REQUEST: return 400;
        case StatusCode::IO_FAILURE:
        default: return 500;
    }
}

StatusCode from_http_status(unsigned http_status)
{
    if (http_status >= 200 && http_status < 300)
    {
        return StatusCode::OK;
    }

    switch (http_status)
    {
        case 400:
        case 413: return StatusCode::BAD_REQUEST;
        case 404: return StatusCode::NOT_FOUND;
        case 409: return StatusCode::INVALID_STATE;
        case 500: return StatusCode::IO_FAILURE;
        default: return StatusCode::UNREACHABLE;
    }
}
}  // namespace lanshare::protocol
