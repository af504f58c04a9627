#include "address.hpp"

#include <cctype>
#include <sstream>

namespace lanshare::network::conversion
{
std::optional<IPv4Address> to_ipv4_address(const std::string &str)
{
    IPv4Address result     = 0;
    int         byte_count = 0;
    size_t      pos        = 0;

    while (byte_count != 4)
    {
        size_t   digits = 0;
        unsigned byte   = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos])) &&
               digits != 3)
        {
            byte = byte * 10 + unsigned(str[pos] - '0');
            ++pos;
            ++digits;
        }
        if (digits == 0 || byte > 255)
        {
            return std::nullopt;
        }

        result = (result << 8) | byte;
        ++byte_count;

        if (byte_count != 4)
        {
            if (pos >= str.size() || str[pos] != '.')
            {
                return std::nullopt;
            }
            ++pos;
        }
    }

    if (pos != str.size())
    {
        return std::nullopt;
    }
    return result;
}

std::string to_string(IPv4Address address)
{
    std::ostringstream ss;
    for (int i = 0; i != 4; ++i)
    {
        ss << ((address & 0xff000000) >> 24);
        if (i == 3)
        {
            break;
        }
        ss << '.';
        address <<= 8;
    }
    return ss.str();
}

std::string to_string(const Endpoint &endpoint)
{
    return to_string(endpoint.address) + ':' + std::to_string(endpoint.port);
}

std::optional<Endpoint> to_endpoint(const std::string &str, unsigned short default_port)
{
    Endpoint endpoint;
    endpoint.port = default_port;

    auto colon = str.find(':');
    auto addr  = to_ipv4_address(str.substr(0, colon));
    if (!addr)
    {
        return std::nullopt;
    }
    endpoint.address = *addr;

    if (colon != std::string::npos)
    {
        auto port_str = str.substr(colon + 1);
        if (port_str.empty() || port_str.size() > 5)
        {
            return std::nullopt;
        }
        unsigned long port = 0;
        for (char c : port_str)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                return std::nullopt;
            }
            port = port * 10 + unsigned(c - '0');
        }
        if (port == 0 || port > 65535)
        {
            return std::nullopt;
        }
        endpoint.port = static_cast<unsigned short>(port);
    }

    return endpoint;
}
}  // namespace lanshare::network::conversion
