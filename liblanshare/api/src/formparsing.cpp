#include "formparsing.hpp"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>

namespace lanshare
{
namespace
{
constexpr char const *crlf      = "\r\n";
constexpr char const *crlf_crlf = "\r\n\r\n";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

std::string to_lower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return char(std::tolower(c)); });
    return str;
}

std::string trim(const std::string &str)
{
    auto b = str.find_first_not_of(" \t");
    if (b == std::string::npos)
    {
        return {};
    }
    auto e = str.find_last_not_of(" \t");
    return str.substr(b, e - b + 1);
}

/// Value of a `key=value` or `key="value"` parameter inside a header value. Quoted values may
/// contain `;` and backslash escapes.
std::string header_parameter(const std::string &header_value, const std::string &key)
{
    size_t pos = header_value.find(';');
    while (pos != std::string::npos && pos < header_value.size())
    {
        ++pos;

        auto name_end = header_value.find_first_of("=;", pos);
        auto name     = to_lower(trim(header_value.substr(pos,
            name_end == std::string::npos ? name_end : name_end - pos)));
        if (name_end == std::string::npos)
        {
            break;
        }
        pos = name_end;
        if (header_value[pos] == ';')
        {
            continue;
        }

        ++pos;
        while (pos < header_value.size() && (header_value[pos] == ' ' || header_value[pos] == '\t'))
        {
            ++pos;
        }

        std::string value;
        if (pos < header_value.size() && header_value[pos] == '"')
        {
            for (++pos; pos < header_value.size() && header_value[pos] != '"'; ++pos)
            {
                if (header_value[pos] == '\\' && pos + 1 < header_value.size())
                {
                    ++pos;
                }
                value.push_back(header_value[pos]);
            }
            pos = header_value.find(';', pos);
        }
        else
        {
            auto value_end = header_value.find(';', pos);
            value          = trim(header_value.substr(pos,
                value_end == std::string::npos ? value_end : value_end - pos));
            pos            = value_end;
        }

        if (name == key)
        {
            return value;
        }
    }
    return {};
}

using ByteIt = std::vector<uint8_t>::const_iterator;

ByteIt find_bytes(ByteIt begin, ByteIt end, const std::string &needle)
{
    return std::search(begin, end, needle.cbegin(), needle.cend(),
        [](uint8_t a, char b) { return a == static_cast<uint8_t>(b); });
}

bool starts_with(ByteIt begin, ByteIt end, const std::string &prefix)
{
    return size_t(std::distance(begin, end)) >= prefix.size() &&
           std::equal(prefix.cbegin(), prefix.cend(), begin,
               [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; });
}
}  // namespace

std::string url_decode(const std::string &str)
{
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i)
    {
        if (str[i] == '+')
        {
            result.push_back(' ');
        }
        else if (str[i] == '%' && i + 2 < str.size() && hex_value(str[i + 1]) >= 0 &&
                 hex_value(str[i + 2]) >= 0)
        {
            result.push_back(char(hex_value(str[i + 1]) * 16 + hex_value(str[i + 2])));
            i += 2;
        }
        else
        {
            result.push_back(str[i]);
        }
    }

    return result;
}

void split_target(
    const std::string &target, std::string &path, std::map<std::string, std::string> &query)
{
    auto q = target.find('?');
    path   = target.substr(0, q);
    query.clear();
    if (q == std::string::npos)
    {
        return;
    }

    size_t pos = q + 1;
    while (pos <= target.size())
    {
        auto amp  = target.find('&', pos);
        auto pair = target.substr(pos, amp == std::string::npos ? amp : amp - pos);
        if (!pair.empty())
        {
            auto eq = pair.find('=');
            query[url_decode(pair.substr(0, eq))] =
                eq == std::string::npos ? std::string {} : url_decode(pair.substr(eq + 1));
        }
        if (amp == std::string::npos)
        {
            break;
        }
        pos = amp + 1;
    }
}

bool parse_multipart_form(const std::string &content_type, const std::vector<uint8_t> &body,
    std::vector<FormPart> &parts)
{
    if (to_lower(content_type).rfind("multipart/form-data", 0) != 0)
    {
        return false;
    }

    auto boundary = header_parameter(content_type, "boundary");
    if (boundary.empty())
    {
        LOG(WARNING) << "multipart/form-data without boundary";
        return false;
    }

    const std::string delimiter      = "--" + boundary;
    const std::string next_delimiter = crlf + delimiter;

    auto it = find_bytes(body.cbegin(), body.cend(), delimiter);
    if (it == body.cend())
    {
        LOG(WARNING) << "Multipart body does not contain its boundary";
        return false;
    }
    it += delimiter.size();

    for (;;)
    {
        if (starts_with(it, body.cend(), "--"))
        {
            return true;
        }
        if (!starts_with(it, body.cend(), crlf))
        {
            LOG(WARNING) << "Malformed multipart delimiter line";
            return false;
        }
        it += 2;

        auto headers_end = find_bytes(it, body.cend(), crlf_crlf);
        if (headers_end == body.cend())
        {
            LOG(WARNING) << "Multipart part without header terminator";
            return false;
        }

        FormPart part;
        std::string headers {it, headers_end};
        size_t      line_begin = 0;
        while (line_begin < headers.size())
        {
            auto line_end = headers.find(crlf, line_begin);
            auto line     = headers.substr(line_begin,
                line_end == std::string::npos ? line_end : line_end - line_begin);
            auto colon    = line.find(':');
            if (colon != std::string::npos)
            {
                auto name  = to_lower(trim(line.substr(0, colon)));
                auto value = trim(line.substr(colon + 1));
                if (name == "content-disposition")
                {
                    part.name      = header_parameter(value, "name");
                    part.file_name = header_parameter(value, "filename");
                }
                else if (name == "content-type")
                {
                    part.content_type = value;
                }
            }
            if (line_end == std::string::npos)
            {
                break;
            }
            line_begin = line_end + 2;
        }

        auto data_begin = headers_end + 4;
        auto data_end   = find_bytes(data_begin, body.cend(), next_delimiter);
        if (data_end == body.cend())
        {
            LOG(WARNING) << "Multipart part " << part.name << " is not terminated";
            return false;
        }

        part.data.assign(data_begin, data_end);
        parts.push_back(std::move(part));
        it = data_end + next_delimiter.size();
    }
}
}  // namespace lanshare
