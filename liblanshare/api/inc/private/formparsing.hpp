#ifndef LANSHARE_API_FORMPARSING_HPP_
#define LANSHARE_API_FORMPARSING_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace lanshare
{
struct FormPart
{
    std::string          name;
    std::string          file_name;
    std::string          content_type;
    std::vector<uint8_t> data;
};

/// Decodes %XX escapes and '+'. Malformed escapes are kept verbatim.
std::string url_decode(const std::string &str);

/// Splits a request target into its path and decoded query parameters.
void split_target(
    const std::string &target, std::string &path, std::map<std::string, std::string> &query);

/// Parses a multipart/form-data body. content_type is the complete Content-Type header, which
/// carries the boundary.
bool parse_multipart_form(const std::string &content_type, const std::vector<uint8_t> &body,
    std::vector<FormPart> &parts);
}  // namespace lanshare

#endif  // LANSHARE_API_FORMPARSING_HPP_
