#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "formparsing.hpp"

using namespace ::testing;
using namespace ::lanshare;

namespace
{
std::vector<uint8_t> to_bytes(const std::string &str)
{
    return {str.cbegin(), str.cend()};
}
}  // namespace

TEST(FormParsingTest, UrlDecode)
{
    EXPECT_EQ(url_decode("a%20b+c"), "a b c");
    EXPECT_EQ(url_decode("%41%62"), "Ab");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");
    EXPECT_EQ(url_decode(""), "");
}

TEST(FormParsingTest, SplitTarget)
{
    std::string                        path;
    std::map<std::string, std::string> query;

    split_target("/api/send?target=192.168.1.20&filename=a%2Bb.txt&flag", path, query);
    EXPECT_EQ(path, "/api/send");
    EXPECT_EQ(query.size(), 3u);
    EXPECT_EQ(query["target"], "192.168.1.20");
    EXPECT_EQ(query["filename"], "a+b.txt");
    EXPECT_EQ(query["flag"], "");

    split_target("/api/peers", path, query);
    EXPECT_EQ(path, "/api/peers");
    EXPECT_TRUE(query.empty());

    split_target("/x?&&a=1&", path, query);
    EXPECT_EQ(path, "/x");
    EXPECT_EQ(query.size(), 1u);
}

TEST(FormParsingTest, Multipart_FieldsAndFile)
{
    const std::string body = "--AaB03x\r\n"
                             "Content-Disposition: form-data; name=\"targetIP\"\r\n"
                             "\r\n"
                             "192.168.1.20\r\n"
                             "--AaB03x\r\n"
                             "content-disposition: form-data; name=\"file\"; filename=\"a b.bin\"\r\n"
                             "Content-Type: application/octet-stream\r\n"
                             "\r\n"
                             "\x01\x02\r\n--not-the-boundary\r\n"
                             "--AaB03x--\r\n";

    std::vector<FormPart> parts;
    ASSERT_TRUE(parse_multipart_form("multipart/form-data; boundary=AaB03x", to_bytes(body), parts));
    ASSERT_EQ(parts.size(), 2u);

    EXPECT_EQ(parts[0].name, "targetIP");
    EXPECT_TRUE(parts[0].file_name.empty());
    EXPECT_EQ(parts[0].data, to_bytes("192.168.1.20"));

    EXPECT_EQ(parts[1].name, "file");
    EXPECT_EQ(parts[1].file_name, "a b.bin");
    EXPECT_EQ(parts[1].content_type, "application/octet-stream");
    EXPECT_EQ(parts[1].data, to_bytes("\x01\x02\r\n--not-the-boundary"));
}

TEST(FormParsingTest, Multipart_EmptyFile)
{
    const std::string body = "--B\r\n"
                             "Content-Disposition: form-data; name=\"file\"; filename=\"e\"\r\n"
                             "\r\n"
                             "\r\n"
                             "--B--";

    std::vector<FormPart> parts;
    ASSERT_TRUE(parse_multipart_form("Multipart/Form-Data; charset=utf-8; Boundary=\"B\"",
        to_bytes(body), parts));
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_TRUE(parts[0].data.empty());
}

TEST(FormParsingTest, Multipart_Rejected)
{
    std::vector<FormPart> parts;

    EXPECT_FALSE(parse_multipart_form("application/octet-stream", to_bytes("abc"), parts));
    EXPECT_FALSE(parse_multipart_form("multipart/form-data", to_bytes("abc"), parts));
    EXPECT_FALSE(parse_multipart_form("multipart/form-data; boundary=B", to_bytes("abc"), parts));

    // Part never terminated
    EXPECT_FALSE(parse_multipart_form("multipart/form-data; boundary=B",
        to_bytes("--B\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\nvalue"), parts));

    // Headers never terminated
    EXPECT_FALSE(parse_multipart_form("multipart/form-data; boundary=B",
        to_bytes("--B\r\nContent-Disposition: form-data; name=\"x\""), parts));
}

TEST(FormParsingTest, Multipart_QuotedParameters)
{
    const std::string body = "--B\r\n"
                             "Content-Disposition: form-data; filename=\"a;name=x.txt\"; name=\"file\"\r\n"
                             "\r\n"
                             "1\r\n"
                             "--B\r\n"
                             "Content-Disposition: form-data; name=\"file\"; filename=\"a;b.txt\"\r\n"
                             "\r\n"
                             "2\r\n"
                             "--B\r\n"
                             "Content-Disposition: form-data;name=file;filename=\"say \\\"hi\\\".txt\"\r\n"
                             "\r\n"
                             "3\r\n"
                             "--B--";

    std::vector<FormPart> parts;
    ASSERT_TRUE(parse_multipart_form("multipart/form-data; boundary=B", to_bytes(body), parts));
    ASSERT_EQ(parts.size(), 3u);

    EXPECT_EQ(parts[0].name, "file");
    EXPECT_EQ(parts[0].file_name, "a;name=x.txt");
    EXPECT_EQ(parts[0].data, to_bytes("1"));

    EXPECT_EQ(parts[1].name, "file");
    EXPECT_EQ(parts[1].file_name, "a;b.txt");
    EXPECT_EQ(parts[1].data, to_bytes("2"));

    EXPECT_EQ(parts[2].name, "file");
    EXPECT_EQ(parts[2].file_name, "say \"hi\".txt");
}
