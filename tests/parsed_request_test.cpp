#include <gtest/gtest.h>

#include "ssdp/message/parsed_request.hpp"
#include "ssdp/message/raw_message.hpp"
#include "ssdp/message/ssdp_error.hpp"

#include <string>

using ssdp::Headers;
using ssdp::ParsedRequest;
namespace error = ssdp::error;

namespace
{

const boost::asio::ip::udp::endpoint sender(boost::asio::ip::make_address("192.168.1.20"), 50000);

const std::string search_request = "M-SEARCH * HTTP/1.1\r\n"
                                   "HOST: 239.255.255.250:1900\r\n"
                                   "MAN: \"ssdp:discover\"\r\n"
                                   "ST: ssdp:all\r\n"
                                   "\r\n";

std::optional<ParsedRequest> parse(const std::string& data, boost::system::error_code& error_code)
{
    return ParsedRequest::parse(sender, data, error_code);
}

} // namespace

TEST(ParsedRequest, ParsesSearchRequest)
{
    boost::system::error_code error_code;
    auto request = parse(search_request, error_code);

    ASSERT_TRUE(request) << error_code.message();
    EXPECT_FALSE(error_code);
    EXPECT_EQ(request->remote_endpoint, sender);
    EXPECT_EQ(request->method, "M-SEARCH");
    EXPECT_EQ(request->path, "*");
    EXPECT_EQ(request->version_minor, 1);
    const Headers expected {{"HOST", "239.255.255.250:1900"}, {"MAN", "\"ssdp:discover\""}, {"ST", "ssdp:all"}};
    EXPECT_EQ(request->headers, expected);
    EXPECT_EQ(request->body, "");
}

TEST(ParsedRequest, KeepsHeaderOrderCasingAndDuplicates)
{
    boost::system::error_code error_code;
    auto request = parse("NOTIFY * HTTP/1.1\r\nnt: a\r\nNT: b\r\nUsn: c\r\nnt: a\r\n\r\n", error_code);

    ASSERT_TRUE(request);
    const Headers expected {{"nt", "a"}, {"NT", "b"}, {"Usn", "c"}, {"nt", "a"}};
    EXPECT_EQ(request->headers, expected);
}

TEST(ParsedRequest, BodyIsEverythingAfterHeaderBlock)
{
    boost::system::error_code error_code;
    auto request = parse("NOTIFY /path HTTP/1.0\r\nHOST: x\r\n\r\nline one\r\nline two", error_code);

    ASSERT_TRUE(request);
    EXPECT_EQ(request->path, "/path");
    EXPECT_EQ(request->version_minor, 0);
    EXPECT_EQ(request->body, "line one\r\nline two");
}

TEST(ParsedRequest, BodyInvalidUtf8IsReplaced)
{
    boost::system::error_code error_code;
    auto request = parse(std::string("NOTIFY * HTTP/1.1\r\n\r\nok\xFFok"), error_code);

    ASSERT_TRUE(request);
    EXPECT_EQ(request->body, "ok\xEF\xBF\xBDok");
}

TEST(ParsedRequest, HeaderValueInvalidUtf8IsReplaced)
{
    boost::system::error_code error_code;
    auto request = parse(std::string("NOTIFY * HTTP/1.1\r\nSERVER: caf\xC3\r\n\r\n"), error_code);

    ASSERT_TRUE(request);
    ASSERT_EQ(request->headers.size(), 1U);
    EXPECT_EQ(request->headers[0].second, "caf\xEF\xBF\xBD");
}

TEST(ParsedRequest, AcceptsBareLineFeedsAndTrimsValues)
{
    boost::system::error_code error_code;
    auto request = parse("\r\nM-SEARCH * HTTP/1.1\nST:   upnp:rootdevice \t\nEXT:\n\n", error_code);

    ASSERT_TRUE(request) << error_code.message();
    const Headers expected {{"ST", "upnp:rootdevice"}, {"EXT", ""}};
    EXPECT_EQ(request->headers, expected);
}

TEST(ParsedRequest, TruncatedBeforeBlankLineIsIncomplete)
{
    // Every strict prefix of a valid request ends before its header block does
    for (std::size_t length = 0; length < search_request.size(); ++length)
    {
        boost::system::error_code error_code;
        auto request = parse(search_request.substr(0, length), error_code);

        EXPECT_FALSE(request) << "length " << length;
        EXPECT_EQ(error_code, error::incomplete) << "length " << length;
        EXPECT_FALSE(error::is_parse_error(error_code));
    }
}

TEST(ParsedRequest, GrammarViolationsAreParseErrors)
{
    struct Case
    {
        std::string data;
        error::errc expected;
    };
    const Case cases[] = {
        {"M(SEARCH * HTTP/1.1\r\n\r\n", error::invalid_method},
        {" NOTIFY * HTTP/1.1\r\n\r\n", error::invalid_method},
        {"NOTIFY  HTTP/1.1\r\n\r\n", error::invalid_path},
        {"NOTIFY * HTTP/2.0\r\n\r\n", error::invalid_version},
        {"NOTIFY * HTTP/1.x\r\n\r\n", error::invalid_version},
        {"NOTIFY * HTTP/1.1 junk\r\n\r\n", error::invalid_version},
        {"NOTIFY * HTTP/1.1\r\nHOST : x\r\n\r\n", error::invalid_header_name},
        {"NOTIFY * HTTP/1.1\r\n: x\r\n\r\n", error::invalid_header_name},
        {"NOTIFY * HTTP/1.1\r\nNO COLON\r\n\r\n", error::invalid_header_name},
        {"NOTIFY * HTTP/1.1\r\n folded\r\n\r\n", error::invalid_header_name},
        {std::string("NOTIFY * HTTP/1.1\r\nX: a\x01z\r\n\r\n"), error::invalid_header_value},
        {"NOTIFY * HTTP/1.1\r\nX: a\rb\r\n\r\n", error::invalid_header_value},
    };

    for (const auto& test_case : cases)
    {
        boost::system::error_code error_code;
        auto request = parse(test_case.data, error_code);

        EXPECT_FALSE(request) << test_case.data;
        EXPECT_EQ(error_code, test_case.expected) << test_case.data;
        EXPECT_TRUE(error::is_parse_error(error_code)) << test_case.data;
    }
}

TEST(ParsedRequest, TooManyHeaders)
{
    std::string data = "NOTIFY * HTTP/1.1\r\n";
    for (std::size_t i = 0; i <= ParsedRequest::max_headers; ++i)
    {
        data += "X-" + std::to_string(i) + ": v\r\n";
    }
    data += "\r\n";

    boost::system::error_code error_code;
    EXPECT_FALSE(parse(data, error_code));
    EXPECT_EQ(error_code, error::too_many_headers);
}

TEST(ParsedRequest, HeaderContainsIsCaseInsensitiveOnNameOnly)
{
    boost::system::error_code error_code;
    auto request = parse(search_request, error_code);
    ASSERT_TRUE(request);

    EXPECT_TRUE(request->header_contains("man", "ssdp:discover"));
    EXPECT_TRUE(request->header_contains("Host", "255.250"));
    EXPECT_FALSE(request->header_contains("MAN", "SSDP:DISCOVER"));
    EXPECT_FALSE(request->header_contains("USN", ""));
}

TEST(ParsedRequest, HeaderMatchIsCaseInsensitiveExact)
{
    boost::system::error_code error_code;
    auto request = parse(search_request, error_code);
    ASSERT_TRUE(request);

    EXPECT_TRUE(request->header_match("st", "SSDP:ALL"));
    EXPECT_TRUE(request->header_match("ST", "ssdp:all"));
    EXPECT_FALSE(request->header_match("ST", "ssdp"));
    EXPECT_FALSE(request->header_match("NT", "ssdp:all"));
}

TEST(ParsedRequest, HeaderValueReturnsFirstMatch)
{
    boost::system::error_code error_code;
    auto request = parse("NOTIFY * HTTP/1.1\r\nnt: first\r\nNT: second\r\n\r\n", error_code);
    ASSERT_TRUE(request);

    EXPECT_EQ(request->header_value("Nt"), std::optional<std::string>("first"));
    EXPECT_FALSE(request->header_value("USN"));
}

TEST(RawMessage, ParseUsesSenderAndPayload)
{
    const ssdp::RawMessage message(sender, search_request);

    boost::system::error_code error_code;
    auto request = message.parse(error_code);

    ASSERT_TRUE(request);
    EXPECT_EQ(request->remote_endpoint, sender);
    EXPECT_EQ(message.data(), search_request);
}
