/**
 * BucketSync - AWS Signature Version 4 helpers for the S3 blob store.
 */
#pragma once

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace bucketsync::s3
{

    struct Credentials
    {
        std::string access_key_id;
        std::string secret_access_key;
        std::string region{"us-east-1"};
    };

    struct SignableRequest
    {
        std::string method;
        std::string canonical_uri;                 // already URI-encoded path
        std::map<std::string, std::string> query;  // raw (unencoded) parameters
        std::map<std::string, std::string> headers; // lowercase names, must include host and x-amz-date
        std::string payload_hash;
    };

    inline constexpr std::string_view kUnsignedPayload = "UNSIGNED-PAYLOAD";

    // RFC 3986 encoding as S3 expects it; '/' is kept when encode_slash is false.
    std::string uri_encode(std::string_view input, bool encode_slash);

    std::string canonical_query(const std::map<std::string, std::string> &query);

    // "YYYYMMDDTHHMMSSZ" in UTC.
    std::string amz_timestamp(std::chrono::system_clock::time_point time);

    std::string canonical_request(const SignableRequest &request);

    // Value of the Authorization header for the request.
    std::string authorization_header(const Credentials &credentials, const SignableRequest &request);

} // namespace bucketsync::s3
