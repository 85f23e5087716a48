#include "bucketsync/s3_signing.hpp"

#include <cctype>
#include <ctime>
#include <sstream>
#include <stdexcept>

#include "bucketsync/crypto.hpp"

namespace bucketsync::s3
{

    namespace
    {
        constexpr auto kAlgorithm = "AWS4-HMAC-SHA256";
        constexpr auto kService = "s3";

        std::string trim(const std::string &value)
        {
            const auto first = value.find_first_not_of(" \t");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t");
            return value.substr(first, last - first + 1);
        }

        std::string signed_headers(const std::map<std::string, std::string> &headers)
        {
            std::string result;
            for (const auto &[name, value] : headers)
            {
                if (!result.empty())
                {
                    result += ';';
                }
                result += name;
            }
            return result;
        }

    } // namespace

    std::string uri_encode(std::string_view input, bool encode_slash)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(input.size());
        for (const char ch : input)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (std::isalnum(byte) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || (ch == '/' && !encode_slash))
            {
                out += ch;
            }
            else
            {
                out += '%';
                out += kHexDigits[(byte >> 4) & 0x0F];
                out += kHexDigits[byte & 0x0F];
            }
        }
        return out;
    }

    std::string canonical_query(const std::map<std::string, std::string> &query)
    {
        std::string result;
        for (const auto &[name, value] : query)
        {
            if (!result.empty())
            {
                result += '&';
            }
            result += uri_encode(name, true);
            result += '=';
            result += uri_encode(value, true);
        }
        return result;
    }

    std::string amz_timestamp(std::chrono::system_clock::time_point time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm utc{};
        if (gmtime_r(&seconds, &utc) == nullptr)
        {
            throw std::runtime_error("gmtime_r failed");
        }
        char buffer[17];
        std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
        return buffer;
    }

    std::string canonical_request(const SignableRequest &request)
    {
        std::ostringstream out;
        out << request.method << '\n'
            << request.canonical_uri << '\n'
            << canonical_query(request.query) << '\n';
        for (const auto &[name, value] : request.headers)
        {
            out << name << ':' << trim(value) << '\n';
        }
        out << '\n'
            << signed_headers(request.headers) << '\n'
            << request.payload_hash;
        return out.str();
    }

    std::string authorization_header(const Credentials &credentials, const SignableRequest &request)
    {
        const auto date_it = request.headers.find("x-amz-date");
        if (date_it == request.headers.end() || date_it->second.size() < 8)
        {
            throw std::invalid_argument("x-amz-date header is required for signing");
        }
        const auto &amz_date = date_it->second;
        const auto date_stamp = amz_date.substr(0, 8);
        const auto scope = date_stamp + "/" + credentials.region + "/" + kService + "/aws4_request";

        std::ostringstream string_to_sign;
        string_to_sign << kAlgorithm << '\n'
                       << amz_date << '\n'
                       << scope << '\n'
                       << crypto::sha256_hex(canonical_request(request));

        const auto date_key = crypto::hmac_sha256("AWS4" + credentials.secret_access_key, date_stamp);
        const auto region_key = crypto::hmac_sha256(date_key, credentials.region);
        const auto service_key = crypto::hmac_sha256(region_key, kService);
        const auto signing_key = crypto::hmac_sha256(service_key, "aws4_request");
        const auto signature = crypto::hmac_sha256_hex(signing_key, string_to_sign.str());

        std::ostringstream header;
        header << kAlgorithm << " Credential=" << credentials.access_key_id << '/' << scope
               << ",SignedHeaders=" << signed_headers(request.headers)
               << ",Signature=" << signature;
        return header.str();
    }

} // namespace bucketsync::s3
