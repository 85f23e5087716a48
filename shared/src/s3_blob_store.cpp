#include "bucketsync/s3_blob_store.hpp"

#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <regex>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "bucketsync/crypto.hpp"
#include "bucketsync/error_codes.hpp"

namespace bucketsync
{

    namespace
    {

        void ensure_curl_global_init()
        {
            static std::once_flag once;
            std::call_once(once, []
                           { curl_global_init(CURL_GLOBAL_DEFAULT); });
        }

        struct CurlDeleter
        {
            void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
        };
        using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

        // Owns the strings a curl_slist points into.
        struct HeaderList
        {
            std::vector<std::string> store;
            curl_slist *list = nullptr;

            HeaderList() = default;
            HeaderList(const HeaderList &) = delete;
            HeaderList &operator=(const HeaderList &) = delete;
            ~HeaderList()
            {
                if (list)
                {
                    curl_slist_free_all(list);
                }
            }

            void add(const std::string &header)
            {
                store.push_back(header);
                list = curl_slist_append(list, store.back().c_str());
            }
        };

        struct TransferContext
        {
            std::ifstream *in = nullptr;
            std::ofstream *out = nullptr;
            std::string *body = nullptr;
            const ProgressCallback *progress = nullptr;
            bool upload = false;
        };

        std::size_t write_to_string(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            context->body->append(ptr, size * nmemb);
            return size * nmemb;
        }

        std::size_t write_to_file(char *ptr, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            context->out->write(ptr, static_cast<std::streamsize>(size * nmemb));
            return *context->out ? size * nmemb : 0;
        }

        std::size_t read_from_file(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            context->in->read(buffer, static_cast<std::streamsize>(size * nitems));
            if (context->in->bad())
            {
                return CURL_READFUNC_ABORT;
            }
            return static_cast<std::size_t>(context->in->gcount());
        }

        int report_progress(void *userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
        {
            auto *context = static_cast<TransferContext *>(userdata);
            if (context->progress && *context->progress)
            {
                if (context->upload)
                {
                    (*context->progress)(static_cast<std::uint64_t>(ulnow), static_cast<std::uint64_t>(ultotal));
                }
                else
                {
                    (*context->progress)(static_cast<std::uint64_t>(dlnow), static_cast<std::uint64_t>(dltotal));
                }
            }
            return 0;
        }

        std::string host_from_endpoint(const std::string &endpoint)
        {
            auto start = endpoint.find("://");
            start = start == std::string::npos ? 0 : start + 3;
            const auto end = endpoint.find('/', start);
            auto host = endpoint.substr(start, end == std::string::npos ? std::string::npos : end - start);
            if (host.empty())
            {
                throw ConfigError("S3 endpoint '" + endpoint + "' has no host");
            }
            return host;
        }

        std::string trim_trailing_slash(std::string value)
        {
            while (!value.empty() && value.back() == '/')
            {
                value.pop_back();
            }
            return value;
        }

        std::string xml_unescape(const std::string &text)
        {
            static const std::pair<std::string_view, char> kEntities[] = {
                {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};
            std::string out;
            out.reserve(text.size());
            for (std::size_t i = 0; i < text.size();)
            {
                bool matched = false;
                if (text[i] == '&')
                {
                    for (const auto &[entity, ch] : kEntities)
                    {
                        if (text.compare(i, entity.size(), entity) == 0)
                        {
                            out += ch;
                            i += entity.size();
                            matched = true;
                            break;
                        }
                    }
                }
                if (!matched)
                {
                    out += text[i++];
                }
            }
            return out;
        }

        std::string extract_error_code(const std::string &body)
        {
            static const std::regex kCode("<Code>([^<]+)</Code>");
            std::smatch match;
            if (std::regex_search(body, match, kCode))
            {
                return match[1].str();
            }
            return {};
        }

        [[noreturn]] void throw_for_status(long status, const std::string &body, const std::string &what)
        {
            const auto remote_code = extract_error_code(body);
            const auto detail = what + " failed with HTTP " + std::to_string(status) +
                                (remote_code.empty() ? std::string{} : " (" + remote_code + ")");
            if (status == 404)
            {
                throw TransferError(ErrorCode::NotFound, detail);
            }
            if (status == 401 || remote_code == "SignatureDoesNotMatch" || remote_code == "InvalidAccessKeyId")
            {
                throw TransferError(ErrorCode::AuthenticationFailed, detail);
            }
            if (status == 403)
            {
                throw TransferError(ErrorCode::PermissionDenied, detail);
            }
            throw TransferError(ErrorCode::RemoteError, detail);
        }

        long perform(CURL *handle, const std::string &what)
        {
            const auto result = curl_easy_perform(handle);
            if (result == CURLE_OPERATION_TIMEDOUT)
            {
                throw TransferError(ErrorCode::Timeout, what + " timed out");
            }
            if (result != CURLE_OK)
            {
                throw TransferError(ErrorCode::Network, what + " failed: " + curl_easy_strerror(result));
            }
            long status = 0;
            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
            return status;
        }

    } // namespace

    S3BlobStore::S3BlobStore(S3Options options)
        : options_(std::move(options))
    {
        options_.endpoint = trim_trailing_slash(options_.endpoint);
        host_ = host_from_endpoint(options_.endpoint);
        if (options_.credentials.access_key_id.empty() || options_.credentials.secret_access_key.empty())
        {
            throw ConfigError("S3 credentials are missing");
        }
        ensure_curl_global_init();
        crypto::ensure_sodium_init();
    }

    void S3BlobStore::upload(const std::filesystem::path &local_path, const std::string &bucket,
                             const std::string &key, const ProgressCallback &progress)
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::FileIo, "Cannot stat " + local_path.string() + ": " + ec.message());
        }
        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open())
        {
            throw TransferError(ErrorCode::FileIo, "Cannot open " + local_path.string());
        }
        const auto payload_hash = crypto::sha256_stream(in);
        in.clear();
        in.seekg(0);

        const auto canonical_uri = "/" + s3::uri_encode(bucket, true) + "/" + s3::uri_encode(key, false);
        const auto url = options_.endpoint + canonical_uri;

        HeaderList headers;
        for (const auto &[name, value] : signed_headers("PUT", canonical_uri, {}, payload_hash))
        {
            headers.add(name + ": " + value);
        }
        headers.add("Content-Type: application/octet-stream");
        headers.add("Expect:");

        CurlHandle handle(curl_easy_init());
        if (!handle)
        {
            throw TransferError(ErrorCode::InternalError, "curl_easy_init failed");
        }

        std::string body;
        TransferContext context{.in = &in, .out = nullptr, .body = &body, .progress = &progress, .upload = true};
        curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        curl_easy_setopt(handle.get(), CURLOPT_READFUNCTION, read_from_file);
        curl_easy_setopt(handle.get(), CURLOPT_READDATA, &context);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_to_string);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.list);
        curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, report_progress);
        curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &context);
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.transfer_timeout.count()));

        const auto status = perform(handle.get(), "PUT " + bucket + "/" + key);
        if (status < 200 || status >= 300)
        {
            throw_for_status(status, body, "PUT " + bucket + "/" + key);
        }
        spdlog::debug("PUT {}/{} ({} bytes) -> HTTP {}", bucket, key, size, status);
    }

    void S3BlobStore::download(const std::string &bucket, const std::string &key,
                               const std::filesystem::path &local_path, const ProgressCallback &progress)
    {
        const auto canonical_uri = "/" + s3::uri_encode(bucket, true) + "/" + s3::uri_encode(key, false);
        const auto url = options_.endpoint + canonical_uri;

        HeaderList headers;
        for (const auto &[name, value] : signed_headers("GET", canonical_uri, {}, std::string(s3::kUnsignedPayload)))
        {
            headers.add(name + ": " + value);
        }

        std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw TransferError(ErrorCode::FileIo, "Cannot write " + local_path.string());
        }

        CurlHandle handle(curl_easy_init());
        if (!handle)
        {
            throw TransferError(ErrorCode::InternalError, "curl_easy_init failed");
        }

        TransferContext context{.in = nullptr, .out = &out, .body = nullptr, .progress = &progress, .upload = false};
        curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_FAILONERROR, 0L);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_to_file);
        curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &context);
        curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.list);
        curl_easy_setopt(handle.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle.get(), CURLOPT_XFERINFOFUNCTION, report_progress);
        curl_easy_setopt(handle.get(), CURLOPT_XFERINFODATA, &context);
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.transfer_timeout.count()));

        long status = 0;
        try
        {
            status = perform(handle.get(), "GET " + bucket + "/" + key);
        }
        catch (const TransferError &)
        {
            out.close();
            std::error_code ec;
            std::filesystem::remove(local_path, ec);
            throw;
        }
        out.close();

        if (status < 200 || status >= 300)
        {
            // The error document went to the file; read it back for the error code.
            std::ifstream failed(local_path, std::ios::binary);
            const std::string error_body((std::istreambuf_iterator<char>(failed)), std::istreambuf_iterator<char>());
            failed.close();
            std::error_code ec;
            std::filesystem::remove(local_path, ec);
            throw_for_status(status, error_body, "GET " + bucket + "/" + key);
        }
        if (!out)
        {
            std::error_code ec;
            std::filesystem::remove(local_path, ec);
            throw TransferError(ErrorCode::FileIo, "Failed writing " + local_path.string());
        }
        spdlog::debug("GET {}/{} -> HTTP {}", bucket, key, status);
    }

    std::vector<std::string> S3BlobStore::list_keys(const std::string &bucket)
    {
        std::vector<std::string> keys;
        std::string continuation;
        const auto canonical_uri = "/" + s3::uri_encode(bucket, true);

        do
        {
            std::map<std::string, std::string> query{{"list-type", "2"}};
            if (!continuation.empty())
            {
                query.emplace("continuation-token", continuation);
            }
            const auto url = options_.endpoint + canonical_uri + "?" + s3::canonical_query(query);

            HeaderList headers;
            for (const auto &[name, value] : signed_headers("GET", canonical_uri, query, std::string(s3::kUnsignedPayload)))
            {
                headers.add(name + ": " + value);
            }

            CurlHandle handle(curl_easy_init());
            if (!handle)
            {
                throw TransferError(ErrorCode::InternalError, "curl_easy_init failed");
            }

            std::string body;
            TransferContext context{.in = nullptr, .out = nullptr, .body = &body, .progress = nullptr, .upload = false};
            curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
            curl_easy_setopt(handle.get(), CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_to_string);
            curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &context);
            curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.list);
            curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.transfer_timeout.count()));

            const auto status = perform(handle.get(), "LIST " + bucket);
            if (status < 200 || status >= 300)
            {
                throw_for_status(status, body, "LIST " + bucket);
            }

            auto page = parse_list_page(body, continuation);
            keys.insert(keys.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));
        } while (!continuation.empty());

        return keys;
    }

    std::vector<std::string> S3BlobStore::parse_list_page(const std::string &xml, std::string &next_token)
    {
        static const std::regex kKey("<Key>([^<]*)</Key>");
        static const std::regex kTruncated("<IsTruncated>true</IsTruncated>");
        static const std::regex kToken("<NextContinuationToken>([^<]+)</NextContinuationToken>");

        std::vector<std::string> keys;
        for (std::sregex_iterator it(xml.begin(), xml.end(), kKey), end; it != end; ++it)
        {
            keys.push_back(xml_unescape((*it)[1].str()));
        }

        next_token.clear();
        std::smatch match;
        if (std::regex_search(xml, kTruncated) && std::regex_search(xml, match, kToken))
        {
            next_token = xml_unescape(match[1].str());
        }
        return keys;
    }

    std::map<std::string, std::string> S3BlobStore::signed_headers(const std::string &method,
                                                                   const std::string &canonical_uri,
                                                                   const std::map<std::string, std::string> &query,
                                                                   const std::string &payload_hash) const
    {
        s3::SignableRequest request{
            .method = method,
            .canonical_uri = canonical_uri,
            .query = query,
            .headers = {{"host", host_},
                        {"x-amz-content-sha256", payload_hash},
                        {"x-amz-date", s3::amz_timestamp(std::chrono::system_clock::now())}},
            .payload_hash = payload_hash,
        };
        auto headers = request.headers;
        headers.emplace("authorization", s3::authorization_header(options_.credentials, request));
        return headers;
    }

} // namespace bucketsync
