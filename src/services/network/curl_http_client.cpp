#include "lcu_companion/services/network/http_client.hpp"
#include "lcu_companion/utils/logger.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace lcu_companion {
namespace services {

namespace {

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

void global_init_once() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t append_body(char* data, size_t size, size_t count, void* user) {
    static_cast<std::string*>(user)->append(data, size * count);
    return size * count;
}

// Keeps "name: value" lines with the name lowercased. A redirect or a 100
// Continue restarts the header block, so a status line clears what we have.
size_t collect_header(char* data, size_t size, size_t count, void* user) {
    auto& headers = *static_cast<HttpHeaders*>(user);
    const std::string_view line(data, size * count);

    if (line.starts_with("HTTP/")) {
        headers.clear();
        return line.size();
    }

    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return line.size();
    }

    std::string name(line.substr(0, colon));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto value = line.substr(colon + 1);
    const auto first = value.find_first_not_of(" \t");
    const auto last = value.find_last_not_of(" \t\r\n");
    headers[std::move(name)] = first == std::string_view::npos
        ? std::string()
        : std::string(value.substr(first, last - first + 1));
    return line.size();
}

NetworkError classify(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetworkError::ConnectionFailed;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
            return NetworkError::TlsFailure;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return NetworkError::MalformedUrl;
        default:
            return NetworkError::Transfer;
    }
}

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config)
        : m_config(std::move(config)) {
        global_init_once();
    }

    HttpResult execute(const HttpRequest& request) override {
        // One easy handle per call keeps concurrent callers independent
        EasyHandle curl(curl_easy_init());
        if (!curl) {
            LCU_LOG_ERROR("Http", "curl_easy_init failed");
            return std::unexpected(NetworkError::Transfer);
        }

        HttpResponse response;
        HeaderList headers = build_headers(request);
        configure(curl.get(), request, headers.get(), response);

        const auto started = std::chrono::steady_clock::now();
        const CURLcode code = curl_easy_perform(curl.get());
        response.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (code != CURLE_OK) {
            LCU_LOG_DEBUG("Http", to_string(request.method) + " " + request.url + ": " +
                          curl_easy_strerror(code));
            return std::unexpected(classify(code));
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        LCU_LOG_DEBUG("Http", to_string(request.method) + " " + request.url + " -> " +
                      std::to_string(response.status) + " in " +
                      std::to_string(response.elapsed.count()) + "ms");
        return response;
    }

private:
    HeaderList build_headers(const HttpRequest& request) const {
        curl_slist* list = nullptr;
        for (const auto& [name, value] : request.headers) {
            list = curl_slist_append(list, (name + ": " + value).c_str());
        }
        // Suppress curl's automatic "Expect: 100-continue" on POST bodies
        list = curl_slist_append(list, "Expect:");
        return HeaderList(list);
    }

    void configure(CURL* curl, const HttpRequest& request, curl_slist* headers,
                   HttpResponse& response) const {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, m_config.user_agent.c_str());

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collect_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
            case HttpMethod::PATCH:
            case HttpMethod::DELETE_:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, to_string(request.method).c_str());
                break;
        }
        if (request.method != HttpMethod::GET) {
            // The body outlives the transfer, so curl may reference it directly
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        if (request.basic_auth) {
            curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(curl, CURLOPT_USERPWD, request.basic_auth->c_str());
        }

        const auto timeout = request.timeout.count() > 0 ? request.timeout : m_config.default_timeout;
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(m_config.connect_timeout.count()));

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

        const long verify = request.verify_tls ? 1L : 0L;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify * 2L);
    }

    HttpClientConfig m_config;
};

} // namespace

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace lcu_companion
