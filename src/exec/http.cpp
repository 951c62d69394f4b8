#include "codejudge/exec/http.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <memory>
#include <mutex>
#include "codejudge/common/exceptions.hpp"

namespace codejudge {
using namespace std;

bool http_response::ok() const {
    return status >= 200 && status < 300;
}

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static int check_cancelled(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto *token = static_cast<const cancellation_token *>(clientp);
    return token && token->is_cancelled() ? 1 : 0;
}

http_response http_request(const string &method, const string &url,
                           const optional<string> &json_body, int timeout_ms,
                           const cancellation_token *token) {
    static once_flag curl_once;
    call_once(curl_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw network_error("Unable to initialize libcurl");

    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));
    if (json_body)
        headers.reset(curl_slist_append(headers.release(), "Content-Type: application/json"));

    http_response response;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, (long)timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, check_cancelled);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, token);
    if (json_body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long)json_body->size());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_ABORTED_BY_CALLBACK)
        throw cancelled_error();
    if (res != CURLE_OK)
        throw network_error(fmt::format("{} {} failed: {}", method, url,
                                        error_buffer[0] ? error_buffer : curl_easy_strerror(res)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace codejudge
