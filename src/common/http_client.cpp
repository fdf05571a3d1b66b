#include "common/http_client.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <memory>
#include <mutex>
#include "common/exceptions.hpp"

namespace codegrade {
using namespace std;

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static int check_cancelled(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    // non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return static_cast<const cancellation_token *>(clientp)->cancelled() ? 1 : 0;
}

curl_http_client::curl_http_client() {
    static once_flag curl_initialized;
    call_once(curl_initialized, [] {
        CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK)
            LOG(ERROR) << "Unable to initialize libcurl: " << curl_easy_strerror(res);
    });
}

http_response curl_http_client::perform(const http_request &request, const cancellation_token &cancel) {
    cancel.throw_if_cancelled();

    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) throw network_error("Unable to create curl handle");

    curl_slist *header_list = nullptr;
    for (auto &header : request.headers)
        header_list = curl_slist_append(header_list, header.c_str());
    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(header_list, curl_slist_free_all);

    http_response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, (long)request.timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, check_cancelled);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<cancellation_token *>(&cancel));
    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long)request.body.size());
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_ABORTED_BY_CALLBACK) throw execution_cancelled();
    if (res != CURLE_OK) {
        LOG(WARNING) << request.method << " " << request.url << " failed: " << curl_easy_strerror(res);
        throw network_error(fmt::format("{} {}: {}", request.method, request.url, curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    DLOG(INFO) << request.method << " " << request.url << " -> " << response.status;
    return response;
}

}  // namespace codegrade
