// http-fetcher.cpp - libcurl Remote Audio Fetcher Implementation

// stl includes
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

// lib includes
#include <boost/lexical_cast.hpp>
#include <curl/curl.h>

// local includes
#include "whisperserve/audio.hpp"
#include "whisperserve/utils.hpp"


namespace whisperserve {

namespace {

std::once_flag curl_init_flag;

// state shared with the libcurl callbacks of one transfer
struct Transfer {
    std::size_t max_bytes;
    std::string body;
    bool too_large = false;
};

// Checks each response header; returning a short count aborts the transfer
// before any body byte is delivered.
std::size_t header_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata) {
    const std::size_t total = size * nitems;
    auto *transfer = static_cast<Transfer *>(userdata);

    const std::string line = trim(std::string(buffer, total));
    const std::size_t colon = line.find(':');
    if (colon == std::string::npos) return total;

    if (to_lower(trim(line.substr(0, colon))) == "content-length") {
        try {
            const auto declared = boost::lexical_cast<unsigned long long>(trim(line.substr(colon + 1)));
            if (declared > transfer->max_bytes) {
                transfer->too_large = true;
                return 0;
            }
        } catch (const boost::bad_lexical_cast &) {
            // unparseable length, the body bound below still applies
        }
    }
    return total;
}

std::size_t write_callback(char *contents, std::size_t size, std::size_t nmemb, void *userdata) {
    const std::size_t total = size * nmemb;
    auto *transfer = static_cast<Transfer *>(userdata);

    if (transfer->body.size() + total > transfer->max_bytes) {
        transfer->too_large = true;
        return 0;
    }
    transfer->body.append(contents, total);
    return total;
}

using curl_handle_t = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

} // namespace


CurlFetcher::CurlFetcher() {
    std::call_once(curl_init_flag, []() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw FetchError(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
        }
    });
}

std::string CurlFetcher::fetch(const std::string &uri,
                               const std::size_t &max_bytes,
                               const long &timeout_sec) {
    curl_handle_t curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        throw FetchError("curl_easy_init failed");
    }

    Transfer transfer;
    transfer.max_bytes = max_bytes;

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    curl_easy_setopt(curl.get(), CURLOPT_URL, uri.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);

    const CURLcode code = curl_easy_perform(curl.get());

    if (transfer.too_large) {
        throw RemoteTooLargeError("remote body exceeds " + std::to_string(max_bytes) + " bytes");
    }
    if (code != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(code);
        throw FetchError(detail);
    }

    return std::move(transfer.body);
}

} // namespace whisperserve
