#include "Viewer/PreviewFetcher.hpp"
#include "stringUtils.hpp"
#include <curl/curl.h>
#include <plog/Log.h>

namespace CadPreview {

bool CurlPreviewFetcher::curlInitialized_ = false;

namespace {

struct TransferState {
    FetchResponse* response = nullptr;
    size_t maxBytes = 0;
    const PreviewFetcher::CancelCheck* isCancelled = nullptr;
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp){
    size_t realsize = size * nmemb;
    auto* st = reinterpret_cast<TransferState*>(userp);
    if(st->maxBytes > 0 && st->response->body.size() + realsize > st->maxBytes){
        st->response->exceededLimit = true;
        return 0; // aborts the transfer
    }
    const uint8_t* p = reinterpret_cast<const uint8_t*>(contents);
    st->response->body.insert(st->response->body.end(), p, p + realsize);
    return realsize;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userp){
    size_t realsize = size * nitems;
    auto* st = reinterpret_cast<TransferState*>(userp);
    std::string line(buffer, realsize);
    // a new status line after a redirect starts a fresh header block
    if(startsWith(line, "HTTP/")){ st->response->headers.clear(); return realsize; }
    auto colon = line.find(':');
    if(colon == std::string::npos) return realsize;
    std::string name = toLowerCopy(trimCopy(line.substr(0, colon)));
    std::string value = trimCopy(line.substr(colon + 1));
    if(!name.empty()) st->response->headers[name] = value;
    return realsize;
}

int progressCallback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t){
    auto* st = reinterpret_cast<TransferState*>(userp);
    if(st->isCancelled && *st->isCancelled && (*st->isCancelled)()){
        st->response->cancelled = true;
        return 1;
    }
    return 0;
}

} // namespace

CurlPreviewFetcher::CurlPreviewFetcher(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds){
    if(!curlInitialized_){
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curlInitialized_ = true;
    }
}

FetchResponse CurlPreviewFetcher::fetch(const std::string& url, size_t maxBytes, const CancelCheck& isCancelled){
    FetchResponse resp;
    CURL* curl = curl_easy_init();
    if(!curl){ resp.transportError = "curl_easy_init failed"; return resp; }

    TransferState st;
    st.response = &resp;
    st.maxBytes = maxBytes;
    st.isCancelled = &isCancelled;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &st);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &st);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);

    struct curl_slist* headers = nullptr;
    for(const auto& h : defaultHeaders_){ headers = curl_slist_append(headers, h.c_str()); }
    if(headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.status);
    if(res != CURLE_OK && !resp.exceededLimit && !resp.cancelled){
        resp.transportError = curl_easy_strerror(res);
        PLOGW << "CurlPreviewFetcher: GET failed: " << resp.transportError;
    }
    if(resp.exceededLimit) PLOGW << "CurlPreviewFetcher: body exceeded " << maxBytes << " bytes, transfer stopped";

    if(headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return resp;
}

std::string parseFilenameFromContentDisposition(const std::string& header){
    if(header.empty()) return std::string();
    std::string plain;
    std::string extended;
    size_t pos = 0;
    while(pos < header.size()){
        size_t semi = header.find(';', pos);
        // quoted values may contain ';'
        size_t quote = header.find('"', pos);
        if(quote != std::string::npos && semi != std::string::npos && quote < semi){
            size_t close = header.find('"', quote + 1);
            semi = close == std::string::npos ? std::string::npos : header.find(';', close);
        }
        std::string part = trimCopy(header.substr(pos, semi == std::string::npos ? std::string::npos : semi - pos));
        pos = semi == std::string::npos ? header.size() : semi + 1;

        auto eq = part.find('=');
        if(eq == std::string::npos) continue;
        std::string key = toLowerCopy(trimCopy(part.substr(0, eq)));
        std::string value = trimCopy(part.substr(eq + 1));
        if(key == "filename*"){
            auto tick = value.find("''");
            if(tick != std::string::npos) value = value.substr(tick + 2);
            extended = urlDecode(value);
        } else if(key == "filename"){
            if(value.size() >= 2 && value.front() == '"' && value.back() == '"') value = value.substr(1, value.size() - 2);
            plain = value;
        }
    }
    return !extended.empty() ? extended : plain;
}

} // namespace CadPreview
