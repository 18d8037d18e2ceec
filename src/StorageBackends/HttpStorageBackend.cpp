#include "StorageBackends/HttpStorageBackend.hpp"
#include "stringUtils.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace CadPreview {

bool HttpStorageBackend::curlInitialized_ = false;

static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp){
    size_t realsize = size * nmemb;
    std::string* mem = reinterpret_cast<std::string*>(userp);
    if(mem) mem->append(reinterpret_cast<char*>(contents), realsize);
    return realsize;
}

HttpStorageBackend::HttpStorageBackend(std::string baseUrl, std::string serviceKey)
    : baseUrl_(std::move(baseUrl)), serviceKey_(std::move(serviceKey)){
    if(!curlInitialized_){
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curlInitialized_ = true;
    }
    while(!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

HttpStorageBackend::~HttpStorageBackend() = default;

std::string HttpStorageBackend::objectUrl(const StorageKey& key) const {
    return baseUrl_ + "/storage/v1/object/" + urlEncode(key.bucket) + "/" + urlEncodePath(key.path);
}

HttpStorageBackend::Response HttpStorageBackend::perform(const std::string& method, const std::string& url, const std::vector<std::string>& extraHeaders, const std::string* payload){
    Response resp;
    CURL* curl = curl_easy_init();
    if(!curl){ resp.curlError = "curl_easy_init failed"; return resp; }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    if(method == "POST"){
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload ? payload->data() : "");
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, payload ? (long)payload->size() : 0L);
    }

    struct curl_slist* headers = nullptr;
    if(!serviceKey_.empty()){
        std::string apikey = std::string("apikey: ") + serviceKey_;
        std::string auth = std::string("Authorization: Bearer ") + serviceKey_;
        headers = curl_slist_append(headers, apikey.c_str());
        headers = curl_slist_append(headers, auth.c_str());
    }
    for(const auto& h : extraHeaders){ headers = curl_slist_append(headers, h.c_str()); }
    if(headers) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    if(res != CURLE_OK){ resp.curlError = curl_easy_strerror(res); }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &resp.httpCode);
    char* ct = nullptr;
    if(curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) resp.contentType = ct;

    if(headers) curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return resp;
}

StorageResult HttpStorageBackend::get(const StorageKey& key){
    StorageResult out;
    Response resp = perform("GET", objectUrl(key), {}, nullptr);
    if(!resp.curlError.empty()){
        out.error = resp.curlError;
        PLOGW << "HttpStorageBackend: GET " << key.toString() << " failed: " << resp.curlError;
        return out;
    }
    if(!resp.ok()){
        // the storage API answers 400 with a "not_found" body for missing objects
        out.notFound = resp.httpCode == 404 || (resp.httpCode == 400 && resp.body.find("not_found") != std::string::npos);
        out.error = "HTTP " + std::to_string(resp.httpCode);
        if(!out.notFound) PLOGW << "HttpStorageBackend: GET " << key.toString() << " -> " << resp.httpCode << " " << resp.body.substr(0, 200);
        return out;
    }
    out.ok = true;
    out.contentType = resp.contentType;
    out.data.assign(resp.body.begin(), resp.body.end());
    return out;
}

StorageResult HttpStorageBackend::put(const StorageKey& key, const std::vector<uint8_t>& data, const std::string& contentType){
    StorageResult out;
    out.contentType = contentType;
    std::string payload(data.begin(), data.end());
    std::vector<std::string> headers{
        "Content-Type: " + (contentType.empty() ? std::string("application/octet-stream") : contentType),
        "x-upsert: true",
        "cache-control: 3600"
    };
    Response resp = perform("POST", objectUrl(key), headers, &payload);
    if(!resp.ok()){
        out.error = resp.curlError.empty() ? ("HTTP " + std::to_string(resp.httpCode) + " " + resp.body.substr(0, 200)) : resp.curlError;
        return out;
    }
    out.ok = true;
    return out;
}

std::vector<StorageListEntry> HttpStorageBackend::list(const std::string& bucket, const std::string& prefix, std::string* outError){
    std::vector<StorageListEntry> out;
    nlohmann::json body = {
        {"prefix", prefix},
        {"limit", 100},
        {"offset", 0},
        {"sortBy", {{"column", "name"}, {"order", "asc"}}}
    };
    std::string payload = body.dump();
    Response resp = perform("POST", baseUrl_ + "/storage/v1/object/list/" + urlEncode(bucket), {"Content-Type: application/json"}, &payload);
    if(!resp.ok()){
        if(outError) *outError = resp.curlError.empty() ? ("HTTP " + std::to_string(resp.httpCode)) : resp.curlError;
        return out;
    }
    nlohmann::json parsed = nlohmann::json::parse(resp.body, nullptr, false);
    if(!parsed.is_array()){
        if(outError) *outError = "unexpected list response";
        return out;
    }
    for(const auto& item : parsed){
        if(!item.is_object() || !item.contains("name") || !item["name"].is_string()) continue;
        StorageListEntry e;
        e.name = item["name"].get<std::string>();
        if(item.contains("metadata") && item["metadata"].is_object() && item["metadata"].contains("size") && item["metadata"]["size"].is_number())
            e.size = item["metadata"]["size"].get<uint64_t>();
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace CadPreview
