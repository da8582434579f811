#include "lims_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <memory>

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

size_t append_body(void* data, size_t size, size_t nitems, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(data), size * nitems);
    return size * nitems;
}

} // namespace

LimsClient::LimsClient(LimsConfig config) : config_(std::move(config)) {}

std::string LimsClient::api_base() const {
    std::string url = config_.url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    return fmt::format("{}/api/{}", url, config_.api_version);
}

std::string LimsClient::run_info_url(const std::string& run_name) const {
    return fmt::format("{}/run_info/{}", api_base(), run_name);
}

std::string LimsClient::flag_url(const std::string& run_name, const std::string& action) const {
    return fmt::format("{}/solexa_runs/{}/{}", api_base(), run_name, action);
}

LimsClient::HttpResponse LimsClient::request(bool post, const std::string& url) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) throw OracleError("Failed to create CURL easy handle");

    std::string auth = "Authorization: Token token=" + config_.token;
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, auth.c_str()));
    headers.reset(curl_slist_append(headers.release(), "Accept: application/json"));

    HttpResponse resp;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, HTTP_TIMEOUT_SECS);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&resp.body));
    if (post) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, 0L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    CURLcode cc = curl_easy_perform(curl.get());
    if (cc != CURLE_OK) {
        throw OracleError(fmt::format("LIMS request {} failed: {}", url, curl_easy_strerror(cc)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.code);
    return resp;
}

RunRecord LimsClient::interpret_run_info(const std::string& run_name, long http_code,
                                         const std::string& body) {
    if (http_code == 404) throw RunNotFoundError(run_name);
    if (http_code < 200 || http_code >= 300) {
        throw OracleError(fmt::format("LIMS returned HTTP {} for run {}", http_code, run_name));
    }

    YAML::Node node;
    try {
        // JSON is a YAML subset
        node = YAML::Load(body);
    } catch (const YAML::Exception& e) {
        throw OracleError(fmt::format("Malformed LIMS response for run {}: {}", run_name, e.what()));
    }
    return run_record_from_node(run_name, node);
}

RunRecord LimsClient::query(const std::string& run_name) {
    auto resp = request(false, run_info_url(run_name));
    return interpret_run_info(run_name, resp.code, resp.body);
}

void LimsClient::post_flag(const std::string& run_name, const std::string& action) {
    auto resp = request(true, flag_url(run_name, action));
    if (resp.code < 200 || resp.code >= 300) {
        throw OracleError(fmt::format("LIMS returned HTTP {} setting {} on run {}",
                                      resp.code, action, run_name));
    }
    autocopy_log(fmt::format("LIMS: set {} on run {}", action, run_name));
}

void LimsClient::mark_sequencing_failed(const std::string& run_name) {
    post_flag(run_name, "sequencing_failed");
}

void LimsClient::mark_analysis_started(const std::string& run_name) {
    post_flag(run_name, "analysis_started");
}
