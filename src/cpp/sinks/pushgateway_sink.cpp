#include "pushgateway_sink.hpp"
#include "../utils/logger.hpp"

#include <curl/curl.h>
#include <sstream>
#include <utility>

namespace plantop {

static size_t discard_cb(char* /*ptr*/, size_t size, size_t nmemb, void* /*userdata*/) {
    return size * nmemb;
}

PushgatewaySink::PushgatewaySink(const PushgatewayConfig& config, std::string instance)
    : config_(config), instance_(std::move(instance)) {}

std::string PushgatewaySink::push_url() const {
    std::string base = config_.url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/metrics/job/" + config_.job + "/instance/" + instance_;
}

std::string PushgatewaySink::exposition(const CycleReport& report) {
    std::ostringstream body;
    body << "# TYPE plantop_cpu_util gauge\n"
         << "plantop_cpu_util " << report.cpu_util << "\n"
         << "# TYPE plantop_active_plans gauge\n"
         << "plantop_active_plans " << report.plans.size() << "\n";
    if (report.mem_usage) {
        body << "# TYPE plantop_mem_usage_mb gauge\n"
             << "plantop_mem_usage_mb " << *report.mem_usage << "\n";
    }
    return body.str();
}

void PushgatewaySink::write_cycle(const CycleReport& report) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        push_failures_++;
        LOG_ERR("[pushgateway] curl_easy_init failed");
        return;
    }

    std::string url = push_url();
    std::string body = exposition(report);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discard_cb);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 2L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        push_failures_++;
        LOG_WRN("[pushgateway] Push to %s failed: %s", url.c_str(), curl_easy_strerror(res));
    } else if (status >= 300) {
        push_failures_++;
        LOG_WRN("[pushgateway] Push to %s returned HTTP %ld", url.c_str(), status);
    } else {
        LOG_DBG("[pushgateway] Pushed cycle (%zu plans)", report.plans.size());
    }
}

} // namespace plantop
