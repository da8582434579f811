#pragma once

#include "status_oracle.hpp"
#include <core/types.hpp>
#include <string>

// StatusOracle over the LIMS REST API.
//   GET  <url>/api/<ver>/run_info/<name>
//   POST <url>/api/<ver>/solexa_runs/<name>/sequencing_failed
//   POST <url>/api/<ver>/solexa_runs/<name>/analysis_started
// Every request carries "Authorization: Token token=<token>".
class LimsClient : public StatusOracle {
public:
    explicit LimsClient(LimsConfig config);

    RunRecord query(const std::string& run_name) override;
    void mark_sequencing_failed(const std::string& run_name) override;
    void mark_analysis_started(const std::string& run_name) override;

    std::string run_info_url(const std::string& run_name) const;
    std::string flag_url(const std::string& run_name, const std::string& action) const;

    // Map an HTTP reply for run_info to a record or an OracleError.
    static RunRecord interpret_run_info(const std::string& run_name, long http_code,
                                        const std::string& body);

private:
    struct HttpResponse {
        long code = 0;
        std::string body;
    };

    LimsConfig config_;

    std::string api_base() const;
    // Throws OracleError when the request cannot be completed at all.
    HttpResponse request(bool post, const std::string& url) const;
    void post_flag(const std::string& run_name, const std::string& action);
};
