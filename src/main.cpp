#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <curl/curl.h>
#include <libssh2.h>
#include "cli/options.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "lims/file_oracle.hpp"
#include "lims/lims_client.hpp"
#include "managers/autocopy_service.hpp"
#include "notify/smtp_notifier.hpp"
#include "platform/platform.hpp"
#include "platform/signals.hpp"
#include "platform/singleton.hpp"

static constexpr const char* AUTOCOPY_VERSION = "1.0.0";

static Result<Config> load_config(const DaemonOptions& opts) {
    fs::path path = opts.config_file.empty() ? find_default_config() : fs::path(opts.config_file);
    if (path.empty()) return Result<Config>::Ok(Config::defaults());
    return Config::load(path);
}

static Result<std::unique_ptr<StatusOracle>> make_oracle(const DaemonOptions& opts,
                                                         const Config& config) {
    using R = Result<std::unique_ptr<StatusOracle>>;
    if (opts.no_lims) {
        return R::Ok(std::make_unique<NullOracle>());
    }
    if (opts.test_mode_lims) {
        if (config.lims().local_data.empty()) {
            return R::Err("--test_mode_lims requires lims.local_data in the config");
        }
        return R::Ok(std::make_unique<FileOracle>(config.lims().local_data));
    }
    if (config.lims().url.empty() || config.lims().token.empty()) {
        return R::Err("lims.url and lims.token (or UHTS_LIMS_URL and UHTS_LIMS_TOKEN) must be "
                      "defined. Don't want LIMS? Try --no_lims");
    }
    return R::Ok(std::make_unique<LimsClient>(config.lims()));
}

static Result<std::unique_ptr<Notifier>> make_notifier(const DaemonOptions& opts,
                                                       const Config& config) {
    using R = Result<std::unique_ptr<Notifier>>;
    if (opts.no_email) {
        return R::Ok(std::make_unique<LogNotifier>());
    }
    if (!config.smtp().configured()) {
        return R::Err("smtp.server and smtp.port (or AUTOCOPY_SMTP_SERVER and AUTOCOPY_SMTP_PORT) "
                      "must be defined to send mail. Don't want mail? Try --no_email");
    }
    return R::Ok(std::make_unique<SmtpNotifier>(config.smtp(), config.email().from));
}

static int run_daemon(const DaemonOptions& opts) {
    auto loaded = load_config(opts);
    if (loaded.is_err()) {
        std::cerr << loaded.error << "\n";
        return 1;
    }
    Config config = opts.no_copy ? loaded.value.with_copies_disabled() : loaded.value;

    auto log = set_log_file(opts.log_file, config.log_dir());
    if (log.is_err()) {
        std::cerr << log.error << "\n";
        return 1;
    }
    autocopy_log("\nAutocopy is initializing\n");

    SingletonLock lock((config.log_dir() / LOCK_FILE_NAME).string());
    if (!lock.held()) {
        std::cerr << "Another autocopy daemon is already running (lock "
                  << (config.log_dir() / LOCK_FILE_NAME).string() << ")\n";
        autocopy_log("Another autocopy daemon holds the lock; exiting");
        return 1;
    }

    auto oracle = make_oracle(opts, config);
    if (oracle.is_err()) {
        std::cerr << oracle.error << "\n";
        return 1;
    }
    auto notifier = make_notifier(opts, config);
    if (notifier.is_err()) {
        std::cerr << notifier.error << "\n";
        return 1;
    }

    Mailer mailer(*notifier.value, config.email(), platform::short_hostname());
    RunDirEvidenceSource evidence;
    RsyncBackend backend(log_file_path());
    SSHRemoteShell remote(remote_target_for(config.dest()));

    AutocopyService service(config, evidence, *oracle.value, backend, remote, mailer);
    service.initialize_run_roots();
    platform::install_signal_handlers();
    return service.run();
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto parsed = parse_daemon_options(args);
    if (parsed.is_err()) {
        std::cerr << parsed.error << "\n\n" << daemon_usage();
        return 1;
    }
    const DaemonOptions& opts = parsed.value;
    if (opts.show_help) {
        std::cout << daemon_usage();
        return 0;
    }
    if (opts.show_version) {
        std::cout << "autocopy version " << AUTOCOPY_VERSION << "\n";
        return 0;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    if (libssh2_init(0) != 0) {
        std::cerr << "Failed to initialize libssh2\n";
        curl_global_cleanup();
        return 1;
    }

    int rc = 1;
    try {
        rc = run_daemon(opts);
    } catch (const std::exception& e) {
        std::cerr << "autocopy: " << e.what() << "\n";
        autocopy_log(std::string("Fatal: ") + e.what());
    }

    libssh2_exit();
    curl_global_cleanup();
    return rc;
}
