#pragma once

#include <cstdint>

// ── Run directory layout ────────────────────────────────────
constexpr const char* RUNDIR_NAME_PATTERN   = "^\\d{6}_.*";      // YYMMDD_ prefix
constexpr const char* SUBDIR_COMPLETED      = "Runs_Completed";   // runs land here after copy
constexpr const char* SUBDIR_ABORTED        = "Runs_Aborted";     // runs flagged 'sequencing failed'
constexpr const char* SUBDIR_README         = "README.txt";
constexpr const char* SUBDIR_README_TEXT    = "Runs in this directory are generally OK to delete.";
constexpr const char* COPY_COMPLETE_SENTINEL = "Autocopy_complete.txt";
constexpr const char* THUMBNAIL_SUBDIR      = "Thumbnail_Images";

// ── Evidence files written by the instrument ────────────────
constexpr const char* FINISHED_FLAG_FILE    = "RTAComplete.txt";
constexpr const char* RUN_INFO_FILE         = "RunInfo.xml";
constexpr const char* RUN_PARAMETERS_FILE   = "runParameters.xml";
constexpr const char* RUN_PARAMETERS_FILE_ALT = "RunParameters.xml";
constexpr const char* BASECALLS_SUBDIR      = "Data/Intensities/BaseCalls";

// ── Copy command ────────────────────────────────────────────
constexpr const char* COPY_PROGRAM          = "rsync";
constexpr const char* COPY_FLAGS            = "-rlptc";
constexpr const char* COPY_CHMOD            = "--chmod=Dug=rwX,Do=rX,Fug=rw,Fo=r";

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_MAX_COPY_PROCESSES    = 2;
constexpr const char* DEFAULT_LOG_DIR       = "/var/log";
constexpr const char* DEFAULT_CONFIG_PATH   = "/etc/autocopy/autocopy.yaml";
constexpr const char* LOCK_FILE_NAME        = "autocopy.lock";
constexpr int TERMINATE_GRACE_MS            = 2000;   // SIGTERM -> SIGKILL window
constexpr int LOOP_SLEEP_SLICE_MS           = 100;    // sleep granularity for signal response
constexpr long HTTP_TIMEOUT_SECS            = 30;
constexpr long SMTP_TIMEOUT_SECS            = 5;

// ── Powers of two ───────────────────────────────────────────
constexpr double ONEKILO = 1024.0;
constexpr double ONEMEG  = ONEKILO * ONEKILO;
constexpr double ONEGIG  = ONEKILO * ONEMEG;
constexpr double ONETERA = ONEKILO * ONEGIG;

constexpr int64_t DEFAULT_MIN_FREE_SPACE = 2LL * 1024 * 1024 * 1024 * 1024;  // 2 TB
