#include <gtest/gtest.h>
#include <managers/terminal_handler.hpp>
#include <sys/stat.h>
#include <iterator>
#include "fakes.hpp"

class TerminalHandlerTest : public ::testing::Test {
protected:
    TempDir tmp{"terminal"};
    FakeOracle oracle;
    FakeBackend backend;
    FakeRemoteShell remote;
    RecordingNotifier notifier;
    Config cfg = make_test_config(tmp.path());
    Mailer mailer{notifier, cfg.email(), "testhost"};
    RunRegistry registry{cfg, oracle, mailer};
    TerminalHandler handler{cfg, registry, oracle, remote, mailer};

    MonitoredRun& copying(const std::string& name) {
        fs::create_directories(tmp.path() / name);
        MonitoredRun& run = registry.track(tmp.path(), name);
        run.copy_proc = backend.launch("rsync", {});
        run.copy_start_time = std::chrono::steady_clock::now() - std::chrono::seconds(330);
        run.phase = RunPhase::Copying;
        return run;
    }
};

// ── complete ──

TEST_F(TerminalHandlerTest, CompleteMovesReportsAndForgets) {
    MonitoredRun& run = copying("200101_MACHINE1_0001_FC");
    EvidenceFacts facts;
    facts.disk_usage = 3LL * 1024 * 1024 * 1024;
    FakeEvidence evidence(facts);

    handler.complete(run, evidence, oracle.add("200101_MACHINE1_0001_FC"));

    EXPECT_FALSE(fs::exists(tmp.path() / "200101_MACHINE1_0001_FC"));
    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Completed" / "200101_MACHINE1_0001_FC"));
    EXPECT_EQ(registry.size(), 0u);

    ASSERT_EQ(remote.commands.size(), 1u);
    EXPECT_EQ(remote.commands[0], "touch /data/runs/'200101_MACHINE1_0001_FC/Autocopy_complete.txt'");

    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_EQ(notifier.sent[0].subject,
              "AUTOCOPY (testhost): Finished copying run dir 200101_MACHINE1_0001_FC");
    EXPECT_NE(notifier.sent[0].body.find("Copy time:\t\t5m30s"), std::string::npos);
    EXPECT_NE(notifier.sent[0].body.find("3.0 GB"), std::string::npos);
}

TEST_F(TerminalHandlerTest, CompleteReportsProblems) {
    MonitoredRun& run = copying("200101_MACHINE1_0001_FC");
    EvidenceFacts facts;
    facts.files_ok = false;
    facts.read2_cycles = 76;
    FakeEvidence evidence(facts);

    handler.complete(run, evidence, oracle.add("200101_MACHINE1_0001_FC"));
    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_NE(notifier.sent[0].subject.find("Problems found."), std::string::npos);
    EXPECT_NE(notifier.sent[0].body.find("Read 2 cycles"), std::string::npos);
}

TEST_F(TerminalHandlerTest, CompleteWithoutRecordSkipsLimsCheck) {
    MonitoredRun& run = copying("200101_MACHINE1_0001_FC");
    EvidenceFacts facts;
    facts.machine = "OTHER";
    FakeEvidence evidence(facts);

    handler.complete(run, evidence, std::nullopt);
    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_EQ(notifier.sent[0].subject.find("Problems found."), std::string::npos);
}

TEST_F(TerminalHandlerTest, RemoteTouchFailureIsNotFatal) {
    remote.reply = SSHResult{1, "", "touch: cannot touch"};
    MonitoredRun& run = copying("200101_MACHINE1_0001_FC");
    FakeEvidence evidence(EvidenceFacts{});

    EXPECT_NO_THROW(handler.complete(run, evidence, std::nullopt));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(notifier.count("Finished copying run dir"), 1);
}

TEST_F(TerminalHandlerTest, FailedMoveKeepsRunForRetry) {
    MonitoredRun& run = copying("200101_MACHINE1_0001_FC");
    fs::create_directories(tmp.path() / "Runs_Completed" / "200101_MACHINE1_0001_FC");
    FakeEvidence evidence(EvidenceFacts{});

    EXPECT_THROW(handler.complete(run, evidence, std::nullopt), TransitionError);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_TRUE(run.is_copying());
    EXPECT_EQ(run.phase, RunPhase::Copying);
    EXPECT_TRUE(remote.commands.empty());
    EXPECT_EQ(notifier.count("Finished copying"), 0);
}

// ── abort ──

TEST_F(TerminalHandlerTest, AbortMovesFlagsAndReports) {
    fs::create_directories(tmp.path() / "200101_MACHINE1_0001_FC");
    MonitoredRun& run = registry.track(tmp.path(), "200101_MACHINE1_0001_FC");

    handler.abort(run);

    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Aborted" / "200101_MACHINE1_0001_FC"));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(oracle.failed_marked, (std::vector<std::string>{"200101_MACHINE1_0001_FC"}));
    EXPECT_EQ(notifier.count("Run Directory Aborted: 200101_MACHINE1_0001_FC"), 1);
    ASSERT_FALSE(notifier.sent.empty());
    const std::string& body = notifier.sent.back().body;
    EXPECT_NE(body.find("Original Location:\t" + (tmp.path() / "200101_MACHINE1_0001_FC").string()),
              std::string::npos);
    EXPECT_NE(body.find((tmp.path() / "Runs_Aborted" / "200101_MACHINE1_0001_FC").string()),
              std::string::npos);
}

TEST_F(TerminalHandlerTest, AbortSurvivesFlagFailure) {
    oracle.flags_fail = true;
    fs::create_directories(tmp.path() / "200101_A");
    MonitoredRun& run = registry.track(tmp.path(), "200101_A");

    EXPECT_NO_THROW(handler.abort(run));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(notifier.count("Run Directory Aborted"), 1);
}

TEST_F(TerminalHandlerTest, AbortOfMissingDirectoryThrows) {
    MonitoredRun& run = registry.track(tmp.path(), "200101_GONE");
    EXPECT_THROW(handler.abort(run), TransitionError);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(TerminalHandlerTest, AbortUntracked) {
    fs::create_directories(tmp.path() / "200101_A");
    fs::path dest = handler.abort_untracked(tmp.path() / "200101_A");
    EXPECT_EQ(dest, tmp.path() / "Runs_Aborted" / "200101_A");
    EXPECT_TRUE(fs::is_directory(dest));
    EXPECT_EQ(notifier.count("Run Directory Aborted: 200101_A"), 1);
    ASSERT_FALSE(notifier.sent.empty());
    EXPECT_NE(notifier.sent.back().body.find("Original Location:\t" + (tmp.path() / "200101_A").string()),
              std::string::npos);
}

// ── prepare_run_root ──

TEST_F(TerminalHandlerTest, PrepareRunRoot) {
    fs::path root = tmp.path() / "new_root";
    handler.prepare_run_root(root);

    for (const char* sub : {"Runs_Completed", "Runs_Aborted"}) {
        fs::path dir = root / sub;
        ASSERT_TRUE(fs::is_directory(dir)) << sub;
        struct stat st;
        ASSERT_EQ(stat(dir.c_str(), &st), 0);
        EXPECT_EQ(st.st_mode & 0777, 0775u) << sub;
        EXPECT_TRUE(fs::exists(dir / "README.txt")) << sub;
    }
}

TEST_F(TerminalHandlerTest, PrepareKeepsExistingReadme) {
    write_file(tmp.path() / "Runs_Completed" / "README.txt", "custom");
    handler.prepare_run_root(tmp.path());

    std::ifstream in(tmp.path() / "Runs_Completed" / "README.txt");
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(text, "custom");
}

// ── LIMS comparison ──

TEST(CheckAgainstLims, MatchingRunHasNoProblems) {
    FakeOracle oracle;
    FakeEvidence evidence(EvidenceFacts{});
    auto problems = TerminalHandler::check_against_lims("200101_M", evidence, oracle.add("200101_M"));
    EXPECT_TRUE(problems.empty());
}

TEST(CheckAgainstLims, InstrumentIsCaseInsensitive) {
    FakeOracle oracle;
    EvidenceFacts facts;
    facts.machine = "machine1";
    FakeEvidence evidence(facts);
    EXPECT_TRUE(TerminalHandler::check_against_lims("200101_M", evidence, oracle.add("200101_M")).empty());
}

TEST(CheckAgainstLims, ReportsEachMismatch) {
    FakeOracle oracle;
    EvidenceFacts facts;
    facts.software = "HCS 2.2.68";
    facts.paired_end = false;
    FakeEvidence evidence(facts);

    auto problems = TerminalHandler::check_against_lims("200101_M", evidence, oracle.add("200101_M"));
    ASSERT_EQ(problems.size(), 2u);
    EXPECT_EQ(problems[0],
              "Mismatched value \"Sequencer software version\". Value in run directory: \"hcs_2_2_68\". "
              "Value in LIMS: \"hcs_2_2_58\"");
    EXPECT_EQ(problems[1],
              "Mismatched value \"Paired end\". Value in run directory: \"false\". Value in LIMS: \"true\"");
}
