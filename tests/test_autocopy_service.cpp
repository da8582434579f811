#include <gtest/gtest.h>
#include <managers/autocopy_service.hpp>
#include <platform/signals.hpp>
#include <fmt/format.h>
#include "fakes.hpp"

class AutocopyServiceTest : public ::testing::Test {
protected:
    TempDir tmp{"service"};
    FakeEvidenceSource evidence;
    FakeOracle oracle;
    FakeBackend backend;
    FakeRemoteShell remote;
    RecordingNotifier notifier;
    Config cfg = make_test_config(tmp.path(), "max_copy_processes: 2\n");
    Mailer mailer{notifier, cfg.email(), "testhost"};
    AutocopyService svc{cfg, evidence, oracle, backend, remote, mailer};

    void SetUp() override { evidence.fallback.finished = true; }

    void make_run(const std::string& name) { fs::create_directories(tmp.path() / name); }

    MonitoredRun* run(const std::string& name) { return svc.registry().find(tmp.path(), name); }

    // Launch record for a run, or nullptr if it was never launched.
    const Launch* last_launch_of(const std::string& name) const {
        std::string source = (tmp.path() / name).string();
        for (auto it = backend.launches.rbegin(); it != backend.launches.rend(); ++it) {
            if (it->args.size() >= 2 && it->args[it->args.size() - 2] == source) return &*it;
        }
        return nullptr;
    }
};

// ── Dispatch ──

TEST_F(AutocopyServiceTest, FinishedRunIsDispatched) {
    make_run("200101_MACHINE1");
    oracle.add("200101_MACHINE1");

    svc.run_cycle();

    MonitoredRun* r = run("200101_MACHINE1");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->phase, RunPhase::Copying);
    ASSERT_EQ(backend.launches.size(), 1u);
    const auto& args = backend.launches[0].args;
    EXPECT_EQ(args[args.size() - 2], (tmp.path() / "200101_MACHINE1").string());
    EXPECT_EQ(args.back(), "seqstore:/data/runs");
    EXPECT_EQ(oracle.started_marked, (std::vector<std::string>{"200101_MACHINE1"}));
}

TEST_F(AutocopyServiceTest, UnfinishedRunWaits) {
    make_run("200101_MACHINE1");
    evidence.facts["200101_MACHINE1"].finished = false;

    svc.run_cycle();
    EXPECT_EQ(run("200101_MACHINE1")->phase, RunPhase::NotReady);
    EXPECT_TRUE(backend.launches.empty());
}

TEST_F(AutocopyServiceTest, NoDoubleDispatch) {
    make_run("200101_MACHINE1");
    svc.run_cycle();
    svc.run_cycle();
    svc.run_cycle();
    EXPECT_EQ(backend.launches.size(), 1u);
    EXPECT_EQ(run("200101_MACHINE1")->phase, RunPhase::Copying);
}

TEST_F(AutocopyServiceTest, CapIsNeverExceeded) {
    for (int i = 1; i <= 5; i++) make_run(fmt::format("20010{}_MACHINE1", i));

    for (int cycle = 0; cycle < 6; cycle++) {
        svc.run_cycle();
        EXPECT_LE(svc.registry().copying_count(), 2) << "cycle " << cycle;
        // Let the oldest running copy finish so slots open up.
        for (auto& l : backend.launches) {
            if (!l.state->exit_code) {
                l.state->exit_code = 0;
                break;
            }
        }
    }
    EXPECT_EQ(notifier.count("Finished copying run dir"), 5);
    EXPECT_EQ(svc.registry().size(), 0u);
}

TEST_F(AutocopyServiceTest, PostponedRunStaysReady) {
    make_run("200101_A");
    make_run("200102_B");
    make_run("200103_C");

    svc.run_cycle();
    EXPECT_EQ(backend.launches.size(), 2u);
    EXPECT_EQ(run("200101_A")->phase, RunPhase::Copying);
    EXPECT_EQ(run("200102_B")->phase, RunPhase::Copying);
    EXPECT_EQ(run("200103_C")->phase, RunPhase::ReadyForCopy);
}

TEST_F(AutocopyServiceTest, NoCopyModeOnlyMonitors) {
    Config off = cfg.with_copies_disabled();
    AutocopyService idle(off, evidence, oracle, backend, remote, mailer);
    make_run("200101_A");
    idle.run_cycle();
    EXPECT_TRUE(backend.launches.empty());
    EXPECT_EQ(idle.registry().find(tmp.path(), "200101_A")->phase, RunPhase::ReadyForCopy);
}

// ── Copy outcomes ──

TEST_F(AutocopyServiceTest, FailedCopyRevertsAndRetriesNextCycle) {
    make_run("200101_MACHINE1");
    svc.run_cycle();
    backend.launches[0].state->exit_code = 1;

    svc.run_cycle();
    MonitoredRun* r = run("200101_MACHINE1");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->phase, RunPhase::ReadyForCopy);
    EXPECT_EQ(notifier.count("ERROR COPYING Run Dir 200101_MACHINE1"), 1);
    EXPECT_EQ(notifier.count("Finished copying"), 0);
    EXPECT_EQ(backend.launches.size(), 1u);
    EXPECT_TRUE(fs::exists(tmp.path() / "200101_MACHINE1"));

    svc.run_cycle();
    EXPECT_EQ(backend.launches.size(), 2u);
    EXPECT_EQ(run("200101_MACHINE1")->phase, RunPhase::Copying);
}

TEST_F(AutocopyServiceTest, SuccessfulCopyCompletesExactlyOnce) {
    make_run("200101_MACHINE1");
    oracle.add("200101_MACHINE1");
    svc.run_cycle();
    backend.launches[0].state->exit_code = 0;

    svc.run_cycle();
    svc.run_cycle();

    EXPECT_EQ(run("200101_MACHINE1"), nullptr);
    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Completed" / "200101_MACHINE1"));
    EXPECT_EQ(notifier.count("Finished copying run dir 200101_MACHINE1"), 1);
    EXPECT_EQ(remote.commands.size(), 1u);
    EXPECT_EQ(backend.launches.size(), 1u);
}

TEST_F(AutocopyServiceTest, CompletedRunIsNotRediscovered) {
    make_run("200101_MACHINE1");
    svc.run_cycle();
    backend.launches[0].state->exit_code = 0;
    svc.run_cycle();

    auto result = svc.registry().reconcile();
    EXPECT_TRUE(result.abort_candidates.empty());
    EXPECT_EQ(svc.registry().size(), 0u);
}

TEST_F(AutocopyServiceTest, BlockedMoveIsRetriedWithoutRecopy) {
    make_run("200101_MACHINE1");
    svc.run_cycle();
    backend.launches[0].state->exit_code = 0;
    fs::create_directories(tmp.path() / "Runs_Completed" / "200101_MACHINE1");

    svc.run_cycle();
    EXPECT_NE(run("200101_MACHINE1"), nullptr);
    EXPECT_EQ(notifier.count("Autocopy unknown exception"), 1);

    fs::remove_all(tmp.path() / "Runs_Completed" / "200101_MACHINE1");
    svc.run_cycle();
    EXPECT_EQ(run("200101_MACHINE1"), nullptr);
    EXPECT_EQ(notifier.count("Finished copying run dir 200101_MACHINE1"), 1);
    EXPECT_EQ(backend.launches.size(), 1u);
}

TEST_F(AutocopyServiceTest, StalledCopyIsRestarted) {
    Config stall = make_test_config(tmp.path(), "seconds_before_copy_restart: 60\n");
    AutocopyService s(stall, evidence, oracle, backend, remote, mailer);
    make_run("200101_MACHINE1");
    s.run_cycle();
    MonitoredRun* r = s.registry().find(tmp.path(), "200101_MACHINE1");
    r->copy_start_time = std::chrono::steady_clock::now() - std::chrono::seconds(61);

    s.run_cycle();
    ASSERT_EQ(backend.launches.size(), 2u);
    EXPECT_TRUE(backend.launches[0].state->killed);
    EXPECT_EQ(backend.launches[1].args, backend.launches[0].args);
    EXPECT_EQ(r->phase, RunPhase::Copying);
    EXPECT_TRUE(fs::exists(tmp.path() / "200101_MACHINE1"));
    EXPECT_EQ(notifier.count("Finished copying"), 0);
}

TEST_F(AutocopyServiceTest, UnreadableRootDoesNotRelaunchCopy) {
    Config one = make_test_config(tmp.path(), "max_copy_processes: 1\n");
    AutocopyService s(one, evidence, oracle, backend, remote, mailer);
    make_run("200101_MACHINE1");
    s.run_cycle();
    ASSERT_EQ(backend.launches.size(), 1u);

    fs::path away = tmp.path().string() + "_away";
    fs::rename(tmp.path(), away);
    s.run_cycle();
    fs::rename(away, tmp.path());
    s.run_cycle();

    EXPECT_EQ(backend.launches.size(), 1u);
    EXPECT_FALSE(backend.launches[0].state->killed);
    EXPECT_EQ(s.registry().copying_count(), 1);
    MonitoredRun* r = s.registry().find(tmp.path(), "200101_MACHINE1");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->phase, RunPhase::Copying);
}

TEST_F(AutocopyServiceTest, DeletedRunStopsItsCopy) {
    make_run("200101_MACHINE1");
    svc.run_cycle();
    ASSERT_EQ(backend.launches.size(), 1u);

    fs::remove_all(tmp.path() / "200101_MACHINE1");
    svc.run_cycle();

    EXPECT_TRUE(backend.launches[0].state->killed);
    EXPECT_EQ(run("200101_MACHINE1"), nullptr);
    EXPECT_EQ(svc.registry().copying_count(), 0);
    EXPECT_EQ(backend.launches.size(), 1u);
}

// ── LIMS status ──

TEST_F(AutocopyServiceTest, UnreachableOracleStillTracks) {
    oracle.unreachable = true;
    make_run("200101_MACHINE1");
    EXPECT_NO_THROW(svc.run_cycle());
    ASSERT_NE(run("200101_MACHINE1"), nullptr);
    EXPECT_EQ(run("200101_MACHINE1")->phase, RunPhase::Copying);
}

TEST_F(AutocopyServiceTest, RunMissingFromLimsIsCopiedWithWarning) {
    make_run("200101_MACHINE1");
    svc.run_cycle();
    EXPECT_EQ(backend.launches.size(), 1u);
    EXPECT_EQ(notifier.count("Run not found in LIMS 200101_MACHINE1"), 1);
}

TEST_F(AutocopyServiceTest, NewFailedRunIsAbortedWithoutTracking) {
    make_run("200101_MACHINE1");
    oracle.add("200101_MACHINE1", SequencingStatus::Failed);

    svc.run_cycle();
    EXPECT_EQ(run("200101_MACHINE1"), nullptr);
    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Aborted" / "200101_MACHINE1"));
    EXPECT_EQ(notifier.count("Run Directory Aborted: 200101_MACHINE1"), 1);
    EXPECT_TRUE(backend.launches.empty());
}

TEST_F(AutocopyServiceTest, FailedStatusAbortsIdleRun) {
    make_run("200101_MACHINE1");
    evidence.facts["200101_MACHINE1"].finished = false;
    oracle.add("200101_MACHINE1");
    svc.run_cycle();
    ASSERT_NE(run("200101_MACHINE1"), nullptr);

    oracle.add("200101_MACHINE1", SequencingStatus::Failed);
    svc.run_cycle();
    EXPECT_EQ(run("200101_MACHINE1"), nullptr);
    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Aborted" / "200101_MACHINE1"));
    EXPECT_EQ(oracle.failed_marked, (std::vector<std::string>{"200101_MACHINE1"}));
}

TEST_F(AutocopyServiceTest, FailedStatusIsIgnoredWhileCopying) {
    make_run("200101_MACHINE1");
    oracle.add("200101_MACHINE1");
    svc.run_cycle();
    ASSERT_EQ(run("200101_MACHINE1")->phase, RunPhase::Copying);

    oracle.add("200101_MACHINE1", SequencingStatus::Failed);
    svc.run_cycle();
    EXPECT_EQ(run("200101_MACHINE1")->phase, RunPhase::Copying);
    EXPECT_TRUE(fs::exists(tmp.path() / "200101_MACHINE1"));
    EXPECT_EQ(notifier.count("Run Directory Aborted"), 0);

    // The copy finishes; it completes rather than aborts.
    backend.launches[0].state->exit_code = 0;
    svc.run_cycle();
    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Completed" / "200101_MACHINE1"));
    EXPECT_EQ(notifier.count("Run Directory Aborted"), 0);
}

// ── Fault isolation ──

TEST_F(AutocopyServiceTest, OneRunFailingDoesNotStopOthers) {
    make_run("200101_A");
    make_run("200102_B");
    backend.fail_launch = true;

    EXPECT_NO_THROW(svc.run_cycle());
    EXPECT_EQ(notifier.count("Autocopy unknown exception"), 2);
    EXPECT_EQ(run("200101_A")->phase, RunPhase::ReadyForCopy);
    EXPECT_EQ(run("200102_B")->phase, RunPhase::ReadyForCopy);

    backend.fail_launch = false;
    svc.run_cycle();
    EXPECT_EQ(backend.launches.size(), 2u);
}

// ── Housekeeping ──

TEST_F(AutocopyServiceTest, FirstCycleSendsSummary) {
    make_run("200101_A");
    svc.run_cycle();
    EXPECT_EQ(notifier.count("Run status summary"), 1);

    svc.run_cycle();
    EXPECT_EQ(notifier.count("Run status summary"), 1);
}

TEST_F(AutocopyServiceTest, LowFreeSpaceWarning) {
    auto r = Config::parse("source_run_roots: [" + tmp.path().string() + "]\n"
                           "min_free_space: 9223372036854775807\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    AutocopyService s(r.value, evidence, oracle, backend, remote, mailer);
    s.check_free_space();
    EXPECT_EQ(notifier.count("Insufficient free space in " + tmp.path().string()), 1);
}

TEST_F(AutocopyServiceTest, InitializeRunRoots) {
    svc.initialize_run_roots();
    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Completed"));
    EXPECT_TRUE(fs::is_directory(tmp.path() / "Runs_Aborted"));
    EXPECT_TRUE(fs::exists(tmp.path() / "Runs_Completed" / "README.txt"));
}

TEST_F(AutocopyServiceTest, RunStopsOnShutdownRequest) {
    platform::reset_signal_flags();
    platform::request_shutdown();
    EXPECT_EQ(svc.run(), 0);
    platform::reset_signal_flags();

    EXPECT_EQ(notifier.count("Daemon Started"), 1);
    EXPECT_EQ(notifier.count("Daemon Stopped"), 1);
}

// Stops the loop once a summary arrives after the first cycle's.
class StopOnSecondSummary : public RecordingNotifier {
public:
    void send(const std::string& to, const std::string& subject, const std::string& body) override {
        RecordingNotifier::send(to, subject, body);
        if (count("Run status summary") >= 2) platform::request_shutdown();
    }
};

// Ends the loop at the start of the second cycle's run processing.
class StopOnSecondCycle : public FakeEvidenceSource {
public:
    mutable int opens = 0;

    std::unique_ptr<RunEvidence> open(const fs::path& run_path) const override {
        if (++opens >= 2) platform::request_shutdown();
        return FakeEvidenceSource::open(run_path);
    }
};

TEST_F(AutocopyServiceTest, SummaryRequestIsAnsweredWhileSleeping) {
    StopOnSecondSummary watcher;
    StopOnSecondCycle cycles;
    cycles.fallback.finished = false;
    Config quick = make_test_config(tmp.path(), "main_loop_delay_seconds: 1\n");
    Mailer m(watcher, quick.email(), "testhost");
    AutocopyService s(quick, cycles, oracle, backend, remote, m);
    make_run("200101_MACHINE1");

    platform::reset_signal_flags();
    platform::request_summary();
    EXPECT_EQ(s.run(), 0);
    platform::reset_signal_flags();

    EXPECT_EQ(watcher.count("Run status summary"), 2);
    EXPECT_EQ(cycles.opens, 1);
    EXPECT_EQ(watcher.count("Daemon Stopped"), 1);
}
