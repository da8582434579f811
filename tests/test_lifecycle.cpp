#include <gtest/gtest.h>
#include <managers/lifecycle.hpp>

static ClassifierInput input(bool finished, std::optional<SequencingStatus> status, bool copying) {
    ClassifierInput in;
    in.finished = finished;
    in.oracle_status = status;
    in.copying = copying;
    return in;
}

TEST(Lifecycle, FailedAndIdleAborts) {
    EXPECT_EQ(classify(input(false, SequencingStatus::Failed, false)), Decision::Abort);
    EXPECT_EQ(classify(input(true, SequencingStatus::Failed, false)), Decision::Abort);
}

TEST(Lifecycle, FailedWhileCopyingIsIgnored) {
    EXPECT_EQ(classify(input(true, SequencingStatus::Failed, true)), Decision::CopyingIgnoreAbort);
    EXPECT_EQ(phase_for(Decision::CopyingIgnoreAbort), RunPhase::Copying);
}

TEST(Lifecycle, CopyingWinsOverFinished) {
    EXPECT_EQ(classify(input(true, SequencingStatus::Normal, true)), Decision::Copying);
    EXPECT_EQ(classify(input(false, std::nullopt, true)), Decision::Copying);
}

TEST(Lifecycle, FinishedIsReady) {
    EXPECT_EQ(classify(input(true, SequencingStatus::Normal, false)), Decision::Ready);
    EXPECT_EQ(classify(input(true, std::nullopt, false)), Decision::Ready);
    EXPECT_EQ(phase_for(Decision::Ready), RunPhase::ReadyForCopy);
}

TEST(Lifecycle, ExceptionStatusIsCopiedLikeNormal) {
    EXPECT_EQ(classify(input(true, SequencingStatus::Exception, false)), Decision::Ready);
    EXPECT_EQ(classify(input(false, SequencingStatus::Exception, false)), Decision::NotReady);
}

TEST(Lifecycle, UnfinishedIsNotReady) {
    EXPECT_EQ(classify(input(false, std::nullopt, false)), Decision::NotReady);
    EXPECT_EQ(phase_for(Decision::NotReady), RunPhase::NotReady);
}

TEST(Lifecycle, PhaseNames) {
    EXPECT_STREQ(phase_name(RunPhase::NotReady), "not_ready");
    EXPECT_STREQ(phase_name(RunPhase::ReadyForCopy), "ready_for_copy");
    EXPECT_STREQ(phase_name(RunPhase::Copying), "copying");
}
