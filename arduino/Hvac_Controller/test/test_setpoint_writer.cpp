// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <gtest/gtest.h>

#include "FakeBus.hpp"

using abcd_bus::SetpointResult;

// -----------------------------------------------------------------------------------------------

namespace {
SetpointResult confirmed (const int target) {
    return { .outcome = SetpointResult::Outcome::Confirmed, .observed = target, .roundsWritten = 6 };
}
}    // namespace

TEST (SetpointKind, RangesAndOffsets) {
    EXPECT_TRUE (SetpointRange::of (SetpointKind::Heat).contains (55));
    EXPECT_TRUE (SetpointRange::of (SetpointKind::Heat).contains (85));
    EXPECT_FALSE (SetpointRange::of (SetpointKind::Heat).contains (86));
    EXPECT_FALSE (SetpointRange::of (SetpointKind::Cool).contains (59));
    EXPECT_TRUE (SetpointRange::of (SetpointKind::Cool).contains (90));
    EXPECT_EQ (setpointOffset (SetpointKind::Heat), 25u);
    EXPECT_EQ (setpointOffset (SetpointKind::Cool), 26u);
    EXPECT_EQ (setpointKindFromString ("cool"), SetpointKind::Cool);
    EXPECT_FALSE (setpointKindFromString ("fan").has_value ());
}

TEST (SetpointWriter, SubmitBeforeStartIsRefused) {
    SetpointWriter writer ([] (SetpointKind, const int target) {
        return confirmed (target);
    });
    EXPECT_THROW (writer.submit (SetpointKind::Heat, 70), std::runtime_error);
    writer.start ();
    writer.stop ();
    EXPECT_THROW (writer.submit (SetpointKind::Heat, 70), std::runtime_error);
}

TEST (SetpointWriter, OptimisticValueHeldUntilWriteResolves) {
    std::promise<void> gate, done;
    std::shared_future<void> released = gate.get_future ().share ();
    std::optional<abcd_bus::SetpointResult> completion;
    SetpointWriter writer (
        [&] (SetpointKind, const int target) {
            released.wait ();
            return confirmed (target);
        },
        [&] (SetpointKind, int, const std::optional<SetpointResult> &result) {
            completion = result;
            done.set_value ();
        });
    writer.start ();
    const auto future = writer.submit (SetpointKind::Heat, 72);
    EXPECT_EQ (writer.optimistic (SetpointKind::Heat), 72);
    EXPECT_FALSE (writer.optimistic (SetpointKind::Cool).has_value ());
    gate.set_value ();
    EXPECT_EQ (future.get ().outcome, SetpointResult::Outcome::Confirmed);
    ASSERT_EQ (done.get_future ().wait_for (std::chrono::seconds (5)), std::future_status::ready);
    ASSERT_TRUE (completion.has_value ());
    EXPECT_EQ (completion->observed, 72);
    EXPECT_FALSE (writer.optimistic (SetpointKind::Heat).has_value ());
    EXPECT_EQ (writer.statistics ().succeeded, 1u);
}

TEST (SetpointWriter, RequestsAreWrittenInOrder) {
    std::promise<void> gate, entered;
    std::shared_future<void> released = gate.get_future ().share ();
    std::mutex mutex;
    std::vector<std::pair<SetpointKind, int>> written;
    SetpointWriter writer ([&] (const SetpointKind kind, const int target) {
        {
            std::lock_guard<std::mutex> guard (mutex);
            written.emplace_back (kind, target);
            if (written.size () == 1)
                entered.set_value ();
        }
        released.wait ();
        return confirmed (target);
    });
    writer.start ();
    const auto first = writer.submit (SetpointKind::Heat, 70);
    entered.get_future ().wait ();
    const auto second = writer.submit (SetpointKind::Cool, 75);
    const auto third = writer.submit (SetpointKind::Heat, 71);
    EXPECT_EQ (writer.pending (), 2u);
    EXPECT_EQ (writer.optimistic (SetpointKind::Heat), 71);
    gate.set_value ();
    first.get ();
    second.get ();
    third.get ();
    std::lock_guard<std::mutex> guard (mutex);
    ASSERT_EQ (written.size (), 3u);
    EXPECT_EQ (written [0], std::make_pair (SetpointKind::Heat, 70));
    EXPECT_EQ (written [1], std::make_pair (SetpointKind::Cool, 75));
    EXPECT_EQ (written [2], std::make_pair (SetpointKind::Heat, 71));
}

TEST (SetpointWriter, WriteFailureReachesFutureAndCompletion) {
    std::promise<std::optional<SetpointResult>> completion;
    SetpointWriter writer (
        [] (SetpointKind, int) -> SetpointResult {
            throw abcd_bus::ConnectionError ("no serial device");
        },
        [&] (SetpointKind, int, const std::optional<SetpointResult> &result) {
            completion.set_value (result);
        });
    writer.start ();
    const auto future = writer.submit (SetpointKind::Cool, 74);
    EXPECT_THROW (future.get (), abcd_bus::ConnectionError);
    auto reported = completion.get_future ();
    ASSERT_EQ (reported.wait_for (std::chrono::seconds (5)), std::future_status::ready);
    EXPECT_FALSE (reported.get ().has_value ());
    EXPECT_EQ (writer.statistics ().failed, 1u);
}

TEST (SetpointWriter, UnconfirmedWriteIsCountedSeparately) {
    SetpointWriter writer ([] (SetpointKind, int) {
        return SetpointResult { .outcome = SetpointResult::Outcome::Unconfirmed, .observed = 68, .roundsWritten = 6 };
    });
    writer.start ();
    EXPECT_FALSE (writer.submit (SetpointKind::Heat, 70).get ().succeeded ());
    writer.stop ();
    EXPECT_EQ (writer.statistics ().unsucceeded, 1u);
    EXPECT_EQ (writer.statistics ().submitted, 1u);
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
