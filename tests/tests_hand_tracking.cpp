/*!
 * @file
 * @brief HandTrackingState lifecycle tests.
 */

#include "core/HandTrackingState.h"

#include <catch2/catch.hpp>


TEST_CASE("HandTrackingState starts lost")
{
	HandTrackingState t(500);
	CHECK_FALSE(t.isTracking());

	const TrackingUpdate u = t.update(false, 0);
	CHECK(u.status == TrackingStatus::Lost);
	CHECK(u.timeSinceLostMs == 500);
}

TEST_CASE("HandTrackingState grace window")
{
	const qint64 grace = 500;
	HandTrackingState t(grace);

	const TrackingUpdate seen = t.update(true, 0);
	CHECK(seen.status == TrackingStatus::Tracking);
	CHECK(seen.timeSinceLostMs == 0);
	CHECK(t.isTracking());

	SECTION("just inside the grace period")
	{
		const TrackingUpdate u = t.update(false, grace - 1);
		CHECK(u.status == TrackingStatus::Grace);
		CHECK(u.timeSinceLostMs == grace - 1);
		CHECK(t.isTracking());
	}

	SECTION("exactly at the grace period")
	{
		CHECK(t.update(false, grace).status == TrackingStatus::Lost);
	}

	SECTION("just past the grace period")
	{
		const TrackingUpdate u = t.update(false, grace + 1);
		CHECK(u.status == TrackingStatus::Lost);
		CHECK(u.timeSinceLostMs == grace + 1);
		CHECK_FALSE(t.isTracking());
	}

	SECTION("reacquisition from lost")
	{
		t.update(false, 2000);
		CHECK(t.update(true, 2100).status == TrackingStatus::Tracking);
		CHECK(t.lastSeenAt() == 2100);
		CHECK(t.update(false, 2200).status == TrackingStatus::Grace);
	}
}

TEST_CASE("HandTrackingState dropouts inside the window never report lost")
{
	HandTrackingState t(200);
	for (qint64 now = 0; now < 3000; now += 33) {
		// Every third frame is a detector miss
		const bool present = (now / 33) % 3 != 2;
		CHECK(t.update(present, now).status != TrackingStatus::Lost);
	}
}

TEST_CASE("HandTrackingState status names")
{
	CHECK(HandTrackingState::statusName(TrackingStatus::Tracking) == "tracking");
	CHECK(HandTrackingState::statusName(TrackingStatus::Grace) == "grace");
	CHECK(HandTrackingState::statusName(TrackingStatus::Lost) == "lost");
}
