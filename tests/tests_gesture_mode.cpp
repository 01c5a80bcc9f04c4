/*!
 * @file
 * @brief GestureMode naming and gating tests.
 */

#include "core/GestureMode.h"

#include <catch2/catch.hpp>


TEST_CASE("GestureMode gating")
{
	CHECK(GestureModes::drivesScale(GestureMode::Scale));
	CHECK_FALSE(GestureModes::drivesRotation(GestureMode::Scale));

	CHECK_FALSE(GestureModes::drivesScale(GestureMode::Rotate));
	CHECK(GestureModes::drivesRotation(GestureMode::Rotate));

	CHECK(GestureModes::drivesScale(GestureMode::Both));
	CHECK(GestureModes::drivesRotation(GestureMode::Both));
}

TEST_CASE("GestureMode names")
{
	for (GestureMode m : {GestureMode::Scale, GestureMode::Rotate, GestureMode::Both}) {
		const auto parsed = GestureModes::fromName(GestureModes::name(m));
		REQUIRE(parsed.has_value());
		CHECK(*parsed == m);
	}

	CHECK(GestureModes::fromName(" Rotate ") == GestureMode::Rotate);
	CHECK_FALSE(GestureModes::fromName("zoom").has_value());
	CHECK_FALSE(GestureModes::fromName("").has_value());
	CHECK(GestureModes::names() == QStringList{"scale", "rotate", "both"});
}
