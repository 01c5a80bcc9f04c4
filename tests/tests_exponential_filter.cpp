/*!
 * @file
 * @brief ExponentialFilter tests.
 */

#include "core/Filters/ExponentialFilter.h"

#include <catch2/catch.hpp>


TEST_CASE("ExponentialFilter seeding")
{
	ExponentialFilter f(0.25);
	CHECK_FALSE(f.isSeeded());
	CHECK_FALSE(f.estimate().has_value());

	SECTION("first sample passes through verbatim")
	{
		CHECK(f.filter(3.5) == 3.5);
		CHECK(f.isSeeded());
		CHECK(*f.estimate() == 3.5);
	}

	SECTION("zero is a real estimate, not empty")
	{
		f.filter(0.0);
		CHECK(f.isSeeded());
		CHECK(f.filter(4.0) == Approx(1.0));
	}
}

TEST_CASE("ExponentialFilter blending")
{
	ExponentialFilter f(0.5);
	f.filter(0.0);
	CHECK(f.filter(1.0) == Approx(0.5));
	CHECK(f.filter(1.0) == Approx(0.75));
	CHECK(f.filter(1.0) == Approx(0.875));
}

TEST_CASE("ExponentialFilter constant input is a fixed point")
{
	for (double alpha : {0.05, 0.3, 0.5, 1.0}) {
		ExponentialFilter f(alpha);
		for (int i = 0; i < 50; ++i) {
			f.filter(0.42);
		}
		CAPTURE(alpha);
		CHECK(*f.estimate() == 0.42);
	}
}

TEST_CASE("ExponentialFilter stays within the range of its inputs")
{
	ExponentialFilter f(0.3);
	const double samples[] = {0.2, 0.9, 0.1, 0.7, 0.4, 0.95, 0.15};
	for (double s : samples) {
		const double v = f.filter(s);
		CHECK(v >= 0.1);
		CHECK(v <= 0.95);
	}
}

TEST_CASE("ExponentialFilter reset re-seeds immediately")
{
	ExponentialFilter f(0.1);
	f.filter(10.0);
	f.filter(20.0);

	f.reset();
	CHECK_FALSE(f.isSeeded());
	CHECK(f.filter(-3.0) == -3.0);
}

TEST_CASE("ExponentialFilter alpha of one tracks the input")
{
	ExponentialFilter f(1.0);
	f.filter(5.0);
	CHECK(f.filter(7.0) == 7.0);

	f.setAlpha(0.5);
	CHECK(f.alpha() == 0.5);
	CHECK(f.filter(9.0) == Approx(8.0));
}
