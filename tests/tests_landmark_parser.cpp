/*!
 * @file
 * @brief Decoding of detector frames.
 */

#include "network/LandmarkParser.h"
#include "core/GestureRouter.h"

#include <catch2/catch.hpp>

#include <QString>


namespace {

QByteArray
handWithPoints(const QByteArray &point)
{
	QByteArray line = R"({"hands":[{"handedness":"Right","landmarks":[)";
	for (int i = 0; i < 21; ++i) {
		line += QByteArray(i ? "," : "") + point;
	}
	return line + "]}]}";
}

} // namespace


TEST_CASE("parseFrame: full hand")
{
	QByteArray line = R"({"hands":[{"handedness":"Left","score":0.9,"landmarks":[)";
	for (int i = 0; i < 21; ++i) {
		line += QByteArray(i ? "," : "") + R"({"x":)" + QByteArray::number(i * 0.01) +
		        R"(,"y":0.5,"z":-0.1})";
	}
	line += "]}]}";

	QVector<HandInfo> hands;
	QString error;
	REQUIRE(LandmarkParser::parseFrame(line, hands, &error));
	CHECK(error.isEmpty());
	REQUIRE(hands.size() == 1);

	const HandInfo &h = hands[0];
	CHECK(h.handedness == "Left");
	CHECK(h.score == Approx(0.9f));
	REQUIRE(h.landmarks.size() == 21);
	CHECK(h.landmarks[20].x == Approx(0.2));
	CHECK(h.landmarks[20].y == Approx(0.5));
	CHECK(h.landmarks[20].z == Approx(-0.1));
}

TEST_CASE("parseFrame: defaults for missing fields")
{
	QVector<HandInfo> hands;
	REQUIRE(LandmarkParser::parseFrame(R"({"hands":[{"landmarks":[{"x":0.1,"y":0.2}]}]})", hands));
	REQUIRE(hands.size() == 1);
	CHECK(hands[0].handedness.isEmpty());
	CHECK(hands[0].score == 1.0f);
	REQUIRE(hands[0].landmarks.size() == 1);
	CHECK(hands[0].landmarks[0].z == 0.0);
}

TEST_CASE("parseFrame: frames without hands")
{
	QVector<HandInfo> hands(1);

	SECTION("empty array")
	{
		REQUIRE(LandmarkParser::parseFrame(R"({"hands":[]})", hands));
		CHECK(hands.isEmpty());
	}

	SECTION("missing key")
	{
		REQUIRE(LandmarkParser::parseFrame(R"({"timestamp":12})", hands));
		CHECK(hands.isEmpty());
	}
}

TEST_CASE("parseFrame: rejects bad input untouched")
{
	QVector<HandInfo> hands(2);
	QString error;

	SECTION("broken json")
	{
		CHECK_FALSE(LandmarkParser::parseFrame(R"({"hands":[)", hands, &error));
	}

	SECTION("not an object")
	{
		CHECK_FALSE(LandmarkParser::parseFrame("[1,2,3]", hands, &error));
	}

	CHECK_FALSE(error.isEmpty());
	CHECK(hands.size() == 2);
}

TEST_CASE("parseFrame: badly shaped points empty the hand")
{
	QVector<HandInfo> hands;

	SECTION("array points")
	{
		REQUIRE(LandmarkParser::parseFrame(handWithPoints("[0.5,0.5,0.0]"), hands));
	}

	SECTION("string coordinate")
	{
		REQUIRE(LandmarkParser::parseFrame(handWithPoints(R"({"x":"0.5","y":0.5})"), hands));
	}

	SECTION("missing y")
	{
		REQUIRE(LandmarkParser::parseFrame(handWithPoints(R"({"x":0.5,"z":0.0})"), hands));
	}

	SECTION("non-numeric z")
	{
		REQUIRE(LandmarkParser::parseFrame(handWithPoints(R"({"x":0.5,"y":0.5,"z":"deep"})"), hands));
	}

	REQUIRE(hands.size() == 1);
	CHECK(hands[0].handedness == "Right");
	CHECK(hands[0].landmarks.isEmpty());
}

TEST_CASE("parseFrame: one bad point spoils the whole hand")
{
	QByteArray line = R"({"hands":[{"landmarks":[)";
	for (int i = 0; i < 21; ++i) {
		line += QByteArray(i ? "," : "") + (i == 7 ? QByteArray("null") : QByteArray(R"({"x":0.5,"y":0.5})"));
	}
	line += "]}]}";

	QVector<HandInfo> hands;
	REQUIRE(LandmarkParser::parseFrame(line, hands));
	REQUIRE(hands.size() == 1);
	CHECK(hands[0].landmarks.isEmpty());
}

TEST_CASE("parseFrame: array-shaped hand counts as absent downstream")
{
	QVector<HandInfo> hands;
	REQUIRE(LandmarkParser::parseFrame(handWithPoints("[0.5,0.5,0.0]"), hands));

	ControlSession session;
	const double before = session.scale.target();
	const FrameResult r = GestureRouter::routeFrame(session, hands, 0);

	CHECK(r.acceptedHands == 0);
	CHECK(r.tracking.status != TrackingStatus::Tracking);
	CHECK(session.scale.target() == before);
}
