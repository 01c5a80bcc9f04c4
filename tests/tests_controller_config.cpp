/*!
 * @file
 * @brief Configuration defaults, JSON overrides and the config file.
 */

#include "core/ControllerConfig.h"

#include <catch2/catch.hpp>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QTemporaryDir>


namespace {

QJsonObject
parse(const char *json)
{
	return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace


TEST_CASE("config: defaults")
{
	const ControllerConfig c;
	CHECK(c.scale.responsiveness == 0.12);
	CHECK(c.scale.deadZone == 0.02);
	CHECK(c.rotation.responsiveness == 0.08);
	CHECK(c.rotation.deadZone == 0.01);
	CHECK(c.scaleAlpha == 0.4);
	CHECK(c.rotationAlpha == 0.3);
	CHECK(c.pinchAlpha == 0.5);
	CHECK(c.gracePeriodMs == 500);
	CHECK(c.autoRotateSpeed == 0.003);
	CHECK(c.oscillationAmplitude == 0.08);
	CHECK(c.oscillationFrequency == 0.3);
	CHECK(c.mode == GestureMode::Both);
	CHECK(c.feedPort == LANDMARK_SERVER_PORT);
	CHECK(c.sinkType == "udp");
}

TEST_CASE("config: empty document keeps defaults")
{
	QStringList warnings;
	const ControllerConfig c = ControllerConfig::fromJson(QJsonObject(), &warnings);
	CHECK(warnings.isEmpty());
	CHECK(c.scale.responsiveness == 0.12);
	CHECK(c.tickIntervalMs == 16);
}

TEST_CASE("config: overrides")
{
	QStringList warnings;
	const ControllerConfig c = ControllerConfig::fromJson(parse(R"({
		"smoothing": {
			"scale": {"responsiveness": 0.2, "dead_zone": 0.05},
			"ema_alpha": {"pinch": 1.0}
		},
		"hand": {"grace_period_ms": 750},
		"auto_rotate": {"speed": 0.01, "oscillation": {"amplitude": 0.2}},
		"gesture": {"mode": "Rotate"},
		"feed": {"host": "10.0.0.2", "port": 6000},
		"output": {"sink": "NONE", "port": 9100}
	})"), &warnings);

	CHECK(warnings.isEmpty());
	CHECK(c.scale.responsiveness == 0.2);
	CHECK(c.scale.deadZone == 0.05);
	CHECK(c.rotation.responsiveness == 0.08);
	CHECK(c.pinchAlpha == 1.0);
	CHECK(c.gracePeriodMs == 750);
	CHECK(c.autoRotateSpeed == 0.01);
	CHECK(c.oscillationAmplitude == 0.2);
	CHECK(c.oscillationFrequency == 0.3);
	CHECK(c.mode == GestureMode::Rotate);
	CHECK(c.feedHost == "10.0.0.2");
	CHECK(c.feedPort == 6000);
	CHECK(c.sinkType == "none");
	CHECK(c.sinkPort == 9100);
}

TEST_CASE("config: invalid values keep defaults and warn")
{
	QStringList warnings;
	const ControllerConfig c = ControllerConfig::fromJson(parse(R"({
		"smoothing": {
			"rotation": {"dead_zone": -1},
			"ema_alpha": {"scale": 0, "rotation": 1.5, "pinch": "fast"}
		},
		"gesture": {"mode": "zoom"},
		"feed": {"port": 70000},
		"output": {"sink": "serial"}
	})"), &warnings);

	CHECK(warnings.size() == 7);
	CHECK(c.rotation.deadZone == 0.01);
	CHECK(c.scaleAlpha == 0.4);
	CHECK(c.rotationAlpha == 0.3);
	CHECK(c.pinchAlpha == 0.5);
	CHECK(c.mode == GestureMode::Both);
	CHECK(c.feedPort == LANDMARK_SERVER_PORT);
	CHECK(c.sinkType == "udp");
}

TEST_CASE("config file: save then load")
{
	QTemporaryDir dir;
	REQUIRE(dir.isValid());
	const QString path = dir.filePath("nested/hand_morph.json");

	ControllerConfig saved;
	saved.rotation.responsiveness = 0.15;
	saved.gracePeriodMs = 300;
	saved.mode = GestureMode::Scale;
	saved.sinkType = "none";

	QString error;
	REQUIRE(ConfigFile::save(path, saved, &error));
	CHECK(error.isEmpty());

	ControllerConfig loaded;
	REQUIRE(ConfigFile::load(path, loaded, &error));
	CHECK(loaded.rotation.responsiveness == 0.15);
	CHECK(loaded.gracePeriodMs == 300);
	CHECK(loaded.mode == GestureMode::Scale);
	CHECK(loaded.sinkType == "none");
	CHECK(ConfigFile::resolvePath(path) == QFileInfo(path).absoluteFilePath());
}

TEST_CASE("config file: failures")
{
	QTemporaryDir dir;
	REQUIRE(dir.isValid());
	ControllerConfig c;
	c.gracePeriodMs = 123;
	QString error;

	SECTION("missing file")
	{
		CHECK_FALSE(ConfigFile::load(dir.filePath("absent.json"), c, &error));
		CHECK_FALSE(error.isEmpty());
		CHECK(ConfigFile::resolvePath(dir.filePath("absent.json")).isEmpty());
	}

	SECTION("not json")
	{
		QFile f(dir.filePath("bad.json"));
		REQUIRE(f.open(QIODevice::WriteOnly));
		f.write("smoothing = 1");
		f.close();

		CHECK_FALSE(ConfigFile::load(f.fileName(), c, &error));
		CHECK_FALSE(error.isEmpty());
	}

	// A failed load leaves the config alone
	CHECK(c.gracePeriodMs == 123);
}

TEST_CASE("config: millisecond fields reject out-of-range values")
{
	QStringList warnings;

	SECTION("too large for the field")
	{
		const ControllerConfig c = ControllerConfig::fromJson(parse(R"({
			"ticker": {"interval_ms": 1e12},
			"hand": {"grace_period_ms": 1e30},
			"feed": {"reconnect_ms": 3e9}
		})"), &warnings);

		CHECK(warnings.size() == 3);
		CHECK(c.tickIntervalMs == 16);
		CHECK(c.gracePeriodMs == 500);
		CHECK(c.reconnectIntervalMs == 2000);
	}

	SECTION("below one millisecond")
	{
		const ControllerConfig c = ControllerConfig::fromJson(parse(R"({
			"ticker": {"interval_ms": 0.5},
			"hand": {"grace_period_ms": 0.25}
		})"), &warnings);

		CHECK(warnings.size() == 2);
		CHECK(c.tickIntervalMs == 16);
		CHECK(c.gracePeriodMs == 500);
	}

	SECTION("large but representable")
	{
		const ControllerConfig c = ControllerConfig::fromJson(parse(R"({
			"hand": {"grace_period_ms": 1e12},
			"ticker": {"interval_ms": 1}
		})"), &warnings);

		CHECK(warnings.isEmpty());
		CHECK(c.gracePeriodMs == 1000000000000LL);
		CHECK(c.tickIntervalMs == 1);
	}
}
