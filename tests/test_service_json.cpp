/**
 * @file test_service_json.cpp
 * @brief Tests for ArcGIS REST JSON helpers
 */

#include <catch2/catch.hpp>
#include "mapping/ServiceJson.hpp"
#include "TestHelpers.hpp"

using namespace brew;

TEST_CASE("Service error payloads yield their message", "[json]") {
    QJsonObject object;
    QString error;

    SECTION("Message present") {
        CHECK_FALSE(json::parseServiceObject(test::serviceErrorJson(400, "Item does not exist or is inaccessible."),
                                             object, error));
        CHECK(error == "Item does not exist or is inaccessible.");
    }

    SECTION("Message missing falls back to the code") {
        CHECK_FALSE(json::parseServiceObject(R"({"error": {"code": 498}})", object, error));
        CHECK(error == "Service error 498");
    }
}

TEST_CASE("Malformed bodies are rejected", "[json]") {
    QJsonObject object;
    QString error;
    CHECK_FALSE(json::parseServiceObject("<html>502 Bad Gateway</html>", object, error));
    CHECK(error == "Invalid JSON response");

    error.clear();
    CHECK_FALSE(json::parseServiceObject("[1, 2, 3]", object, error));
    CHECK(error == "Invalid JSON response");
}

TEST_CASE("latestWkid wins over wkid", "[json]") {
    QJsonObject sr{{"wkid", 102100}, {"latestWkid", 3857}};
    CHECK(json::parseSpatialReference(sr).wkid() == 3857);
    CHECK(json::parseSpatialReference(QJsonObject{{"wkid", 4326}}).wkid() == 4326);
    CHECK_FALSE(json::parseSpatialReference(QJsonValue()).isValid());
}

TEST_CASE("Envelopes parse with fallback reference", "[json]") {
    QJsonObject extent{{"xmin", 1.0}, {"ymin", 2.0}, {"xmax", 3.0}, {"ymax", 4.0}};

    Envelope e = json::parseEnvelope(extent, SpatialReference::wgs84());
    REQUIRE_FALSE(e.isEmpty());
    CHECK(e.xMax() == 3.0);
    CHECK(e.spatialReference().wkid() == 4326);

    extent["xmin"] = "NaN";
    CHECK(json::parseEnvelope(extent).isEmpty());
    CHECK(json::parseEnvelope(QJsonValue(42)).isEmpty());
}
