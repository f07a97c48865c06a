/**
 * @file test_portal_item.cpp
 * @brief Tests for portal item resolution
 */

#include <catch2/catch.hpp>
#include "mapping/PortalItem.hpp"
#include "FakeRestClient.hpp"
#include "TestHelpers.hpp"

using namespace brew;

namespace {

const QString ITEM_PATH = QString("/items/") + test::ITEM_ID;

} // namespace

TEST_CASE("Portal builds the item description URL", "[portal]") {
    Portal portal("https://www.arcgis.com/");
    QUrl url = portal.itemUrl(test::ITEM_ID);
    CHECK(url.toString() ==
          "https://www.arcgis.com/sharing/rest/content/items/317b5f03d5de4f368fb802fe32d15dfa?f=json");
}

TEST_CASE("Portal item loads its description", "[portal]") {
    test::FakeRestClient rest;
    rest.respond(ITEM_PATH, test::itemJson());

    PortalItem item(Portal(test::PORTAL_URL), test::ITEM_ID, rest);
    int doneCount = 0;
    QObject::connect(&item, &Loadable::doneLoading, [&doneCount]() { ++doneCount; });

    CHECK(item.loadStatus() == LoadStatus::NotLoaded);
    item.loadAsync();

    CHECK(doneCount == 1);
    CHECK(item.loadStatus() == LoadStatus::Loaded);
    CHECK(item.title() == "East Van Breweries");
    CHECK(item.type() == "Feature Service");
    CHECK(item.serviceUrl() == QUrl(test::SERVICE_URL));

    SECTION("Loading again does nothing") {
        item.loadAsync();
        CHECK(doneCount == 1);
        CHECK(rest.requests().size() == 1);
    }
}

TEST_CASE("Portal item failures carry the reason", "[portal]") {
    test::FakeRestClient rest;
    QString expected;

    SECTION("Service error") {
        rest.respond(ITEM_PATH, test::serviceErrorJson(400, "Item does not exist or is inaccessible."));
        expected = "Item does not exist or is inaccessible.";
    }
    SECTION("Transport error") {
        rest.fail(ITEM_PATH, "Host www.arcgis.com not found");
        expected = "Host www.arcgis.com not found";
    }
    SECTION("Item without id") {
        rest.respond(ITEM_PATH, R"({"title": "orphan"})");
        expected = "Item description has no id";
    }

    PortalItem item(Portal(test::PORTAL_URL), test::ITEM_ID, rest);
    item.loadAsync();

    CHECK(item.loadStatus() == LoadStatus::FailedToLoad);
    CHECK(item.loadError() == expected);
}

TEST_CASE("Portal item answered after destruction is ignored", "[portal]") {
    test::FakeRestClient rest;
    rest.setDeferred(true);
    rest.respond(ITEM_PATH, test::itemJson());

    {
        PortalItem item(Portal(test::PORTAL_URL), test::ITEM_ID, rest);
        item.loadAsync();
        CHECK(item.loadStatus() == LoadStatus::Loading);
    }
    CHECK(rest.deliverPending() == 1);
}
