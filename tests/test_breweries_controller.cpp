/**
 * @file test_breweries_controller.cpp
 * @brief Scenario tests for loading, clicking and teardown
 */

#include <catch2/catch.hpp>
#include "BreweriesController.hpp"
#include "mapping/FeatureLayer.hpp"
#include "mapping/PortalItem.hpp"
#include "FakeGeoView.hpp"
#include "FakeRestClient.hpp"
#include "TestHelpers.hpp"
#include <QPromise>
#include <QStringList>

using namespace brew;

namespace {

const QString ITEM_PATH = QString("/items/") + test::ITEM_ID;
const QString LAYER_PATH = "/FeatureServer/0";
const QString QUERY_PATH = "/FeatureServer/0/query";

/**
 * @brief A map element that is not a feature
 */
class TextGraphic : public GeoElement {
public:
    Point geometry() const override { return Point(0.0, 0.0, SpatialReference::webMercator()); }
    QVariantMap attributes() const override { return {{"text", "label"}}; }
};

struct Fixture {
    test::FakeRestClient rest;
    test::FakeGeoView view;
    AppSettings settings;
    QStringList alerts;
    std::unique_ptr<BreweriesController> controller;

    Fixture() {
        controller = std::make_unique<BreweriesController>(
            view, rest, settings, [this](const QString& message) { alerts << message; });
    }

    void serveAll() {
        rest.respond(ITEM_PATH, test::itemJson());
        rest.respond(LAYER_PATH, test::layerJson());
        rest.respond(QUERY_PATH, test::queryJson());
    }

    FeatureLayer& layer() { return *controller->featureLayer(); }

    IdentifyLayerResult resultOf(std::initializer_list<GeoElementPtr> elements) {
        IdentifyLayerResult result;
        result.layerName = "Breweries";
        result.elements = elements;
        return result;
    }
};

} // namespace

TEST_CASE("Location text uses two decimals", "[controller]") {
    CHECK(BreweriesController::formatLocation(Point(12.346, -0.5)) == "x: 12.35, y: -0.50");
    CHECK(BreweriesController::formatLocation(Point(-13697000.123, 6320000.987)) ==
          "x: -13697000.12, y: 6320000.99");
}

TEST_CASE("Only still primary clicks qualify", "[controller]") {
    MapMouseEvent event;
    event.button = MouseButton::Primary;
    event.stillSincePress = true;
    CHECK(BreweriesController::isQualifyingClick(event));

    event.stillSincePress = false;
    CHECK_FALSE(BreweriesController::isQualifyingClick(event));

    event.stillSincePress = true;
    event.button = MouseButton::Secondary;
    CHECK_FALSE(BreweriesController::isQualifyingClick(event));
}

TEST_CASE("Successful start builds the map and arms clicks", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();

    CHECK(f.alerts.isEmpty());
    REQUIRE(f.controller->featureLayer() != nullptr);
    CHECK(f.layer().isLoaded());
    CHECK(f.controller->isClickHandlerArmed());

    REQUIRE_FALSE(f.rest.requests().empty());
    CHECK(f.rest.requests().front().toString() ==
          "https://www.arcgis.com/sharing/rest/content/items/317b5f03d5de4f368fb802fe32d15dfa?f=json");

    SECTION("Map, viewpoint and handler are installed in order") {
        std::vector<std::string> expected = {"setMap", "setViewpoint", "setOnMouseClicked"};
        CHECK(f.view.events() == expected);
    }

    SECTION("The map carries the light gray basemap and the layer") {
        auto map = f.view.map();
        REQUIRE(map);
        CHECK(map->basemap().tileUrlTemplate() == Basemap::lightGrayCanvas().tileUrlTemplate());
        CHECK(map->containsLayer(f.controller->featureLayer()));
        CHECK(f.layer().layerId() == 0);
    }

    SECTION("The viewpoint is the layer's full extent") {
        REQUIRE(f.view.viewpoints().size() == 1);
        const Envelope& target = f.view.viewpoints().front().targetExtent();
        CHECK(target.xMin() == Approx(f.layer().fullExtent().xMin()));
        CHECK(target.yMax() == Approx(f.layer().fullExtent().yMax()));
    }

    SECTION("Starting twice does not reload") {
        size_t requests = f.rest.requests().size();
        f.controller->start();
        CHECK(f.rest.requests().size() == requests);
    }
}

TEST_CASE("Portal item failure is reported and nothing else happens", "[controller]") {
    Fixture f;
    f.rest.respond(ITEM_PATH, test::serviceErrorJson(400, "Item does not exist or is inaccessible."));
    f.controller->start();

    REQUIRE(f.alerts.size() == 1);
    CHECK(f.alerts.front() == "Portal Item: Item does not exist or is inaccessible.");
    CHECK(f.controller->featureLayer() == nullptr);
    CHECK(f.view.events().empty());
    CHECK_FALSE(f.view.hasClickHandler());
}

TEST_CASE("Feature layer failure is reported and clicks stay unarmed", "[controller]") {
    Fixture f;
    f.rest.respond(ITEM_PATH, test::itemJson());
    f.rest.respond(LAYER_PATH, test::serviceErrorJson(499, "Token Required"));
    f.controller->start();

    REQUIRE(f.alerts.size() == 1);
    CHECK(f.alerts.front() == "Feature Layer: Token Required");
    CHECK_FALSE(f.controller->isClickHandlerArmed());
    CHECK_FALSE(f.view.hasClickHandler());
    CHECK(f.view.map() == nullptr);
}

TEST_CASE("Clicks are not handled before the layer has loaded", "[controller]") {
    Fixture f;
    f.rest.setDeferred(true);
    f.serveAll();
    f.controller->start();

    CHECK_FALSE(f.view.hasClickHandler());
    f.rest.deliverPending();  // item
    CHECK_FALSE(f.view.hasClickHandler());
    f.rest.deliverPending();  // layer description
    f.rest.deliverPending();  // features
    CHECK(f.view.hasClickHandler());
    CHECK(f.controller->isClickHandlerArmed());
}

TEST_CASE("A qualifying click identifies, selects and shows the callout", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();
    REQUIRE(f.controller->isClickHandlerArmed());

    const auto& features = f.layer().features();
    f.view.scriptIdentify(identify::makeReadyResult(
        f.resultOf({features[1], std::make_shared<TextGraphic>()})));

    REQUIRE(f.view.click(QPointF(12.346, 0.5)));

    SECTION("Identify uses the configured parameters") {
        REQUIRE(f.view.identifyCalls().size() == 1);
        const test::IdentifyCall& call = f.view.identifyCalls().front();
        CHECK(call.layer == f.controller->featureLayer());
        CHECK(call.screenPoint == QPointF(12.346, 0.5));
        CHECK(call.tolerance == 10.0);
        CHECK_FALSE(call.returnPopupsOnly);
        CHECK(call.maximumResults == 10);
    }

    SECTION("The callout shows the clicked location immediately") {
        Callout& callout = f.view.callout();
        CHECK(callout.isVisible());
        CHECK(callout.title() == "Location");
        CHECK(callout.detail() == "x: 12.35, y: -0.50");
        CHECK(callout.animationDuration().count() == 0);
        CHECK(callout.location().x() == Approx(12.346));
    }

    SECTION("Only features end up selected") {
        REQUIRE(test::waitUntil([&]() { return f.layer().selectionCount() > 0; }));
        CHECK(f.layer().selectionCount() == 1);
        CHECK(f.layer().isSelected(features[1]->objectId()));
    }
}

TEST_CASE("A single selected brewery is named in the status", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();
    REQUIRE(f.controller->isClickHandlerArmed());

    QStringList messages;
    QObject::connect(f.controller.get(), &BreweriesController::statusMessage,
                     [&messages](const QString& message) { messages << message; });

    const auto& features = f.layer().features();
    f.view.scriptIdentify(identify::makeReadyResult(f.resultOf({features[1]})));
    REQUIRE(f.view.click(QPointF(1.0, 1.0)));

    REQUIRE(test::waitUntil([&]() { return f.layer().selectionCount() == 1; }));
    CHECK(messages.contains("Selected Strange Fellows"));
}

TEST_CASE("A click clears the previous selection before identify completes", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();

    const auto& features = f.layer().features();
    f.layer().selectFeatures({features[0], features[2]});
    REQUIRE(f.layer().selectionCount() == 2);

    QPromise<IdentifyLayerResult> pending;
    pending.start();
    f.view.scriptIdentify(pending.future());

    f.view.click(QPointF(5.0, 5.0));
    CHECK(f.layer().selectionCount() == 0);

    pending.addResult(f.resultOf({}));
    pending.finish();
    test::processEventsFor(50);
    CHECK(f.layer().selectionCount() == 0);
}

TEST_CASE("Clicks that are not still primary clicks change nothing", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();

    const auto& features = f.layer().features();
    f.layer().selectFeatures({features[0]});

    f.view.click(QPointF(1.0, 1.0));
    test::processEventsFor(20);
    REQUIRE(f.view.callout().isVisible());
    QString detail = f.view.callout().detail();
    size_t identifies = f.view.identifyCalls().size();
    f.layer().selectFeatures({features[0]});

    SECTION("Secondary button") {
        f.view.click(QPointF(300.0, 300.0), MouseButton::Secondary);
    }
    SECTION("Press turned into a pan") {
        f.view.click(QPointF(300.0, 300.0), MouseButton::Primary, false);
    }

    CHECK(f.view.identifyCalls().size() == identifies);
    CHECK(f.view.callout().isVisible());
    CHECK(f.view.callout().detail() == detail);
    CHECK(f.layer().selectionCount() == 1);
}

TEST_CASE("Identify failures are swallowed", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();

    f.view.scriptIdentify(identify::makeFailedResult("Layer is not loaded"));
    f.view.click(QPointF(20.0, 30.0));
    test::processEventsFor(50);

    CHECK(f.alerts.isEmpty());
    CHECK(f.layer().selectionCount() == 0);
    CHECK(f.view.callout().isVisible());
    CHECK(f.view.callout().detail() == "x: 20.00, y: -30.00");
}

TEST_CASE("A second click moves the callout", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();
    f.view.setTransform(-13700000.0, 6325000.0, 2.0);

    f.view.click(QPointF(100.0, 100.0));
    CHECK(f.view.callout().detail() == "x: -13699800.00, y: 6324800.00");

    f.view.click(QPointF(150.0, 50.0));
    CHECK(f.view.callout().isVisible());
    CHECK(f.view.callout().detail() == "x: -13699700.00, y: 6324900.00");
    CHECK(f.view.callout().location().x() == Approx(-13699700.0));
}

TEST_CASE("Overlapping identifies: the last to finish wins", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();
    const auto& features = f.layer().features();

    QPromise<IdentifyLayerResult> first;
    QPromise<IdentifyLayerResult> second;
    first.start();
    second.start();
    f.view.scriptIdentify(first.future());
    f.view.scriptIdentify(second.future());

    f.view.click(QPointF(10.0, 10.0));
    f.view.click(QPointF(40.0, 40.0));

    second.addResult(f.resultOf({features[1]}));
    second.finish();
    REQUIRE(test::waitUntil([&]() { return f.layer().isSelected(features[1]->objectId()); }));

    first.addResult(f.resultOf({features[0]}));
    first.finish();
    REQUIRE(test::waitUntil([&]() { return f.layer().isSelected(features[0]->objectId()); }));

    CHECK(f.layer().selectionCount() == 1);
    CHECK_FALSE(f.layer().isSelected(features[1]->objectId()));
}

TEST_CASE("Teardown disposes the view exactly once", "[controller]") {
    Fixture f;
    f.serveAll();
    f.controller->start();

    f.controller->teardown();
    f.controller->teardown();
    CHECK(f.view.disposeCount() == 1);
    CHECK(f.rest.cancelCount() == 1);
    CHECK_FALSE(f.controller->isClickHandlerArmed());

    SECTION("Clicks after teardown are ignored") {
        f.view.click(QPointF(1.0, 1.0));
        CHECK(f.view.identifyCalls().empty());
        CHECK_FALSE(f.view.callout().isVisible());
    }

    SECTION("Destruction does not dispose again") {
        f.controller.reset();
        CHECK(f.view.disposeCount() == 1);
    }
}

TEST_CASE("Teardown while loading drops late responses", "[controller]") {
    Fixture f;
    f.rest.setDeferred(true);
    f.serveAll();
    f.controller->start();

    f.rest.deliverPending();  // item; layer request now pending
    f.controller->teardown();
    CHECK(f.rest.pendingCount() == 0);
    CHECK(f.view.map() == nullptr);
    CHECK(f.alerts.isEmpty());
}

TEST_CASE("Dialog text prefixes the failing stage", "[controller]") {
    Fixture f;

    SECTION("Network failure while resolving the item") {
        f.rest.fail(ITEM_PATH, "network unreachable");
        f.controller->start();
        REQUIRE(f.alerts.size() == 1);
        CHECK(f.alerts.front() == "Portal Item: network unreachable");
    }

    SECTION("Service rejects the layer") {
        f.rest.respond(ITEM_PATH, test::itemJson());
        f.rest.respond(LAYER_PATH, test::serviceErrorJson(400, "invalid layer id"));
        f.controller->start();
        REQUIRE(f.alerts.size() == 1);
        CHECK(f.alerts.front() == "Feature Layer: invalid layer id");
    }
}

TEST_CASE("Teardown before start still disposes once", "[controller]") {
    Fixture f;
    f.controller->teardown();
    f.controller->start();

    CHECK(f.view.disposeCount() == 1);
    CHECK(f.rest.requests().empty());
}
