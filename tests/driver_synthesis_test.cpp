#include "../core/model/manager.hpp"
#include "../memory/document.hpp"

#include <cassert>
#include <cmath>
#include <memory>
#include <stdexcept>

using namespace cskit::core;
using cskit::host::memory::MemoryDocument;

namespace {

bool nearlyEqual(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) <= eps;
}

struct Fixture {
    MemoryDocument doc{"Body"};
    std::shared_ptr<model::Manager> manager;
    std::shared_ptr<model::Target> target;

    Fixture() {
        doc.addShapeKey("A");
        doc.addShapeKey("B");
        doc.addShapeKey("AB");
        manager = std::make_shared<model::Manager>(doc.context(), EngineConfig{});
        target = manager->addTarget("AB");
    }

    std::shared_ptr<model::Variable> shapeVariable(model::Driver& driver, const std::string& key, double pose) {
        auto v = driver.newVariable();
        v->setTarget(0, host::ShapeKeyRef{"Body", key});
        v->setPoseValue(pose);
        return v;
    }

    const host::DriverChannel& channel(const model::Driver& driver) {
        const host::DriverChannel* ch = doc.find(driver.channelAddress());
        assert(ch != nullptr);
        return *ch;
    }
};

void testNewDriverHasDefaultCurveAndExpression() {
    Fixture f;
    auto driver = f.target->addDriver();
    assert(driver->name() == "Driver");
    assert(driver->arrayIndex() == 0);
    assert(driver->dataPath() == "[\"csk_" + f.target->identifier() + "\"]");
    assert(driver->syncState() == model::SyncState::Clean);
    const auto& ch = f.channel(*driver);
    assert(ch.driver.expression == "1.0");
    assert(ch.driver.bindings.empty());
    assert(ch.curve.keyframes[1].co.x == 1.0);
    assert(driver->liveDistance() == 1.0);
    assert(driver->liveWeight() == 0.0);
}

void testAbsoluteTwoVariables() {
    Fixture f;
    auto driver = f.target->addDriver();
    auto a = f.shapeVariable(*driver, "A", 1.0);
    auto b = f.shapeVariable(*driver, "B", 0.5);
    assert(a->name() == "var0");
    assert(b->name() == "var1");

    const auto& ch = f.channel(*driver);
    assert(ch.driver.type == host::DriverType::Scripted);
    assert(ch.driver.expression == "(fabs(var0-1.0)+fabs(var1-0.5))/2.0");
    assert(ch.curve.keyframes[0].co == (curve::Point{0.0, 1.0}));
    assert(ch.curve.keyframes[1].co == (curve::Point{0.75, 0.0}));
    assert(ch.driver.bindings.size() == 2);
    const auto& ref = std::get<host::PropertyRef>(ch.driver.bindings[0].targets.front());
    assert(ref.idType == host::IdType::Key);
    assert(ref.object == "Body");
    assert(ref.dataPath == "key_blocks[\"A\"].value");
}

void testEuclideanTwoVariables() {
    Fixture f;
    auto driver = f.target->addDriver();
    f.shapeVariable(*driver, "A", 3.0);
    f.shapeVariable(*driver, "B", 4.0);
    driver->setMetricKind(metric::MetricKind::Euclidean);
    const auto& ch = f.channel(*driver);
    assert(ch.driver.expression == "sqrt(pow(var0-3.0,2.0)+pow(var1-4.0,2.0))");
    assert(ch.curve.keyframes[1].co == (curve::Point{5.0, 0.0}));
}

void testSynthesisIsIdempotent() {
    Fixture f;
    auto driver = f.target->addDriver();
    f.shapeVariable(*driver, "A", 0.8123456789);
    f.shapeVariable(*driver, "B", 0.3);
    const host::DriverChannel before = f.channel(*driver);
    driver->update();
    driver->update();
    assert(f.channel(*driver) == before);
    driver->fcurveUpdate();
    driver->driverUpdate();
    assert(f.channel(*driver) == before);
}

void testPrecisionRoundsPoseEverywhere() {
    Fixture f;
    auto driver = f.target->addDriver();
    f.shapeVariable(*driver, "A", 0.123456789);
    assert(f.channel(*driver).driver.expression == "fabs(var0-0.123457)");
    assert(f.channel(*driver).curve.keyframes[1].co.x == 0.123457);

    driver->setPrecision(3);
    assert(f.channel(*driver).driver.expression == "fabs(var0-0.123)");
    assert(f.channel(*driver).curve.keyframes[1].co.x == 0.123);

    bool threw = false;
    try {
        driver->setPrecision(2);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(driver->precision() == 3);
    threw = false;
    try {
        driver->setPrecision(29);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
}

void testVariableMutationsResynthesize() {
    Fixture f;
    auto driver = f.target->addDriver();
    auto v = f.shapeVariable(*driver, "A", 1.0);
    v->setRestValue(0.25);
    assert(f.channel(*driver).curve.keyframes[1].co.x == 0.75);
    v->setName("smile");
    assert(f.channel(*driver).driver.expression == "fabs(smile-1.0)");
    assert(f.channel(*driver).driver.bindings[0].name == "smile");

    auto w = driver->newVariable();
    assert(w->name() == "var0");
    w->setName("smile");
    assert(w->name() == "smile0");

    bool threw = false;
    try {
        w->setName("not valid");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    v->setKind(model::VariableKind::SingleProp);
    assert(v->targets().size() == 1);
    assert(std::get<host::PropertyRef>(v->targets()[0]).object == "Body");
    v->setKind(model::VariableKind::LocationDiff);
    assert(v->targets().size() == 2);
    assert(f.channel(*driver).driver.bindings[0].kind == host::BindingKind::LocationDiff);

    threw = false;
    try {
        v->setTarget(0, host::ShapeKeyRef{"Body", "A"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        v->setTarget(2, host::ObjectRef{});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
}

void testRemoveVariable() {
    Fixture f;
    auto driver = f.target->addDriver();
    f.shapeVariable(*driver, "A", 1.0);
    auto b = f.shapeVariable(*driver, "B", 0.5);
    const std::string before = f.channel(*driver).driver.expression;

    bool threw = false;
    try {
        driver->removeVariable(5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(driver->variables().size() == 2);
    assert(f.channel(*driver).driver.expression == before);

    driver->removeVariable(b);
    assert(f.channel(*driver).driver.expression == "fabs(var0-1.0)");
    threw = false;
    try {
        driver->removeVariable(b);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    driver->removeVariable(0);
    assert(f.channel(*driver).driver.expression == "1.0");
}

// The host's live evaluation of the emitted channel matches the engine's own
// weight computation.
void testLiveEvaluationMatchesEngine() {
    Fixture f;
    auto driver = f.target->addDriver();
    f.shapeVariable(*driver, "A", 0.7071067811865476);
    f.shapeVariable(*driver, "B", 0.35);
    const std::string array = f.target->arrayName();

    for (auto kind : {metric::MetricKind::Absolute, metric::MetricKind::Euclidean, metric::MetricKind::Quaternion}) {
        driver->setMetricKind(kind);
        for (double a : {0.0, 0.3, 0.7071, 1.0}) {
            f.doc.setShapeKeyValue("A", a);
            f.doc.setShapeKeyValue("B", 1.0 - a);
            f.doc.evaluate();
            const double slot = f.doc.get(array)->at(static_cast<std::size_t>(driver->arrayIndex()));
            assert(slot == driver->liveWeight());
        }
    }

    driver->setMetricKind(metric::MetricKind::Absolute);
    f.doc.setShapeKeyValue("A", 0.7071067811865476);
    f.doc.setShapeKeyValue("B", 0.35);
    f.doc.evaluate();
    assert(nearlyEqual(f.doc.get(array)->at(0), 1.0, 1e-6));
}

void testReleaseChannelToleratesAbsence() {
    Fixture f;
    auto driver = f.target->addDriver();
    driver->releaseChannel();
    assert(!f.doc.find(driver->channelAddress()));
    assert(driver->syncState() == model::SyncState::Dirty);
    driver->releaseChannel();
    driver->update();
    assert(f.doc.find(driver->channelAddress()));
}

void testDetachedDriverStaysDirty() {
    EngineConfig config;
    auto driver = std::make_shared<model::Driver>(std::weak_ptr<model::Target>(), "[\"csk_x\"]", 0, config);
    auto v = driver->newVariable();
    v->setPoseValue(0.5);
    assert(driver->syncState() == model::SyncState::Dirty);
    assert(driver->expression() == "fabs(var0-0.5)");
    assert(v->value() == 0.0);
}

} // namespace

int main() {
    testNewDriverHasDefaultCurveAndExpression();
    testAbsoluteTwoVariables();
    testEuclideanTwoVariables();
    testSynthesisIsIdempotent();
    testPrecisionRoundsPoseEverywhere();
    testVariableMutationsResynthesize();
    testRemoveVariable();
    testLiveEvaluationMatchesEngine();
    testReleaseChannelToleratesAbsence();
    testDetachedDriverStaysDirty();
    return 0;
}
