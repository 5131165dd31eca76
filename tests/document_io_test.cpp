#include "../fmt/fmt.hpp"
#include "../core/config.hpp"
#include "../core/ops/session.hpp"
#include "../memory/document.hpp"

#include <cassert>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

using namespace cskit::core;
using cskit::host::memory::MemoryDocument;
namespace fmt = cskit::fmt;

namespace {

void addShapes(MemoryDocument& doc) {
    for (const char* name : {"A", "B", "AB", "Other"}) doc.addShapeKey(name);
}

bool throwsRuntime(const std::string& json, MemoryDocument& doc) {
    try {
        fmt::inLoadManagerFromMemory(json, doc.context());
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

std::shared_ptr<model::Manager> buildManager(MemoryDocument& doc) {
    auto manager = std::make_shared<model::Manager>(doc.context(), EngineConfig{});
    auto target = manager->addTarget("AB");
    target->setActivationMode(synth::ActivationMode::Average);
    target->setGoal(1.5);
    target->setRadius(0.4);
    target->setClamp(false);
    target->editFalloff([](curve::FalloffCurve& c) {
        c.insertPoint(0.3, 0.7);
        c.setHandleType(1, curve::FalloffHandle::Vector);
    });

    auto d0 = target->addDriver("Shapes");
    auto v0 = d0->newVariable();
    v0->setTarget(0, host::ShapeKeyRef{"Body", "A"});
    v0->setPoseValue(0.1 + 0.2);
    d0->setPrecision(17);

    auto d1 = target->addDriver("Arm");
    d1->setMetricKind(metric::MetricKind::Quaternion);
    for (int i = 0; i < 4; ++i) {
        auto v = d1->newVariable();
        v->setKind(model::VariableKind::Transforms);
        v->setTarget(0, host::TransformRef{"Rig", "upper_arm", static_cast<host::TransformType>(
                                               static_cast<int>(host::TransformType::RotW) + i),
                                           host::RotationMode::Quaternion, host::TransformSpace::Local});
    }

    auto d2 = target->addDriver("Gap");
    auto v2 = d2->newVariable();
    v2->setKind(model::VariableKind::RotationDiff);
    v2->setTarget(0, host::ObjectRef{"Rig", "hand", host::TransformSpace::World});
    v2->setTarget(1, host::ObjectRef{"Prop", "", host::TransformSpace::Transform});
    v2->setRestValue(-0.25);
    v2->showExpanded = true;

    auto v3 = d2->newVariable();
    v3->setKind(model::VariableKind::SingleProp);
    v3->setTarget(0, host::PropertyRef{host::IdType::Light, "Lamp", "energy"});

    target->removeDriver(0);
    target->activeDriverIndex = 1;

    manager->addTarget("Other");
    manager->setActiveIndex(1);
    return manager;
}

void testManagerRoundTrip() {
    MemoryDocument source("Body");
    addShapes(source);
    auto original = buildManager(source);
    const std::string json = fmt::inToJson(*original);

    MemoryDocument copy("Body");
    addShapes(copy);
    auto loaded = fmt::inLoadManagerFromMemory(json, copy.context());
    assert(copy.channels().empty());

    assert(loaded->size() == 2);
    assert(loaded->activeIndex() == 1);
    auto t = loaded->targets()[0];
    auto o = original->targets()[0];
    assert(t->name() == "AB");
    assert(t->identifier() == o->identifier());
    assert(t->activationMode() == synth::ActivationMode::Average);
    assert(t->goal() == 1.5);
    assert(t->radius() == 0.4);
    assert(!t->clamp());
    assert(t->falloff() == o->falloff());
    assert(t->activeDriverIndex == 1);
    assert(t->drivers().size() == 2);
    assert(t->slots() == o->slots());
    assert(t->drivers()[0]->arrayIndex() == 1);
    assert(t->drivers()[0]->dataPath() == o->drivers()[0]->dataPath());
    assert(t->drivers()[0]->metricKind() == metric::MetricKind::Quaternion);

    const auto& gap = t->drivers()[1];
    assert(gap->name() == "Gap");
    assert(gap->variables().size() == 2);
    const auto diff = gap->variables()[0]->state();
    assert(diff.kind == model::VariableKind::RotationDiff);
    assert(diff.restValue == -0.25);
    assert(diff.showExpanded);
    assert(diff.targets == o->drivers()[1]->variables()[0]->targets());
    assert(gap->variables()[1]->targets() == o->drivers()[1]->variables()[1]->targets());

    // Synthesizing the loaded document reproduces the original channels.
    loaded->updateAll();
    assert(copy.channels() == source.channels());
    assert(fmt::inToJson(*loaded) == json);
}

void testPrecisionSurvivesSave() {
    MemoryDocument doc("Body");
    addShapes(doc);
    auto manager = std::make_shared<model::Manager>(doc.context(), EngineConfig{});
    auto driver = manager->addTarget("AB")->addDriver();
    auto v = driver->newVariable();
    v->setPoseValue(0.1 + 0.2);
    driver->setPrecision(17);

    const auto path = std::filesystem::temp_directory_path() / "cskit_document_io_test.json";
    fmt::inSaveManager(*manager, path.string());
    MemoryDocument other("Body");
    addShapes(other);
    auto loaded = fmt::inLoadManager(path.string(), other.context());
    std::remove(path.string().c_str());

    const auto& d = loaded->targets()[0]->drivers()[0];
    assert(d->precision() == 17);
    assert(d->variables()[0]->poseValue() == 0.1 + 0.2);
    assert(d->expression() == driver->expression());

    bool threw = false;
    try {
        fmt::inLoadManager(path.string(), other.context());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void testRejectsBadDocuments() {
    MemoryDocument doc("Body");
    assert(throwsRuntime("{ not json", doc));
    assert(throwsRuntime(R"({"targets": [{"name": "AB"}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "x", "activation_mode": "SOMETIMES"}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "x"}, {"identifier": "x"}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "x", "drivers": [
        {"name": "a", "array_index": "0"}, {"name": "b", "array_index": "0"}]}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "x", "drivers": [{"type": "MANHATTAN"}]}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "abc", "drivers": [{"array_index": "-1"}]}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "abc", "drivers": [
        {"array_index": "0", "data_path": "[\"csk_other\"]"}]}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "x", "drivers": [{"variables": [
        {"name": "v", "type": "SHAPEKEY", "targets": [{"type": "OBJECT", "object": "Rig"}]}]}]}]})", doc));
    assert(throwsRuntime(R"({"targets": [{"identifier": "x", "falloff": {"points": [{"x": "0", "y": "0"}]}}]})", doc));

    auto ok = fmt::inLoadManagerFromMemory(R"({"targets": [{"identifier": "x", "drivers": [
        {"name": "a", "precision": "99", "variables": [{"name": "v", "type": "LOC_DIFF"}]}]}]})", doc.context());
    const auto& d = ok->targets()[0]->drivers()[0];
    assert(d->precision() == kMaxPrecision);
    assert(d->variables()[0]->targets().size() == 2);
}

void testConfigLoading() {
    const EngineConfig defaults;
    assert(defaults.defaultPrecision == 6);
    assert(defaults.variableName == "var");

    EngineConfig config = loadConfigFromString(R"({"precision": 40, "metric": "EUCLIDEAN",
        "activation_mode": "MAX", "goal": 20, "radius": 0.5, "variable_name": "v", "pose_value": 0.5})");
    assert(config.defaultPrecision == kMaxPrecision);
    assert(config.defaultMetric == metric::MetricKind::Euclidean);
    assert(config.defaultActivationMode == synth::ActivationMode::Max);
    assert(config.defaultGoal == kMaxGoal);
    assert(config.defaultRadius == 0.5);
    assert(config.defaultClamp);
    assert(config.variableName == "v");
    assert(config.driverName == "Driver");
    assert(config.defaultPoseValue == 0.5);

    MemoryDocument doc("Body");
    addShapes(doc);
    auto manager = std::make_shared<model::Manager>(doc.context(), config);
    auto target = manager->addTarget("AB");
    assert(target->activationMode() == synth::ActivationMode::Max);
    assert(target->radius() == 0.5);
    auto driver = target->addDriver();
    auto v = driver->newVariable();
    assert(driver->metricKind() == metric::MetricKind::Euclidean);
    assert(driver->precision() == kMaxPrecision);
    assert(v->name() == "v0");
    assert(v->poseValue() == 0.5);

    const EngineConfig reread = loadConfigFromString(fmt::inToJson(config));
    assert(reread.defaultMetric == config.defaultMetric);
    assert(reread.defaultGoal == config.defaultGoal);
    assert(reread.variableName == config.variableName);

    auto rejects = [](const std::string& json) {
        try {
            loadConfigFromString(json);
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    assert(rejects(R"({"metric": "CHEBYSHEV"})"));
    assert(rejects(R"({"variable_name": ""})"));
    assert(rejects(R"({"variable_name": "9"})"));
    assert(rejects(R"({"variable_name": "my var"})"));

    // A hand-built config cannot smuggle a numeric name into an expression.
    EngineConfig numeric;
    numeric.variableName = "9";
    auto guarded = std::make_shared<model::Manager>(doc.context(), numeric);
    auto guardedDriver = guarded->addTarget("A")->addDriver();
    bool refused = false;
    try {
        guardedDriver->newVariable();
    } catch (const std::invalid_argument&) {
        refused = true;
    }
    assert(refused);
    assert(guardedDriver->variables().empty());
    assert(rejects("nope"));

    bool threw = false;
    try {
        loadConfig("/nonexistent/cskit.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void testClipboardSerialization() {
    ops::VariableClipboard clipboard;
    model::VariableState state;
    state.name = "x";
    state.kind = model::VariableKind::Transforms;
    state.targets = {host::TransformRef{"Rig", "arm", host::TransformType::RotX, host::RotationMode::SwingTwistY,
                                        host::TransformSpace::Local}};
    state.poseValue = 0.625;
    clipboard.store({state});

    ops::VariableClipboard restored;
    assert(!fmt::inFromJson(restored, fmt::inToJson(clipboard)));
    assert(restored.items().size() == 1);
    assert(restored.items()[0].name == "x");
    assert(restored.items()[0].targets == state.targets);
    assert(restored.items()[0].poseValue == 0.625);

    ops::CurveClipboard curves;
    curves.store(curve::FalloffCurve(curve::FalloffPreset::Smooth));
    ops::CurveClipboard back;
    assert(!fmt::inFromJson(back, fmt::inToJson(curves)));
    assert(back.curve() == curves.curve());
    assert(fmt::inFromJson(back, "{ broken"));
}

} // namespace

int main() {
    testManagerRoundTrip();
    testPrecisionSurvivesSave();
    testRejectsBadDocuments();
    testConfigLoading();
    testClipboardSerialization();
    return 0;
}
