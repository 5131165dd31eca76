#pragma once

#include "driver.hpp"
#include "../config.hpp"
#include "../curve/falloff_curve.hpp"
#include "../host/host_context.hpp"
#include "../serde.hpp"
#include "../synth/combination.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cskit::core::model {

class Manager;

/**
 * One combination shape key.
 *
 * The target combines the weights of its drivers, each read from the mesh
 * array `csk_<identifier>`, and eases the result through its falloff curve
 * onto the shape key named `name`. While the name does not match an existing
 * shape key the target is invalid and synthesis does nothing.
 */
class Target : public std::enable_shared_from_this<Target> {
public:
    Target(std::weak_ptr<Manager> owner, std::string identifier, const EngineConfig& config);

    const std::string& name() const { return name_; }
    // Drops the channel bound to the previous shape key, then updates.
    void setName(const std::string& name);
    const std::string& identifier() const { return identifier_; }

    synth::ActivationMode activationMode() const { return activationMode_; }
    void setActivationMode(synth::ActivationMode mode);
    double goal() const { return goal_; }
    void setGoal(double goal);
    double radius() const { return radius_; }
    void setRadius(double radius);
    bool clamp() const { return clamp_; }
    void setClamp(bool clamp);
    bool mute() const { return mute_; }
    void setMute(bool mute);

    const curve::FalloffCurve& falloff() const { return falloff_; }
    // Applies `edit` to the falloff and re-synthesizes the target curve.
    void editFalloff(const std::function<void(curve::FalloffCurve&)>& edit);

    const std::vector<std::shared_ptr<Driver>>& drivers() const { return drivers_; }
    std::shared_ptr<Driver> findDriver(const std::string& name) const;
    std::shared_ptr<Driver> activeDriver() const;
    std::size_t activeDriverIndex{0};

    // New driver in the lowest free array slot. The array is rewritten and the
    // target re-synthesized; the driver itself is left for the caller to fill.
    std::shared_ptr<Driver> addDriver(const std::string& name = {});
    // Throws std::out_of_range; releases the driver's channel.
    void removeDriver(std::size_t index);
    void moveDriver(std::size_t from, std::size_t to);

    std::shared_ptr<Manager> manager() const { return owner_.lock(); }
    const host::HostContext* host() const;

    std::string arrayName() const { return "csk_" + identifier_; }
    std::string dataPath() const;
    host::ChannelAddress channelAddress() const;
    std::vector<int> slots() const;
    bool isValid() const;

    curve::KeyframeCurve activationCurve() const;
    host::ScriptedDriver combinationDriver() const;

    void fcurveUpdate();
    void driverUpdate();
    void update();
    // Rewrites the private array wholesale with one zeroed slot per used index.
    void resizeArray();
    // Removes every channel and the private array owned by this target.
    void releaseChannels();

    SyncState syncState() const { return sync_; }

    void serialize(serde::Serializer& serializer) const;
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);

private:
    std::weak_ptr<Manager> owner_{};
    EngineConfig config_{};
    std::string name_{};
    std::string identifier_{};
    synth::ActivationMode activationMode_{synth::ActivationMode::Multiply};
    double goal_{1.0};
    double radius_{1.0};
    bool clamp_{true};
    bool mute_{false};
    curve::FalloffCurve falloff_{};
    std::vector<std::shared_ptr<Driver>> drivers_{};
    SyncState sync_{SyncState::Dirty};
};

} // namespace cskit::core::model
