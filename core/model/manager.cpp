#include "manager.hpp"

#include "../debug_log.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <stdexcept>

namespace cskit::core::model {

std::string generateIdentifier() {
    static boost::uuids::random_generator gen;
    std::string text = boost::uuids::to_string(gen());
    text.erase(std::remove(text.begin(), text.end(), '-'), text.end());
    return text;
}

Manager::Manager(host::HostContext host, EngineConfig config) : host_(std::move(host)), config_(std::move(config)) {}

std::shared_ptr<Target> Manager::active() const {
    return activeIndex_ < targets_.size() ? targets_[activeIndex_] : nullptr;
}

void Manager::setActiveIndex(std::size_t index) {
    activeIndex_ = index;
    auto target = active();
    if (!target || !host_.shapeKeys || !target->isValid()) return;
    host_.shapeKeys->setActiveShapeKey(target->name());
}

std::shared_ptr<Target> Manager::findTarget(const std::string& name) const {
    for (const auto& t : targets_) {
        if (t->name() == name) return t;
    }
    return nullptr;
}

std::shared_ptr<Target> Manager::findByIdentifier(const std::string& identifier) const {
    for (const auto& t : targets_) {
        if (t->identifier() == identifier) return t;
    }
    return nullptr;
}

std::shared_ptr<Target> Manager::addTarget(const std::string& name, std::string identifier) {
    if (identifier.empty()) identifier = generateIdentifier();
    if (findByIdentifier(identifier)) {
        throw std::invalid_argument("Manager::addTarget: identifier '" + identifier + "' already in use");
    }
    auto target = std::make_shared<Target>(weak_from_this(), std::move(identifier), config_);
    targets_.push_back(target);
    target->resizeArray();
    target->setName(name);
    CSKIT_DBG_LOG("[cskit] mesh '%s' add target '%s' (%s)\n", host_.meshName.c_str(), name.c_str(),
                  target->identifier().c_str());
    return target;
}

void Manager::removeTarget(std::size_t index) {
    if (index >= targets_.size()) {
        throw std::out_of_range("Manager::removeTarget: index " + std::to_string(index) + " out of range 0-" +
                                std::to_string(targets_.size()));
    }
    targets_[index]->releaseChannels();
    targets_.erase(targets_.begin() + static_cast<std::ptrdiff_t>(index));
    if (activeIndex_ > 0 && activeIndex_ >= targets_.size()) setActiveIndex(targets_.size() - 1);
}

void Manager::moveTarget(std::size_t from, std::size_t to) {
    if (from >= targets_.size() || to >= targets_.size()) {
        throw std::out_of_range("Manager::moveTarget: index out of range 0-" + std::to_string(targets_.size()));
    }
    auto item = targets_[from];
    targets_.erase(targets_.begin() + static_cast<std::ptrdiff_t>(from));
    targets_.insert(targets_.begin() + static_cast<std::ptrdiff_t>(to), item);
}

void Manager::updateAll() {
    for (const auto& t : targets_) {
        t->resizeArray();
        for (const auto& d : t->drivers()) d->update();
        t->update();
    }
}

void Manager::serialize(serde::Serializer& serializer) const {
    serializer.putKey("mesh");
    serializer.putValue(host_.meshName);
    serializer.putKey("active_index");
    serializer.putValue(activeIndex_);
    std::vector<serde::Serializer> items;
    for (const auto& t : targets_) {
        serde::Serializer ts;
        t->serialize(ts);
        items.push_back(std::move(ts));
    }
    serializer.putList("targets", items);
}

serde::SerdeException Manager::deserializeFromFghj(const serde::Fghj& data) {
    std::vector<std::shared_ptr<Target>> loaded;
    std::size_t index = 0;
    try {
        if (auto v = data.get_optional<std::size_t>("active_index")) index = *v;
        if (auto list = data.get_child_optional("targets")) {
            for (const auto& item : *list) {
                auto target = std::make_shared<Target>(weak_from_this(), std::string(), config_);
                if (auto err = target->deserializeFromFghj(item.second)) return err;
                for (const auto& other : loaded) {
                    if (other->identifier() == target->identifier()) {
                        return "duplicate target identifier " + target->identifier();
                    }
                }
                loaded.push_back(target);
            }
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    targets_ = std::move(loaded);
    activeIndex_ = index;
    return std::nullopt;
}

std::shared_ptr<Manager> ManagerRegistry::ensure(const std::string& meshName, const host::HostContext& host) {
    auto it = managers_.find(meshName);
    if (it != managers_.end()) return it->second;
    host::HostContext bound = host;
    bound.meshName = meshName;
    auto manager = std::make_shared<Manager>(bound, config_);
    managers_.emplace(meshName, manager);
    return manager;
}

std::shared_ptr<Manager> ManagerRegistry::find(const std::string& meshName) const {
    auto it = managers_.find(meshName);
    return it == managers_.end() ? nullptr : it->second;
}

bool ManagerRegistry::remove(const std::string& meshName) {
    return managers_.erase(meshName) > 0;
}

} // namespace cskit::core::model
