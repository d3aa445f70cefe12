#include "videoml/adapters/adapter.h"

#include <spdlog/spdlog.h>

#include "videoml/core/errors.h"

namespace videoml {

namespace {

// Iterate in reverse so last-registered adapters take priority
template <typename Ptr>
auto* find_named(const std::vector<Ptr>& adapters, const std::string& name) {
    using T = typename Ptr::element_type;
    for (auto it = adapters.rbegin(); it != adapters.rend(); ++it) {
        if (name.empty() || (*it)->name() == name) return static_cast<T*>(it->get());
    }
    return static_cast<T*>(nullptr);
}

template <typename T>
T& require(T* adapter, const char* kind) {
    if (!adapter) {
        throw CollaboratorError(kind, "no adapter registered");
    }
    return *adapter;
}

}  // namespace

AdapterManager& AdapterManager::instance() {
    static AdapterManager mgr;
    return mgr;
}

void AdapterManager::register_loader(CompositionLoaderPtr loader) {
    spdlog::debug("Registered loader: {}", loader->name());
    loaders_.push_back(std::move(loader));
}

void AdapterManager::register_generator(CompositionGeneratorPtr generator) {
    spdlog::debug("Registered generator: {}", generator->name());
    generators_.push_back(std::move(generator));
}

void AdapterManager::register_renderer(FrameRendererPtr renderer) {
    spdlog::debug("Registered renderer: {}", renderer->name());
    renderers_.push_back(std::move(renderer));
}

void AdapterManager::register_encoder(VideoEncoderPtr encoder) {
    spdlog::debug("Registered encoder: {}", encoder->name());
    encoders_.push_back(std::move(encoder));
}

CompositionLoader* AdapterManager::find_loader(const std::string& name) const {
    return find_named(loaders_, name);
}

CompositionGenerator* AdapterManager::find_generator(const std::string& name) const {
    return find_named(generators_, name);
}

FrameRenderer* AdapterManager::find_renderer(const std::string& name) const {
    return find_named(renderers_, name);
}

VideoEncoder* AdapterManager::find_encoder(const std::string& name) const {
    return find_named(encoders_, name);
}

CompositionLoader& AdapterManager::loader() const {
    return require(find_loader(), "loader");
}

CompositionGenerator& AdapterManager::generator() const {
    return require(find_generator(), "generator");
}

FrameRenderer& AdapterManager::renderer() const {
    return require(find_renderer(), "renderer");
}

VideoEncoder& AdapterManager::encoder() const {
    return require(find_encoder(), "encoder");
}

std::vector<std::string> AdapterManager::list_adapters() const {
    std::vector<std::string> names;
    for (const auto& a : loaders_)    names.push_back("loader:" + a->name());
    for (const auto& a : generators_) names.push_back("generator:" + a->name());
    for (const auto& a : renderers_)  names.push_back("renderer:" + a->name());
    for (const auto& a : encoders_)   names.push_back("encoder:" + a->name());
    return names;
}

void AdapterManager::reset() {
    loaders_.clear();
    generators_.clear();
    renderers_.clear();
    encoders_.clear();
}

}  // namespace videoml
