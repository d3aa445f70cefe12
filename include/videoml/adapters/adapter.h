#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "videoml/core/types.h"

namespace videoml {

namespace fs = std::filesystem;

// ─── Composition Loader ────────────────────────────────────────────

/// Parses one source file into its composition units.
class CompositionLoader {
public:
    virtual ~CompositionLoader() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Compositions in declaration order. Throws on malformed sources.
    virtual std::vector<CompositionUnit> load(const SourcePath& source) = 0;
};

using CompositionLoaderPtr = std::unique_ptr<CompositionLoader>;

// ─── Composition Generator ─────────────────────────────────────────

/// Turns one composition into script, timeline and audio artifacts.
/// Must honor `options.fresh`; cache reuse is its own business.
class CompositionGenerator {
public:
    virtual ~CompositionGenerator() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual void generate(const GenerationRequest& request) = 0;
};

using CompositionGeneratorPtr = std::unique_ptr<CompositionGenerator>;

// ─── Frame Renderer ────────────────────────────────────────────────

/// Renders script + timeline into a numbered frame sequence in
/// `request.frames_dir`. Resolves the end frame and worker count itself
/// when the request leaves them unset.
class FrameRenderer {
public:
    virtual ~FrameRenderer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual FrameSequence render_frames(const RenderRequest& request) = 0;
};

using FrameRendererPtr = std::unique_ptr<FrameRenderer>;

// ─── Video Encoder ─────────────────────────────────────────────────

class VideoEncoder {
public:
    virtual ~VideoEncoder() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Encode the rendered frames (plus optional audio) to request.output_path.
    virtual void encode(const RenderRequest& request, const FrameSequence& frames) = 0;
};

using VideoEncoderPtr = std::unique_ptr<VideoEncoder>;

// ─── Adapter Manager ───────────────────────────────────────────────

/// Central registry for collaborator adapters. Commands look up the
/// loader, generator, renderer and encoder here.
class AdapterManager {
public:
    static AdapterManager& instance();

    // Registration
    void register_loader(CompositionLoaderPtr loader);
    void register_generator(CompositionGeneratorPtr generator);
    void register_renderer(FrameRendererPtr renderer);
    void register_encoder(VideoEncoderPtr encoder);

    // Lookup: by name, or the most recently registered when name is empty
    [[nodiscard]] CompositionLoader*    find_loader(const std::string& name = {}) const;
    [[nodiscard]] CompositionGenerator* find_generator(const std::string& name = {}) const;
    [[nodiscard]] FrameRenderer*        find_renderer(const std::string& name = {}) const;
    [[nodiscard]] VideoEncoder*         find_encoder(const std::string& name = {}) const;

    // Lookup that throws CollaboratorError when nothing is registered
    [[nodiscard]] CompositionLoader&    loader() const;
    [[nodiscard]] CompositionGenerator& generator() const;
    [[nodiscard]] FrameRenderer&        renderer() const;
    [[nodiscard]] VideoEncoder&         encoder() const;

    // Introspection
    [[nodiscard]] std::vector<std::string> list_adapters() const;

    /// Clear all registered adapters. Primarily for test isolation.
    void reset();

private:
    AdapterManager() = default;

    std::vector<CompositionLoaderPtr>       loaders_;
    std::vector<CompositionGeneratorPtr>    generators_;
    std::vector<FrameRendererPtr>           renderers_;
    std::vector<VideoEncoderPtr>            encoders_;
};

}  // namespace videoml
