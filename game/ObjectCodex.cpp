#include "ObjectCodex.h"

#include <string>
#include <utility>

#include "../engine/core/Logger.h"
#include "../engine/render/PngEncoder.h"
#include "../engine/render/SDLGlyphSource.h"
#include "catalog/ObjectProps.h"
#include "catalog/RenderProps.h"

namespace Qud {

using Codex::Props::PropertyResult;
using Codex::Render::PixelBuffer;
using Codex::Render::RenderAttributes;

ObjectCodex::ObjectCodex(ConstructTag, Codex::Blueprints::Dataset dataset, Codex::CodexConfig config)
    : dataset_(std::move(dataset)), config_(std::move(config)), palette_(Codex::Render::Palette::builtIn()) {}

std::unique_ptr<ObjectCodex> ObjectCodex::load(const std::vector<Codex::Blueprints::SourceFile>& sources,
                                               const std::string& version,
                                               const Codex::CodexConfig& config,
                                               Codex::Render::GlyphSource* glyphs,
                                               Codex::LoadError& error) {
    Codex::Logger::setMinLevel(config.logLevel);

    auto dataset = Codex::Blueprints::loadDataset(sources, version, error);
    if (!dataset) {
        Codex::logError("Blueprint load failed: " + error.describe());
        return nullptr;
    }

    auto codex = std::make_unique<ObjectCodex>(ConstructTag{}, std::move(*dataset), config);
    for (const auto& [code, color] : codex->config_.palette) {
        codex->palette_.set(code, color);
    }
    Catalog::registerObjectProps(codex->registry_);

    Codex::Render::GlyphSource* source = glyphs;
    if (!source) {
        codex->ownedGlyphs_ = std::make_unique<Codex::Render::SDLGlyphSource>(codex->config_.textureRoot);
        source = codex->ownedGlyphs_.get();
    }
    codex->resolver_ = std::make_unique<Codex::Props::PropertyResolver>(codex->dataset_.tree, codex->registry_,
                                                                        codex->config_, codex->diagnostics_);
    codex->compositor_ = std::make_unique<Codex::Render::TileCompositor>(*source, codex->palette_, codex->config_,
                                                                         codex->diagnostics_);

    Codex::logInfo("Object codex ready: " + std::to_string(codex->index().size()) + " blueprints, " +
                   std::to_string(codex->registry_.size()) + " properties, version " +
                   (version.empty() ? std::string("unknown") : version));
    return codex;
}

PropertyResult ObjectCodex::resolve(const std::string& id, const std::string& property) const {
    return resolver_->resolve(id, property);
}

PropertyResult ObjectCodex::resolve(const BlueprintNode& node, const std::string& property) const {
    return resolver_->resolve(node, property);
}

std::optional<RenderAttributes> ObjectCodex::renderAttributes(const BlueprintNode& node) const {
    return Catalog::renderAttributesFor(resolver_->fragments(node), node.id());
}

std::optional<PixelBuffer> ObjectCodex::render(const BlueprintNode& node) const {
    auto attrs = renderAttributes(node);
    if (!attrs) return std::nullopt;
    return compositor_->composite(*attrs, node.id());
}

std::optional<PixelBuffer> ObjectCodex::renderBig(const BlueprintNode& node) const {
    auto attrs = renderAttributes(node);
    if (!attrs) return std::nullopt;
    return compositor_->compositeBig(*attrs, node.id());
}

std::optional<std::vector<std::uint8_t>> ObjectCodex::encodePng(const PixelBuffer& image) {
    return Codex::Render::PngEncoder::encode(image);
}

}  // namespace Qud
