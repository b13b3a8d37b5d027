// Loaded Caves of Qud blueprint data plus the property and tile queries over it.
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../engine/blueprint/Dataset.h"
#include "../engine/core/Config.h"
#include "../engine/core/Diagnostics.h"
#include "../engine/props/PropertyRegistry.h"
#include "../engine/props/PropertyResolver.h"
#include "../engine/render/GlyphSource.h"
#include "../engine/render/Palette.h"
#include "../engine/render/TileCompositor.h"

namespace Qud {

using Codex::Blueprints::BlueprintNode;

class ObjectCodex {
    // Only load() can create one.
    struct ConstructTag {};

public:
    // Repairs, parses and links every source. glyphs may be null, in which case images are
    // read through SDL_image from config.textureRoot.
    static std::unique_ptr<ObjectCodex> load(const std::vector<Codex::Blueprints::SourceFile>& sources,
                                             const std::string& version,
                                             const Codex::CodexConfig& config,
                                             Codex::Render::GlyphSource* glyphs,
                                             Codex::LoadError& error);

    ObjectCodex(ConstructTag, Codex::Blueprints::Dataset dataset, Codex::CodexConfig config);
    ObjectCodex(const ObjectCodex&) = delete;
    ObjectCodex& operator=(const ObjectCodex&) = delete;

    const BlueprintNode& root() const { return dataset_.tree.root(); }
    const Codex::Blueprints::CharacterIndex& index() const { return dataset_.tree.index(); }
    const Codex::Blueprints::BlueprintTree& tree() const { return dataset_.tree; }
    const BlueprintNode* find(const std::string& id) const { return index().find(id); }
    const std::string& version() const { return dataset_.version; }
    const Codex::Blueprints::RepairTotals& repairs() const { return dataset_.repairs; }

    Codex::Props::PropertyResult resolve(const std::string& id, const std::string& property) const;
    Codex::Props::PropertyResult resolve(const BlueprintNode& node, const std::string& property) const;
    const Codex::Props::PropertyRegistry& properties() const { return registry_; }

    // Nullopt for blueprints that never render (no tile, or a BaseObject).
    std::optional<Codex::Render::RenderAttributes> renderAttributes(const BlueprintNode& node) const;
    std::optional<Codex::Render::PixelBuffer> render(const BlueprintNode& node) const;
    std::optional<Codex::Render::PixelBuffer> renderBig(const BlueprintNode& node) const;
    static std::optional<std::vector<std::uint8_t>> encodePng(const Codex::Render::PixelBuffer& image);

    const Codex::DiagnosticLog& diagnostics() const { return diagnostics_; }
    const Codex::CodexConfig& config() const { return config_; }
    const Codex::Props::PropertyResolver& resolver() const { return *resolver_; }

private:
    Codex::Blueprints::Dataset dataset_;
    Codex::CodexConfig config_;
    Codex::Props::PropertyRegistry registry_;
    mutable Codex::DiagnosticLog diagnostics_;
    Codex::Render::Palette palette_;
    std::unique_ptr<Codex::Render::GlyphSource> ownedGlyphs_;
    std::unique_ptr<Codex::Props::PropertyResolver> resolver_;
    std::unique_ptr<Codex::Render::TileCompositor> compositor_;
};

}  // namespace Qud
