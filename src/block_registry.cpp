#include "block_registry.h"
#include "chunk_data.h"
#include "logger.h"
#include <algorithm>
#include <cctype>

namespace {

std::string normalizeName(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

BlockRegistry::BlockRegistry() {
    registerBlock(BlockDefinition{BlockID::AIR, "air", false, 0});
}

BlockRegistry BlockRegistry::withDefaults() {
    BlockRegistry registry;
    registry.registerBlock(BlockDefinition{1, "stone", true, 0});
    registry.registerBlock(BlockDefinition{2, "dirt", true, 0});
    registry.registerBlock(BlockDefinition{3, "grass", true, 0});
    registry.registerBlock(BlockDefinition{4, "glass", false, 0});
    registry.registerBlock(BlockDefinition{5, "water", false, 0});
    registry.registerBlock(BlockDefinition{6, "torch", false, 14});
    registry.registerBlock(BlockDefinition{7, "glowstone", true, 15});
    return registry;
}

bool BlockRegistry::loadFromFile(const std::string& filepath) {
    try {
        YAML::Node doc = YAML::LoadFile(filepath);
        return loadDocument(doc, filepath);
    } catch (const YAML::Exception& e) {
        Logger::error() << "YAML parsing error in " << filepath << ": " << e.what();
        return false;
    }
}

bool BlockRegistry::loadFromString(const std::string& yamlText) {
    try {
        YAML::Node doc = YAML::Load(yamlText);
        return loadDocument(doc, "<string>");
    } catch (const YAML::Exception& e) {
        Logger::error() << "YAML parsing error in block definitions: " << e.what();
        return false;
    }
}

bool BlockRegistry::loadDocument(const YAML::Node& doc, const std::string& source) {
    const YAML::Node blocks = doc["blocks"];
    if (!blocks || !blocks.IsSequence()) {
        Logger::error() << "Missing 'blocks' list in: " << source;
        return false;
    }

    bool allValid = true;
    size_t loaded = 0;
    for (const YAML::Node& node : blocks) {
        BlockDefinition definition;
        if (!parseDefinition(node, source, definition)) {
            allValid = false;
            continue;
        }
        registerBlock(definition);
        ++loaded;
    }

    Logger::info() << "Loaded " << loaded << " block definition(s) from " << source;
    return allValid;
}

bool BlockRegistry::parseDefinition(const YAML::Node& node, const std::string& source, BlockDefinition& out) {
    try {
        // ===== REQUIRED FIELDS =====
        if (!node["id"]) {
            Logger::error() << "Block entry without 'id' in: " << source;
            return false;
        }
        out.id = node["id"].as<int>();
        if (out.id < 0 || out.id > 0xFFFF) {
            Logger::error() << "Block id " << out.id << " out of range in: " << source;
            return false;
        }

        if (!node["name"]) {
            Logger::error() << "Block " << out.id << " missing 'name' in: " << source;
            return false;
        }
        out.name = normalizeName(node["name"].as<std::string>());

        // ===== OPTIONAL FIELDS =====
        out.opaque = node["opaque"] ? node["opaque"].as<bool>() : true;

        int emission = node["light_emission"] ? node["light_emission"].as<int>() : 0;
        if (emission < 0 || emission > 15) {
            Logger::warning() << "Block '" << out.name << "' light_emission " << emission
                              << " clamped to 0-15";
            emission = std::clamp(emission, 0, 15);
        }
        out.lightEmission = static_cast<uint8_t>(emission);
        return true;

    } catch (const YAML::Exception& e) {
        Logger::error() << "Invalid block entry in " << source << ": " << e.what();
        return false;
    }
}

void BlockRegistry::registerBlock(const BlockDefinition& definition) {
    auto existing = m_blocks.find(definition.id);
    if (existing != m_blocks.end()) {
        m_nameToId.erase(existing->second.name);
    }
    m_blocks[definition.id] = definition;
    m_nameToId[definition.name] = definition.id;
}

const BlockDefinition* BlockRegistry::get(int id) const {
    auto it = m_blocks.find(id);
    return it != m_blocks.end() ? &it->second : nullptr;
}

int BlockRegistry::idForName(const std::string& name) const {
    auto it = m_nameToId.find(normalizeName(name));
    return it != m_nameToId.end() ? it->second : -1;
}

bool BlockRegistry::affectsLight(int id) const {
    const BlockDefinition* definition = get(id);
    return definition ? definition->affectsLight() : true;
}

bool BlockRegistry::isOpaque(int id) const {
    const BlockDefinition* definition = get(id);
    return definition ? definition->opaque : true;
}

uint8_t BlockRegistry::lightEmission(int id) const {
    const BlockDefinition* definition = get(id);
    return definition ? definition->lightEmission : 0;
}
