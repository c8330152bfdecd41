/**
 * @file block_registry.h
 * @brief Light-relevant block properties loaded from YAML
 *
 * The scheduler only needs to know whether changing a block can change how
 * light propagates, so a definition carries just opacity and emission.
 *
 * Example YAML:
 * @code
 * blocks:
 *   - id: 1
 *     name: "stone"
 *     opaque: true
 *   - id: 7
 *     name: "torch"
 *     opaque: false
 *     light_emission: 14
 * @endcode
 */

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

struct BlockDefinition {
    int id = -1;                 ///< Unique block ID
    std::string name;            ///< Block name (e.g., "stone", "torch")
    bool opaque = true;          ///< Blocks light from passing through
    uint8_t lightEmission = 0;   ///< Emitted light level (0-15)

    /// Changing this block can change the light field around it
    bool affectsLight() const { return opaque || lightEmission > 0; }
};

class BlockRegistry {
public:
    /// Registry containing only air
    BlockRegistry();

    /// air, stone, dirt, grass, glass, water, torch, glowstone
    static BlockRegistry withDefaults();

    /**
     * @brief Loads definitions from a YAML file with a top-level "blocks" list
     * @return True if the file parsed and every entry was valid
     */
    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& yamlText);

    /// Adds or replaces a definition
    void registerBlock(const BlockDefinition& definition);

    /// nullptr if @p id is unknown
    const BlockDefinition* get(int id) const;

    int idForName(const std::string& name) const;

    /// Unknown ids are treated as opaque, non-emissive blocks
    bool affectsLight(int id) const;
    bool isOpaque(int id) const;
    uint8_t lightEmission(int id) const;

    size_t size() const { return m_blocks.size(); }

private:
    bool loadDocument(const YAML::Node& doc, const std::string& source);
    static bool parseDefinition(const YAML::Node& node, const std::string& source, BlockDefinition& out);

    std::unordered_map<int, BlockDefinition> m_blocks;
    std::unordered_map<std::string, int> m_nameToId;
};
