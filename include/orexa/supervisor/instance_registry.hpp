// Orexa - Game Server Supervisor
// Instance registry persistence
//
// Stores every instance configuration as one ordered JSON array in
// <baseDir>/data/servers.json. Writes go to a temporary file first and are
// renamed over the registry so a crash never leaves a truncated file.

#ifndef OREXA_SUPERVISOR_INSTANCE_REGISTRY_HPP
#define OREXA_SUPERVISOR_INSTANCE_REGISTRY_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/supervisor/instance_config.hpp"

#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

/**
 * @brief Loads and atomically rewrites the registry file.
 *
 * ## Thread Safety
 * Not synchronized. Callers hold the registry write lock while saving so
 * two snapshots never race on the temporary file.
 */
class InstanceRegistry {
public:
    explicit InstanceRegistry(std::string filePath);

    /**
     * @brief Read all configurations in file order.
     *
     * A missing file is an empty registry.
     */
    core::Result<std::vector<InstanceConfig>, core::Error> load() const;

    /**
     * @brief Replace the registry contents (write-temp-then-rename).
     */
    core::Result<void, core::Error> save(const std::vector<InstanceConfig>& configs) const;

    const std::string& filePath() const { return filePath_; }

private:
    std::string filePath_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_INSTANCE_REGISTRY_HPP
