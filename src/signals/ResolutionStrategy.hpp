#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace obs_sitter {

/**
 * @brief Abstract interface for locating the file that defines a constant
 *
 * Implementations map a class or module name (as written in the source,
 * e.g. "Payments::BaseService") to a Ruby file in the repository.
 */
class ResolutionStrategy {
public:
    virtual ~ResolutionStrategy() = default;

    /**
     * @brief Find the defining file of a class or module
     * @param name Constant name as written at the reference
     * @param current_file File containing the reference
     * @return Path to the defining file, or nullopt if not found
     */
    virtual std::optional<std::filesystem::path> resolve(
        const std::string& name,
        const std::filesystem::path& current_file
    ) = 0;

    /**
     * @brief Short identifier used in log output
     */
    virtual std::string_view name() const = 0;
};

} // namespace obs_sitter
