#ifndef STATKIT_CATALOGUE_HPP
#define STATKIT_CATALOGUE_HPP

/**
 * @file catalogue.hpp
 * @brief Versioned list of the functions the library exposes
 *
 * The catalogue is the single source of truth for the public surface: the
 * Python module builds its __all__ from it and checks at import time that
 * every listed name is bound.
 */

#include <optional>
#include <string>
#include <vector>

namespace statkit::api {

/// Version of the exposed function set
constexpr const char* kApiVersion = "1.0.0";

enum class Category {
    Accumulator,
    Descriptive,
    Robust,
    Rolling,
    Pairwise,
    Transform,
    Inference,
    Configuration
};

/**
 * @brief One exposed function
 */
struct FunctionEntry {
    std::string name;     ///< Exported name
    Category category;    ///< Component it belongs to
    std::string summary;  ///< One-line description

    std::string to_string() const;
};

/// All exposed functions, grouped by category in declaration order
const std::vector<FunctionEntry>& function_catalogue();

/// Look up an entry by exported name
std::optional<FunctionEntry> find_function(const std::string& name);

/// Lowercase category name ("rolling", "inference", ...)
std::string category_name(Category category);

/// Names of every catalogued function, in catalogue order
std::vector<std::string> exported_names();

} // namespace statkit::api

#endif // STATKIT_CATALOGUE_HPP
