#pragma once
#include <cstddef>
#include <string>
#include <vector>

/** \file elicit/types.hpp basic types
 *
 * This header defines the basic constants shared by the whole library: the number of preference
 * dimensions and their canonical names.
 */

namespace elicit {

/** std::size_t alias primarily for internal elicit use. */
using size_t = std::size_t;

/** The number of preference dimensions of the canonical model.  Feature vectors produced by
 * encode_features() always have this many elements.
 */
constexpr unsigned int NUM_DIMENSIONS = 7;

/** The canonical preference dimensions, in feature-vector order.  The underlying values may be
 * used directly as indices into feature and weight vectors.
 */
enum class Dimension : unsigned int {
    financial = 0,
    work_environment = 1,
    career_growth = 2,
    work_life_balance = 3,
    job_security = 4,
    task_preference = 5,
    values_culture = 6
};

/** Returns the canonical dimension names, in feature-vector order:
 * financial, work_environment, career_growth, work_life_balance, job_security, task_preference,
 * values_culture.
 */
inline const std::vector<std::string>& dimension_names() {
    static const std::vector<std::string> names{
        "financial", "work_environment", "career_growth", "work_life_balance",
        "job_security", "task_preference", "values_culture"};
    return names;
}

/// Returns the canonical name of the given dimension.
inline const std::string& dimension_name(Dimension d) {
    return dimension_names()[static_cast<unsigned int>(d)];
}

}
