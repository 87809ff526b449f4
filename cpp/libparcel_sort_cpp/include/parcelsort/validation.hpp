/**
 * @file validation.hpp
 * @brief Optional input checks in front of the classifier.
 *
 * The classifier accepts any double. These helpers reject measurements
 * that can not describe a real package (negative, NaN or infinite) with
 * ErrorCode::kInvalidInput before classification runs. Zero is accepted.
 */
#pragma once

#include "parcelsort/category.hpp"
#include "parcelsort/package.hpp"
#include "parcelsort/result.hpp"

namespace parcelsort {

/**
 * @brief Check that every measurement is finite and non-negative.
 * @return Result<void> with kInvalidInput naming the first bad field.
 */
Result<void> ValidatePackage(const Package& package);

/**
 * @brief ValidatePackage() followed by Classify().
 * @return The category, or the validation error.
 */
Result<Category> ClassifyChecked(const Package& package);

}  // namespace parcelsort
